#ifndef INSTSHARE_SHARE_REGISTRY_HPP
#define INSTSHARE_SHARE_REGISTRY_HPP

#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct ShareRecord {
    ActiveShare share;
    std::string export_id;
    ShareStatus status = ShareStatus::CONNECTING;
    std::optional<std::string> error;
};

/**
 * @brief Process-wide table of the shares currently exposed.
 *
 * Every mutation is serialized. Updates for an id that is no longer present
 * return false and change nothing, so a stop always wins over a late
 * connect or statistics event.
 */
class ShareRegistry {
public:
    void insert(ShareRecord record);
    std::optional<ShareRecord> remove(const std::string& share_id);

    bool apply_connected(const std::string& share_id, const std::string& url);
    bool apply_status(const std::string& share_id, ShareStatus status,
                      const std::optional<std::string>& error = std::nullopt);
    bool apply_download_stats(const std::string& share_id, uint32_t download_count, uint64_t uploaded_bytes);

    std::optional<ShareRecord> get(const std::string& share_id) const;
    std::vector<ShareRecord> list() const;
    std::vector<std::string> ids() const;
    bool contains(const std::string& share_id) const;
    size_t size() const;

    // Seed sessions, keyed by export_id. Display cache only.
    void put_seed_session(const SeedSession& session);
    void update_seed_session(const std::string& export_id, uint32_t peer_count, uint64_t uploaded_bytes);
    void remove_seed_session(const std::string& export_id);
    std::optional<SeedSession> seed_session(const std::string& export_id) const;
    std::vector<SeedSession> seed_sessions() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ShareRecord> shares_;
    std::map<std::string, SeedSession> seed_sessions_;
};

#endif // INSTSHARE_SHARE_REGISTRY_HPP
