#ifndef INSTSHARE_TRANSPORT_STRATEGY_HPP
#define INSTSHARE_TRANSPORT_STRATEGY_HPP

#include "../sharing/types.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

struct TransportCapabilities {
    bool supports_password = false;
    bool requires_agent = false;   // needs a locally installed helper binary
    bool url_based = false;        // false: content-addressed identifier
};

// The three event kinds every strategy reports, whatever its mechanism.
struct TransportEvent {
    enum class Kind {
        CONNECTED,
        DOWNLOAD_PROGRESS,
        ERROR
    };

    Kind kind = Kind::CONNECTED;
    std::string share_id;
    std::string url;                     // CONNECTED
    uint32_t download_count = 0;         // DOWNLOAD_PROGRESS
    uint64_t uploaded_bytes = 0;         // DOWNLOAD_PROGRESS
    std::optional<uint32_t> peer_count;  // DOWNLOAD_PROGRESS, swarm only
    std::string message;                 // ERROR

    static TransportEvent connected(const std::string& id, const std::string& url) {
        TransportEvent e;
        e.kind = Kind::CONNECTED;
        e.share_id = id;
        e.url = url;
        return e;
    }
    static TransportEvent progress(const std::string& id, uint32_t count, uint64_t bytes,
                                   std::optional<uint32_t> peers = std::nullopt) {
        TransportEvent e;
        e.kind = Kind::DOWNLOAD_PROGRESS;
        e.share_id = id;
        e.download_count = count;
        e.uploaded_bytes = bytes;
        e.peer_count = peers;
        return e;
    }
    static TransportEvent error(const std::string& id, const std::string& message) {
        TransportEvent e;
        e.kind = Kind::ERROR;
        e.share_id = id;
        e.message = message;
        return e;
    }
};

using TransportSink = std::function<void(const TransportEvent&)>;

struct ShareRequest {
    std::string share_id;
    std::string export_id;
    std::filesystem::path package_path;
    uint64_t package_bytes = 0;
    std::string instance_name;
    std::optional<std::string> password_hash;
    std::optional<std::string> password_salt;
};

/**
 * @brief One way of exposing an artifact to remote importers.
 *
 * start() may return before the exposure is reachable; the URL or identifier
 * arrives later as a CONNECTED event through the sink. Sinks may be invoked
 * from any thread, including from inside start().
 */
class TransportStrategy {
public:
    virtual ~TransportStrategy() = default;

    virtual ShareProvider provider() const = 0;
    virtual TransportCapabilities capabilities() const = 0;

    // Throws SharingError(PROVISIONING) when the exposure cannot be set up.
    virtual void start(const ShareRequest& request, TransportSink sink) = 0;

    // Tears down one exposure. Unknown ids are ignored.
    virtual void stop(const std::string& share_id) = 0;

    // Tears down every exposure, used at process exit.
    virtual void shutdown() = 0;
};

#endif // INSTSHARE_TRANSPORT_STRATEGY_HPP
