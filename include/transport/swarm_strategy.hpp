#ifndef INSTSHARE_SWARM_STRATEGY_HPP
#define INSTSHARE_SWARM_STRATEGY_HPP

#include "transport_strategy.hpp"
#include "../common/config.hpp"
#include "../swarm/magnet.hpp"
#include "../swarm/port_mapper.hpp"
#include "../swarm/seeder.hpp"
#include <asio.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

/**
 * @brief Exposes an artifact by seeding it to swarm peers.
 *
 * The seeder is created on first use and shared by every share. Two shares
 * of the same artifact seed it once; the seed is removed when the last of
 * them stops. The identifier is reported as a magnet link right away.
 */
class SwarmStrategy : public TransportStrategy {
public:
    SwarmStrategy(asio::io_context& io_context, SwarmConfig config);
    ~SwarmStrategy() override;

    ShareProvider provider() const override { return ShareProvider::SWARM; }
    TransportCapabilities capabilities() const override;

    void start(const ShareRequest& request, TransportSink sink) override;
    void stop(const std::string& share_id) override;
    void shutdown() override;

    // 0 until the first share starts the seeder.
    uint16_t listen_port() const;

    // Address of the interface used for outbound traffic, 127.0.0.1 when offline.
    static std::string detect_advertise_host();

private:
    struct RootEntry {
        std::set<std::string> share_ids;
    };

    struct ShareEntry {
        hash_t root_hash{};
        TransportSink sink;
    };

    void ensure_seeder();
    void dispatch_stats(const hash_t& root_hash, const SeedStats& stats);

    asio::io_context& io_context_;
    SwarmConfig config_;

    mutable std::mutex mutex_;
    std::shared_ptr<Seeder> seeder_;
    std::unique_ptr<PortMapper> port_mapper_;
    std::string advertise_host_;
    uint16_t advertise_port_ = 0;
    std::map<hash_t, RootEntry> roots_;
    std::map<std::string, ShareEntry> shares_;
};

#endif // INSTSHARE_SWARM_STRATEGY_HPP
