#ifndef INSTSHARE_TRANSPORT_PROVISIONER_HPP
#define INSTSHARE_TRANSPORT_PROVISIONER_HPP

#include "transport_strategy.hpp"
#include "../common/config.hpp"
#include "../sharing/event_bus.hpp"
#include "../sharing/share_registry.hpp"
#include <asio.hpp>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct PasswordCredential {
    std::string hash;
    std::string salt;
};

struct StartShareOptions {
    std::string export_id;
    std::filesystem::path package_path;
    uint64_t package_bytes = 0;
    std::string instance_name;
    ShareProvider provider = ShareProvider::BORE;
    std::optional<std::string> password;
    std::optional<PasswordCredential> credential;  // reused by restore instead of a password
    std::optional<std::time_t> expires_at;         // reused by restore instead of the configured TTL
};

/**
 * @brief Front of the transport strategies.
 *
 * Selects the strategy by provider, registers the share before provisioning
 * starts, turns strategy events into registry updates and bus events, and
 * arms the expiry timer.
 */
class TransportProvisioner {
public:
    using ExpiryHandler = std::function<void(const std::string& share_id)>;

    TransportProvisioner(asio::io_context& io_context, ShareRegistry& registry, SharingEventBus& bus,
                         TunnelConfig config);
    ~TransportProvisioner();

    void register_strategy(std::shared_ptr<TransportStrategy> strategy);
    bool has_strategy(ShareProvider provider) const;

    // Throws SharingError(PRECONDITION) for a provider without a strategy.
    TransportCapabilities capabilities(ShareProvider provider) const;

    // Called on the io_context thread when a share's lifetime ends.
    void set_expiry_handler(ExpiryHandler handler);

    /**
     * @brief Registers the share as connecting and starts its strategy.
     * @return The share as registered; public_url is usually still empty.
     * @throws SharingError(PRECONDITION) for a password on a provider without
     *         password support, SharingError(PROVISIONING) if the strategy fails.
     */
    ActiveShare start_share(const StartShareOptions& options);

    /**
     * @brief Tears down the transport of a share and disarms its expiry.
     * Leaves the registry to the caller. Throws what the strategy throws.
     */
    void stop_share(const std::string& share_id);

    void shutdown();

private:
    std::shared_ptr<TransportStrategy> strategy_for(ShareProvider provider) const;
    void arm_expiry(const std::string& share_id, std::time_t expires_at);
    void disarm_expiry(const std::string& share_id);
    void on_transport_event(ShareProvider provider, const std::string& export_id, const TransportEvent& event);

    asio::io_context& io_context_;
    ShareRegistry& registry_;
    SharingEventBus& bus_;
    TunnelConfig config_;

    mutable std::mutex mutex_;
    std::map<ShareProvider, std::shared_ptr<TransportStrategy>> strategies_;
    std::map<std::string, ShareProvider> share_providers_;
    std::map<std::string, std::shared_ptr<asio::steady_timer>> expiry_timers_;
    ExpiryHandler expiry_handler_;
};

#endif // INSTSHARE_TRANSPORT_PROVISIONER_HPP
