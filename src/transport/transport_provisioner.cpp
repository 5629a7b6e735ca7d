#include "transport/transport_provisioner.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <chrono>

TransportProvisioner::TransportProvisioner(asio::io_context& io_context, ShareRegistry& registry,
                                           SharingEventBus& bus, TunnelConfig config)
    : io_context_(io_context), registry_(registry), bus_(bus), config_(std::move(config)) {}

TransportProvisioner::~TransportProvisioner() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, timer] : expiry_timers_) {
        asio::post(io_context_, [timer]() { timer->cancel(); });
    }
    expiry_timers_.clear();
}

void TransportProvisioner::register_strategy(std::shared_ptr<TransportStrategy> strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    ShareProvider provider = strategy->provider();
    strategies_[provider] = std::move(strategy);
}

bool TransportProvisioner::has_strategy(ShareProvider provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_.count(provider) > 0;
}

std::shared_ptr<TransportStrategy> TransportProvisioner::strategy_for(ShareProvider provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(provider);
    if (it == strategies_.end()) {
        throw SharingError(ErrorKind::PRECONDITION,
                           std::string("No transport available for provider '") + provider_key(provider) + "'");
    }
    return it->second;
}

TransportCapabilities TransportProvisioner::capabilities(ShareProvider provider) const {
    return strategy_for(provider)->capabilities();
}

void TransportProvisioner::set_expiry_handler(ExpiryHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    expiry_handler_ = std::move(handler);
}

ActiveShare TransportProvisioner::start_share(const StartShareOptions& options) {
    auto strategy = strategy_for(options.provider);
    bool wants_password = (options.password && !options.password->empty()) || options.credential.has_value();
    if (wants_password && !strategy->capabilities().supports_password) {
        throw SharingError(ErrorKind::PRECONDITION,
                           std::string("Provider '") + provider_key(options.provider) +
                           "' does not support password protection");
    }

    ActiveShare share;
    share.share_id = Hasher::generate_uuid();
    share.provider = options.provider;
    share.started_at = std::time(nullptr);
    share.package_path = options.package_path;
    share.package_bytes = options.package_bytes;
    share.instance_name = options.instance_name;

    if (options.credential) {
        share.password_hash = options.credential->hash;
        share.password_salt = options.credential->salt;
    } else if (wants_password) {
        std::string salt = Hasher::random_token(16);
        share.password_hash = Hasher::hash_password(*options.password, salt);
        share.password_salt = salt;
    }

    if (options.expires_at) {
        share.expires_at = options.expires_at;
    } else {
        uint32_t ttl_minutes = share.password_hash ? config_.password_share_ttl_minutes : config_.share_ttl_minutes;
        if (ttl_minutes > 0) {
            share.expires_at = share.started_at + static_cast<std::time_t>(ttl_minutes) * 60;
        }
    }

    // Registered before the strategy runs so an early CONNECTED finds its entry.
    registry_.insert(ShareRecord{share, options.export_id, ShareStatus::CONNECTING, std::nullopt});
    {
        std::lock_guard<std::mutex> lock(mutex_);
        share_providers_[share.share_id] = options.provider;
    }
    bus_.publish(ShareStatusEvent{share.share_id, ShareStatus::CONNECTING, std::nullopt, std::nullopt});

    ShareRequest request;
    request.share_id = share.share_id;
    request.export_id = options.export_id;
    request.package_path = options.package_path;
    request.package_bytes = options.package_bytes;
    request.instance_name = options.instance_name;
    request.password_hash = share.password_hash;
    request.password_salt = share.password_salt;

    ShareProvider provider = options.provider;
    std::string export_id = options.export_id;
    auto unregister = [&]() {
        registry_.remove(share.share_id);
        registry_.remove_seed_session(export_id);
        std::lock_guard<std::mutex> lock(mutex_);
        share_providers_.erase(share.share_id);
    };
    try {
        strategy->start(request, [this, provider, export_id](const TransportEvent& event) {
            on_transport_event(provider, export_id, event);
        });
    } catch (const SharingError& e) {
        unregister();
        LOG_ERR("Provisioning ", provider_key(provider), " share failed: ", e.what());
        if (e.kind() == ErrorKind::PROVISIONING || e.kind() == ErrorKind::PRECONDITION) throw;
        throw SharingError(ErrorKind::PROVISIONING, e.what());
    } catch (const std::exception& e) {
        unregister();
        LOG_ERR("Provisioning ", provider_key(provider), " share failed: ", e.what());
        throw SharingError(ErrorKind::PROVISIONING, e.what());
    }

    // A stop that ran while the strategy was starting found nothing to tear down.
    bool stopped = !registry_.contains(share.share_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (share_providers_.count(share.share_id) == 0) stopped = true;
    }
    if (stopped) {
        unregister();
        try {
            strategy->stop(share.share_id);
        } catch (const std::exception& e) {
            LOG_WARN("Stopping orphaned share ", share.share_id, " failed: ", e.what());
        }
        LOG_INFO("Share ", share.share_id, " was stopped during provisioning");
        throw SharingError(ErrorKind::PROVISIONING, "Share was stopped during provisioning");
    }

    if (share.expires_at) {
        arm_expiry(share.share_id, *share.expires_at);
    }

    LOG_INFO("Share ", share.share_id, " started via ", provider_key(provider),
             share.password_hash ? " (password protected)" : "");
    auto current = registry_.get(share.share_id);
    return current ? current->share : share;
}

void TransportProvisioner::on_transport_event(ShareProvider provider, const std::string& export_id,
                                              const TransportEvent& event) {
    switch (event.kind) {
        case TransportEvent::Kind::CONNECTED:
            if (!registry_.apply_connected(event.share_id, event.url)) return;
            if (provider == ShareProvider::SWARM) {
                registry_.put_seed_session(SeedSession{export_id, event.share_id, event.url, 0, 0});
            }
            LOG_INFO("Share ", event.share_id, " is reachable");
            bus_.publish(ShareStatusEvent{event.share_id, ShareStatus::CONNECTED, event.url, std::nullopt});
            break;
        case TransportEvent::Kind::DOWNLOAD_PROGRESS:
            if (!registry_.apply_download_stats(event.share_id, event.download_count, event.uploaded_bytes)) return;
            if (provider == ShareProvider::SWARM) {
                registry_.update_seed_session(export_id, event.peer_count.value_or(0), event.uploaded_bytes);
            }
            bus_.publish(ShareDownloadEvent{event.share_id, event.download_count, event.uploaded_bytes, event.peer_count});
            break;
        case TransportEvent::Kind::ERROR:
            if (!registry_.apply_status(event.share_id, ShareStatus::ERROR, event.message)) return;
            LOG_WARN("Share ", event.share_id, ": ", event.message);
            bus_.publish(ShareStatusEvent{event.share_id, ShareStatus::ERROR, std::nullopt, event.message});
            break;
    }
}

void TransportProvisioner::stop_share(const std::string& share_id) {
    disarm_expiry(share_id);

    std::shared_ptr<TransportStrategy> strategy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = share_providers_.find(share_id);
        if (it == share_providers_.end()) return;
        auto s = strategies_.find(it->second);
        if (s != strategies_.end()) strategy = s->second;
        share_providers_.erase(it);
    }
    if (strategy) {
        strategy->stop(share_id);
    }
}

void TransportProvisioner::arm_expiry(const std::string& share_id, std::time_t expires_at) {
    auto timer = std::make_shared<asio::steady_timer>(io_context_);
    std::time_t now = std::time(nullptr);
    auto delay = std::chrono::seconds(expires_at > now ? expires_at - now : 0);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        expiry_timers_[share_id] = timer;
    }

    asio::post(io_context_, [this, timer, share_id, delay]() {
        timer->expires_after(delay);
        timer->async_wait([this, share_id](const asio::error_code& error) {
            if (error) return;
            ExpiryHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (expiry_timers_.erase(share_id) == 0) return;
                handler = expiry_handler_;
            }
            LOG_INFO("Share ", share_id, " expired");
            if (handler) handler(share_id);
        });
    });
}

void TransportProvisioner::disarm_expiry(const std::string& share_id) {
    std::shared_ptr<asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = expiry_timers_.find(share_id);
        if (it == expiry_timers_.end()) return;
        timer = it->second;
        expiry_timers_.erase(it);
    }
    asio::post(io_context_, [timer]() { timer->cancel(); });
}

void TransportProvisioner::shutdown() {
    std::map<ShareProvider, std::shared_ptr<TransportStrategy>> strategies;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, timer] : expiry_timers_) {
            asio::post(io_context_, [timer]() { timer->cancel(); });
        }
        expiry_timers_.clear();
        share_providers_.clear();
        strategies = strategies_;
    }
    for (auto& [provider, strategy] : strategies) {
        strategy->shutdown();
    }
}
