#include "transport/tunnel_strategy.hpp"
#include "sharing/package_archive.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <algorithm>
#include <cctype>

TunnelStrategy::TunnelStrategy(asio::io_context& io_context, ShareProvider provider, TunnelConfig config)
    : io_context_(io_context), provider_(provider), agents_(std::move(config)) {
    if (provider_ == ShareProvider::SWARM) {
        throw std::invalid_argument("TunnelStrategy needs a relay provider");
    }
}

TunnelStrategy::~TunnelStrategy() {
    shutdown();
}

TransportCapabilities TunnelStrategy::capabilities() const {
    TransportCapabilities caps;
    caps.supports_password = true;
    caps.requires_agent = true;
    caps.url_based = true;
    return caps;
}

size_t TunnelStrategy::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exposures_.size();
}

std::vector<std::string> TunnelStrategy::agent_args(uint16_t local_port) const {
    if (provider_ == ShareProvider::BORE) {
        return {"local", std::to_string(local_port), "--to", agents_.select_bore_server()};
    }
    return {"tunnel", "--url", "http://localhost:" + std::to_string(local_port), "--no-autoupdate"};
}

void TunnelStrategy::start(const ShareRequest& request, TransportSink sink) {
    auto agent_path = agents_.locate(provider_);
    if (!agent_path) {
        throw SharingError(ErrorKind::PROVISIONING,
                           std::string(AgentManager::binary_name(provider_)) +
                           " is not installed. Run install-agent or download it from " +
                           AgentManager::install_page(provider_));
    }

    auto index = PackageArchive::read_index(request.package_path);

    auto exposure = std::make_shared<Exposure>();
    exposure->token = Hasher::random_token(32);

    const TunnelConfig& config = agents_.config();
    ShareHttpServer::Options options;
    options.package_path = request.package_path;
    options.token = exposure->token;
    options.password_hash = request.password_hash;
    options.password_salt = request.password_salt;
    options.manifest_json = index.manifest_json;
    options.max_connections = config.max_connections;
    options.request_timeout = std::chrono::seconds(config.request_timeout_seconds);

    std::string share_id = request.share_id;
    exposure->server = ShareHttpServer::create(io_context_, std::move(options),
        [sink, share_id](const ShareHttpStats& stats) {
            sink(TransportEvent::progress(share_id, stats.download_count, stats.uploaded_bytes));
        });

    auto args = agent_args(exposure->server->port());

    exposure->server->start();

    // Registered before the agent runs so its first output line finds the exposure.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        exposures_[share_id] = exposure;
    }

    try {
        exposure->agent = AgentProcess::spawn(io_context_, *agent_path, args,
            [this, share_id, sink](const std::string& line) { handle_agent_line(share_id, line, sink); },
            [this, share_id, sink]() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (exposures_.count(share_id) == 0) return;
                }
                LOG_WARN("Tunnel agent for share ", share_id, " exited");
                sink(TransportEvent::error(share_id, "tunnel disconnected"));
            });
    } catch (const std::exception&) {
        exposure->server->stop();
        std::lock_guard<std::mutex> lock(mutex_);
        exposures_.erase(share_id);
        throw;
    }

    exposure->url_timer = std::make_shared<asio::steady_timer>(io_context_);
    auto timer = exposure->url_timer;
    auto timeout = std::chrono::seconds(config.url_timeout_seconds);
    std::weak_ptr<Exposure> weak = exposure;
    asio::post(io_context_, [timer, timeout, weak, share_id, sink]() {
        timer->expires_after(timeout);
        timer->async_wait([weak, share_id, sink](const asio::error_code& error) {
            if (error) return;
            auto exposure = weak.lock();
            if (!exposure || exposure->connected) return;
            LOG_WARN("No tunnel URL for share ", share_id, " yet");
            sink(TransportEvent::error(share_id, "Timed out waiting for the tunnel URL"));
        });
    });

    LOG_INFO("Started ", AgentManager::binary_name(provider_), " (pid ", exposure->agent->pid(),
             ") for share ", share_id, " on local port ", exposure->server->port());
}

void TunnelStrategy::handle_agent_line(const std::string& share_id, const std::string& line,
                                       const TransportSink& sink) {
    LOG_DEBUG("[", AgentManager::binary_name(provider_), "] ", line);

    std::shared_ptr<Exposure> exposure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = exposures_.find(share_id);
        if (it == exposures_.end()) return;
        exposure = it->second;
    }

    if (!exposure->connected) {
        auto base = AgentManager::extract_url(provider_, line);
        if (base) {
            exposure->connected = true;
            if (exposure->url_timer) exposure->url_timer->cancel();
            sink(TransportEvent::connected(share_id, *base + "/" + exposure->token));
            return;
        }
    }

    std::string lower = line;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("error") != std::string::npos || lower.find("failed") != std::string::npos) {
        sink(TransportEvent::error(share_id, line));
    }
}

void TunnelStrategy::teardown(Exposure& exposure) {
    if (exposure.url_timer) {
        auto timer = exposure.url_timer;
        asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
    }
    if (exposure.agent) exposure.agent->terminate();
    if (exposure.server) exposure.server->stop();
}

void TunnelStrategy::stop(const std::string& share_id) {
    std::shared_ptr<Exposure> exposure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = exposures_.find(share_id);
        if (it == exposures_.end()) return;
        exposure = it->second;
        exposures_.erase(it);
    }
    teardown(*exposure);
    LOG_INFO("Stopped tunnel for share ", share_id);
}

void TunnelStrategy::shutdown() {
    std::map<std::string, std::shared_ptr<Exposure>> exposures;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        exposures.swap(exposures_);
    }
    for (auto& [id, exposure] : exposures) {
        teardown(*exposure);
    }
}
