#ifndef INSTSHARE_TUNNEL_STRATEGY_HPP
#define INSTSHARE_TUNNEL_STRATEGY_HPP

#include "transport_strategy.hpp"
#include "tunnel_agent.hpp"
#include "agent_process.hpp"
#include "share_http_server.hpp"
#include <asio.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Exposes an artifact through a loopback HTTP server and a tunnel agent.
 *
 * One instance per relay provider (BORE or CLOUDFLARE). Every share gets its
 * own server, agent process and access token; the public URL is reported
 * once the agent prints it.
 */
class TunnelStrategy : public TransportStrategy {
public:
    TunnelStrategy(asio::io_context& io_context, ShareProvider provider, TunnelConfig config);
    ~TunnelStrategy() override;

    ShareProvider provider() const override { return provider_; }
    TransportCapabilities capabilities() const override;

    void start(const ShareRequest& request, TransportSink sink) override;
    void stop(const std::string& share_id) override;
    void shutdown() override;

    size_t active_count() const;

private:
    struct Exposure {
        std::shared_ptr<ShareHttpServer> server;
        std::shared_ptr<AgentProcess> agent;
        std::shared_ptr<asio::steady_timer> url_timer;
        std::string token;
        bool connected = false;
    };

    std::vector<std::string> agent_args(uint16_t local_port) const;
    void handle_agent_line(const std::string& share_id, const std::string& line, const TransportSink& sink);
    static void teardown(Exposure& exposure);

    asio::io_context& io_context_;
    ShareProvider provider_;
    AgentManager agents_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Exposure>> exposures_;
};

#endif // INSTSHARE_TUNNEL_STRATEGY_HPP
