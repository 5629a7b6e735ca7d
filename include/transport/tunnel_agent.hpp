#ifndef INSTSHARE_TUNNEL_AGENT_HPP
#define INSTSHARE_TUNNEL_AGENT_HPP

#include "../common/config.hpp"
#include "../sharing/types.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Finds and installs the tunnel agent binaries.
 *
 * bore for the BORE provider, cloudflared for CLOUDFLARE.
 */
class AgentManager {
public:
    explicit AgentManager(TunnelConfig config);

    static const char* binary_name(ShareProvider provider);
    static const char* install_page(ShareProvider provider);

    // Installed copy in agent_dir first, then the first match on PATH.
    std::optional<fs::path> locate(ShareProvider provider) const;

    // std::nullopt when the agent is not installed or does not run.
    std::optional<AgentInfo> check_agent(ShareProvider provider) const;

    /**
     * @brief Copies an agent found on PATH into agent_dir.
     * @throws SharingError(PROVISIONING) naming the manual install page when no binary is available.
     */
    AgentInfo install_agent(ShareProvider provider);

    /**
     * @brief First configured bore relay whose control port accepts a TCP connection.
     * @throws SharingError(PROVISIONING) when none is reachable.
     */
    std::string select_bore_server() const;

    static bool probe_tcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    /**
     * @brief Finds the public base URL in one line of agent output.
     *
     * bore: "listening at host:port" -> "http://host:port".
     * cloudflared: the first "https://<sub>.trycloudflare.com".
     */
    static std::optional<std::string> extract_url(ShareProvider provider, const std::string& line);

    const TunnelConfig& config() const { return config_; }

private:
    static std::optional<fs::path> find_on_path(const std::string& name);

    TunnelConfig config_;
};

#endif // INSTSHARE_TUNNEL_AGENT_HPP
