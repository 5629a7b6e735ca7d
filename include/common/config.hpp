#ifndef INSTSHARE_CONFIG_HPP
#define INSTSHARE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

struct TunnelConfig {
    uint32_t url_timeout_seconds = 30;
    uint32_t share_ttl_minutes = 0;             // 0 disables expiry
    uint32_t password_share_ttl_minutes = 1440;
    uint32_t max_connections = 10;
    uint32_t request_timeout_seconds = 300;
    std::vector<std::string> bore_servers = {"bore.pub", "bore.digital"};
    uint16_t bore_control_port = 2200;
    std::filesystem::path agent_dir;            // defaults to <data_dir>/agents
};

struct SwarmConfig {
    uint16_t listen_port = 6881;
    std::string advertise_host;                 // empty: detect the outbound interface
    bool enable_upnp = false;
    uint32_t piece_size = 256 * 1024;
};

struct Config {
    static constexpr const char* DEFAULT_CONFIG_FILE = "instshare.json";

    std::filesystem::path data_dir = ".instshare";
    std::filesystem::path instances_dir;        // defaults to <data_dir>/instances
    std::filesystem::path database;             // defaults to <data_dir>/instshare.db
    std::string log_file = "instshare.log";
    std::string log_level = "info";
    bool log_to_console = true;

    TunnelConfig tunnel;
    SwarmConfig swarm;

    std::filesystem::path temp_dir() const { return data_dir / "sharing" / "temp"; }
    std::filesystem::path downloads_dir() const { return data_dir / "sharing" / "downloads"; }

    /**
     * @brief Loads a configuration file, falling back to defaults when it is absent.
     * @throws std::runtime_error if the file exists but is not valid configuration JSON.
     */
    static Config load(const std::filesystem::path& path);

    // Fills every derived path that was left empty.
    void resolve_defaults();
};

#endif // INSTSHARE_CONFIG_HPP
