#include "common/config.hpp"
#include "common/logger.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

void from_json(const json& j, TunnelConfig& t) {
    t.url_timeout_seconds = j.value("url_timeout_seconds", t.url_timeout_seconds);
    t.share_ttl_minutes = j.value("share_ttl_minutes", t.share_ttl_minutes);
    t.password_share_ttl_minutes = j.value("password_share_ttl_minutes", t.password_share_ttl_minutes);
    t.max_connections = j.value("max_connections", t.max_connections);
    t.request_timeout_seconds = j.value("request_timeout_seconds", t.request_timeout_seconds);
    if (j.contains("bore_servers")) {
        j.at("bore_servers").get_to(t.bore_servers);
    }
    t.bore_control_port = j.value("bore_control_port", t.bore_control_port);
    if (j.contains("agent_dir")) {
        t.agent_dir = j.at("agent_dir").get<std::string>();
    }
}

void from_json(const json& j, SwarmConfig& s) {
    s.listen_port = j.value("listen_port", s.listen_port);
    s.advertise_host = j.value("advertise_host", s.advertise_host);
    s.enable_upnp = j.value("enable_upnp", s.enable_upnp);
    s.piece_size = j.value("piece_size", s.piece_size);
}

void from_json(const json& j, Config& c) {
    if (j.contains("data_dir")) c.data_dir = j.at("data_dir").get<std::string>();
    if (j.contains("instances_dir")) c.instances_dir = j.at("instances_dir").get<std::string>();
    if (j.contains("database")) c.database = j.at("database").get<std::string>();
    c.log_file = j.value("log_file", c.log_file);
    c.log_level = j.value("log_level", c.log_level);
    c.log_to_console = j.value("log_to_console", c.log_to_console);
    if (j.contains("tunnel")) j.at("tunnel").get_to(c.tunnel);
    if (j.contains("swarm")) j.at("swarm").get_to(c.swarm);
}

Config Config::load(const fs::path& path) {
    Config config;
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_INFO("No config file at ", path, ", using defaults");
        config.resolve_defaults();
        return config;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            throw std::runtime_error("top-level value must be an object");
        }
        j.get_to(config);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " + e.what());
    }

    if (config.swarm.piece_size == 0) {
        throw std::runtime_error("Invalid config file " + path.string() + ": swarm.piece_size must be positive");
    }
    config.resolve_defaults();
    return config;
}

void Config::resolve_defaults() {
    if (instances_dir.empty()) instances_dir = data_dir / "instances";
    if (database.empty()) database = data_dir / "instshare.db";
    if (tunnel.agent_dir.empty()) tunnel.agent_dir = data_dir / "agents";
}
