#include "transport/tunnel_agent.hpp"
#include "transport/agent_process.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <asio.hpp>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <unistd.h>

AgentManager::AgentManager(TunnelConfig config) : config_(std::move(config)) {}

const char* AgentManager::binary_name(ShareProvider provider) {
    switch (provider) {
        case ShareProvider::BORE: return "bore";
        case ShareProvider::CLOUDFLARE: return "cloudflared";
        case ShareProvider::SWARM: break;
    }
    return "";
}

const char* AgentManager::install_page(ShareProvider provider) {
    switch (provider) {
        case ShareProvider::BORE: return "https://github.com/ekzhang/bore/releases";
        case ShareProvider::CLOUDFLARE:
            return "https://developers.cloudflare.com/cloudflare-one/connections/connect-networks/downloads/";
        case ShareProvider::SWARM: break;
    }
    return "";
}

std::optional<fs::path> AgentManager::find_on_path(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<fs::path> AgentManager::locate(ShareProvider provider) const {
    std::string name = binary_name(provider);
    if (name.empty()) return std::nullopt;

    fs::path installed = config_.agent_dir / name;
    std::error_code ec;
    if (fs::is_regular_file(installed, ec) && access(installed.c_str(), X_OK) == 0) {
        return installed;
    }
    return find_on_path(name);
}

std::optional<AgentInfo> AgentManager::check_agent(ShareProvider provider) const {
    auto path = locate(provider);
    if (!path) {
        LOG_DEBUG(binary_name(provider), " not found in ", config_.agent_dir, " or PATH");
        return std::nullopt;
    }

    auto output = AgentProcess::run_capture(*path, {"--version"}, std::chrono::seconds(5));
    if (!output) {
        LOG_WARN(*path, " is present but did not run");
        return std::nullopt;
    }

    AgentInfo info;
    info.provider = provider;
    info.path = *path;
    info.installed = true;
    std::string first_line = output->substr(0, output->find('\n'));
    if (!first_line.empty()) info.version = first_line;
    return info;
}

AgentInfo AgentManager::install_agent(ShareProvider provider) {
    if (provider == ShareProvider::SWARM) {
        throw SharingError(ErrorKind::PRECONDITION, "The swarm transport needs no agent");
    }
    std::string name = binary_name(provider);

    auto source = find_on_path(name);
    if (!source) {
        throw SharingError(ErrorKind::PROVISIONING,
                           std::string("No ") + name + " binary available to install. Download it from " +
                           install_page(provider) + " and place it in " + config_.agent_dir.string());
    }

    fs::path target = config_.agent_dir / name;
    std::error_code ec;
    fs::create_directories(config_.agent_dir, ec);
    if (!ec) fs::copy_file(*source, target, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::permissions(target, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                fs::perms::others_read | fs::perms::others_exec, ec);
    }
    if (ec) {
        throw SharingError(ErrorKind::PROVISIONING, "Cannot install " + name + " into " +
                           config_.agent_dir.string() + ": " + ec.message());
    }
    LOG_INFO("Installed ", name, " from ", *source, " into ", target);

    auto info = check_agent(provider);
    if (!info) {
        throw SharingError(ErrorKind::PROVISIONING, "Installed " + name + " does not run. See " +
                           install_page(provider));
    }
    return *info;
}

bool AgentManager::probe_tcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    asio::io_context io_context;
    asio::ip::tcp::resolver resolver(io_context);
    asio::ip::tcp::socket socket(io_context);
    bool connected = false;

    resolver.async_resolve(host, std::to_string(port),
        [&](const asio::error_code& error, asio::ip::tcp::resolver::results_type results) {
            if (error) return;
            asio::async_connect(socket, results,
                [&](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                    connected = !ec;
                });
        });

    io_context.run_for(timeout);
    asio::error_code ec;
    socket.close(ec);
    return connected;
}

std::string AgentManager::select_bore_server() const {
    for (const auto& server : config_.bore_servers) {
        if (probe_tcp(server, config_.bore_control_port, std::chrono::seconds(3))) {
            LOG_DEBUG("Using bore relay ", server);
            return server;
        }
        LOG_WARN("Bore relay ", server, " is not reachable on port ", config_.bore_control_port);
    }
    throw SharingError(ErrorKind::PROVISIONING, "No bore relay server is reachable");
}

std::optional<std::string> AgentManager::extract_url(ShareProvider provider, const std::string& line) {
    static const std::regex bore_re(R"(listening at ([a-zA-Z0-9.-]+:\d+))");
    static const std::regex cloudflare_re(R"(https://[a-zA-Z0-9-]+\.trycloudflare\.com)");

    std::smatch match;
    switch (provider) {
        case ShareProvider::BORE:
            if (std::regex_search(line, match, bore_re)) return "http://" + match[1].str();
            break;
        case ShareProvider::CLOUDFLARE:
            if (std::regex_search(line, match, cloudflare_re)) return match[0].str();
            break;
        case ShareProvider::SWARM:
            break;
    }
    return std::nullopt;
}
