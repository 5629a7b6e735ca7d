#include "cli/cli.hpp"
#include "sharing/export_orchestrator.hpp"
#include "sharing/import_orchestrator.hpp"
#include "common/logger.hpp"
#include <iomanip>
#include <sstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::optional<ShareProvider> parse_provider(const std::string& key, std::ostream& out) {
    auto provider = provider_from_key(key);
    if (!provider) out << "Unknown provider: " << key << " (expected bore, cloudflare or swarm)" << std::endl;
    return provider;
}

void print_error(std::ostream& out, const ErrorRecord& error) {
    out << "Error (" << error_kind_label(error.kind) << "): " << error.message;
    if (!error.auth_code.empty()) out << " [" << error.auth_code << "]";
    out << std::endl;
}

} // namespace

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::stringstream ss;
    if (unit == 0) {
        ss << bytes << " B";
    } else {
        ss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    }
    return ss.str();
}

CLI::CLI(SharingService& service, TaskRunner& tasks, std::istream& in, std::ostream& out)
    : service_(service), tasks_(tasks), in_(in), out_(out), running_(false) {}

CLI::~CLI() {}

void CLI::run() {
    running_ = true;
    print_help();

    std::string line;
    while (running_) {
        out_ << "> " << std::flush;
        if (!std::getline(in_, line)) break;
        if (line.empty()) continue;
        handle_command(line);
    }
}

void CLI::print_help() {
    out_ << "Available commands:\n"
         << "  workspaces                          - List local workspaces\n"
         << "  inventory <ws>                      - Show the shareable content of a workspace\n"
         << "  export <ws> [--mods] [--config] [--resourcepacks] [--shaderpacks]\n"
         << "         [--world <folder>]... [--provider bore|cloudflare|swarm] [--password <pw>]\n"
         << "                                      - Package and share a workspace\n"
         << "  shares                              - List active shares\n"
         << "  stop <share_id>                     - Stop a share and delete its package\n"
         << "  stop-all                            - Stop every share\n"
         << "  import <locator|file> [--password <pw>] [--name <name>]\n"
         << "                                      - Import a shared workspace\n"
         << "  agent <provider>                    - Check a tunnel agent\n"
         << "  install-agent <provider>            - Install a tunnel agent\n"
         << "  help                                - Show this help\n"
         << "  quit / exit                         - Exit\n"
         << std::endl;
}

bool CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) args.push_back(arg);

    try {
        if (cmd == "workspaces") cmd_workspaces(args);
        else if (cmd == "inventory") cmd_inventory(args);
        else if (cmd == "export") cmd_export(args);
        else if (cmd == "shares") cmd_shares(args);
        else if (cmd == "stop") cmd_stop(args);
        else if (cmd == "stop-all") cmd_stop_all(args);
        else if (cmd == "import") cmd_import(args);
        else if (cmd == "agent") cmd_agent(args);
        else if (cmd == "install-agent") cmd_install_agent(args);
        else if (cmd == "help") print_help();
        else if (cmd == "quit" || cmd == "exit") running_ = false;
        else out_ << "Unknown command: " << cmd << std::endl;
    } catch (const SharingError& e) {
        print_error(out_, ErrorRecord::from(e));
    } catch (const std::exception& e) {
        LOG_ERR("Command '", cmd, "' failed: ", e.what());
        out_ << "Error: " << e.what() << std::endl;
    }
    return running_;
}

void CLI::cmd_workspaces(const std::vector<std::string>&) {
    auto list = service_.workspaces();
    if (list.empty()) {
        out_ << "No workspaces in " << service_.config().instances_dir << std::endl;
        return;
    }
    for (const auto& ws : list) {
        out_ << "  " << std::left << std::setw(24) << ws.id << " " << ws.name << " (" << ws.game_version;
        if (ws.loader) out_ << ", " << *ws.loader;
        if (ws.is_server) out_ << ", server";
        out_ << ")" << std::endl;
    }
}

void CLI::cmd_inventory(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: inventory <ws>" << std::endl;
        return;
    }
    ContentInventory inventory = service_.inventory(args[0]);
    for (ContentCategory c : ALL_CATEGORIES) {
        const auto& stats = inventory.stats(c);
        out_ << "  " << std::left << std::setw(14) << category_key(c);
        if (stats.available) {
            out_ << stats.count << " entries, " << format_bytes(stats.total_size_bytes);
        } else {
            out_ << "not available";
        }
        out_ << std::endl;
    }
    if (inventory.worlds.empty()) {
        out_ << "  No worlds" << std::endl;
    }
    for (const auto& world : inventory.worlds) {
        out_ << "  world " << world.folder_name << " \"" << world.name << "\" " << format_bytes(world.size_bytes)
             << std::endl;
    }
}

void CLI::cmd_export(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: export <ws> [--mods] [--config] [--resourcepacks] [--shaderpacks] "
                "[--world <folder>]... [--provider bore|cloudflare|swarm] [--password <pw>]" << std::endl;
        return;
    }

    ExportOptions options;
    ShareProvider provider = ShareProvider::BORE;
    std::optional<std::string> password;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a.size() > 2 && a.compare(0, 2, "--") == 0 && category_from_key(a.substr(2))) {
            options.set(*category_from_key(a.substr(2)), true);
        } else if (a == "--world" && i + 1 < args.size()) {
            options.worlds.insert(args[++i]);
        } else if (a == "--provider" && i + 1 < args.size()) {
            auto p = parse_provider(args[++i], out_);
            if (!p) return;
            provider = *p;
        } else if (a == "--password" && i + 1 < args.size()) {
            password = args[++i];
        } else {
            out_ << "Unknown option: " << a << std::endl;
            return;
        }
    }

    ExportOrchestrator exporter(service_, tasks_, args[0]);
    exporter.refresh_inventory();
    exporter.set_options(options);
    exporter.set_provider(provider);
    exporter.set_password(password);

    if (!exporter.start()) {
        if (exporter.last_error()) print_error(out_, *exporter.last_error());
        return;
    }

    std::string last_stage;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(service_.config().tunnel.url_timeout_seconds + 5);
    for (;;) {
        exporter.wait_for_event(std::chrono::milliseconds(200));
        exporter.process_events();

        if (exporter.progress() && exporter.progress()->stage != last_stage) {
            last_stage = exporter.progress()->stage;
            out_ << "  [" << exporter.progress()->current << "%] " << exporter.progress()->message << std::endl;
        }

        ExportState state = exporter.state();
        if (state == ExportState::SELECTING || state == ExportState::STOPPED) break;
        if (state == ExportState::ACTIVE) {
            if (exporter.share()->public_url || exporter.share_status() == ShareStatus::ERROR) break;
            if (std::chrono::steady_clock::now() > deadline) break;
        }
    }

    if (exporter.state() != ExportState::ACTIVE) {
        if (exporter.last_error()) print_error(out_, *exporter.last_error());
        return;
    }

    const ActiveShare& share = *exporter.share();
    out_ << "Share " << share.share_id << " (" << provider_key(share.provider) << ")" << std::endl;
    out_ << "  Package: " << format_bytes(exporter.prepared()->package_bytes) << std::endl;
    if (share.public_url) {
        out_ << "  Locator: " << *share.public_url << std::endl;
    } else if (exporter.last_error()) {
        print_error(out_, *exporter.last_error());
    } else {
        out_ << "  Still negotiating, check 'shares' for the locator" << std::endl;
    }
    if (share.password_hash) out_ << "  Password protected" << std::endl;
    if (share.expires_at) {
        std::tm tm_buf{};
        localtime_r(&*share.expires_at, &tm_buf);
        out_ << "  Expires: " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << std::endl;
    }
    // The share keeps running after the orchestrator goes away.
    exporter.detach();
}

void CLI::cmd_shares(const std::vector<std::string>&) {
    auto records = service_.shares();
    if (records.empty()) {
        out_ << "No active shares." << std::endl;
        return;
    }
    for (const auto& r : records) {
        out_ << "  " << r.share.share_id << " [" << status_key(r.status) << "] " << r.share.instance_name
             << " via " << provider_key(r.share.provider) << std::endl;
        out_ << "      " << (r.share.public_url ? *r.share.public_url : std::string("(no locator yet)")) << std::endl;
        out_ << "      downloads: " << r.share.download_count << ", uploaded: "
             << format_bytes(r.share.uploaded_bytes);
        if (r.error) out_ << ", last error: " << *r.error;
        out_ << std::endl;
    }
    for (const auto& seed : service_.seed_sessions()) {
        out_ << "  seed " << seed.export_id << ": " << seed.peer_count << " peer(s), "
             << format_bytes(seed.uploaded_bytes) << " uploaded" << std::endl;
    }
}

void CLI::print_report(const TeardownReport& report) {
    if (report.clean()) {
        out_ << "Stopped." << std::endl;
        return;
    }
    out_ << "Stopped with " << report.failures.size() << " cleanup problem(s):" << std::endl;
    for (const auto& f : report.failures) out_ << "  " << f << std::endl;
}

void CLI::cmd_stop(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: stop <share_id>" << std::endl;
        return;
    }
    bool known = service_.share(args[0]).has_value();
    TeardownReport report = service_.stop_share(args[0]);
    if (!known) {
        out_ << "No active share " << args[0] << std::endl;
        return;
    }
    print_report(report);
}

void CLI::cmd_stop_all(const std::vector<std::string>&) {
    print_report(service_.stop_all_shares());
}

void CLI::cmd_import(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: import <locator|file> [--password <pw>] [--name <name>]" << std::endl;
        return;
    }

    std::optional<std::string> password;
    std::optional<std::string> name;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--password" && i + 1 < args.size()) {
            password = args[++i];
        } else if (args[i] == "--name" && i + 1 < args.size()) {
            name = args[++i];
        } else {
            out_ << "Unknown option: " << args[i] << std::endl;
            return;
        }
    }

    ImportOrchestrator importer(service_, tasks_);
    std::error_code ec;
    if (fs::is_regular_file(args[0], ec)) {
        importer.set_local_source(args[0]);
    } else {
        importer.set_remote_source(args[0], password);
    }

    if (!importer.begin()) {
        if (importer.last_error()) print_error(out_, *importer.last_error());
        return;
    }

    int last_percent = -1;
    while (importer.state() == ImportState::RETRIEVING || importer.state() == ImportState::VALIDATING) {
        importer.wait_for_event(std::chrono::milliseconds(200));
        const auto& r = importer.retrieval();
        int percent = static_cast<int>(r.fraction * 100.0);
        if (importer.state() == ImportState::RETRIEVING && percent / 10 != last_percent / 10) {
            last_percent = percent;
            out_ << "  downloading " << percent << "% (" << format_bytes(r.bytes_downloaded) << ")";
            if (r.peers) out_ << ", " << *r.peers << " peer(s)";
            out_ << std::endl;
        }
    }

    if (importer.state() != ImportState::AWAITING_CONFIRMATION) {
        if (importer.last_error()) print_error(out_, *importer.last_error());
        return;
    }

    const SharingManifest& manifest = *importer.manifest();
    out_ << "Package: \"" << manifest.instance.name << "\" for " << manifest.instance.game_version;
    if (manifest.instance.loader) out_ << " (" << *manifest.instance.loader << ")";
    out_ << ", " << format_bytes(manifest.total_size_bytes) << std::endl;
    for (ContentCategory c : ALL_CATEGORIES) {
        const auto& section = manifest.section(c);
        if (section.included) out_ << "  " << category_key(c) << ": " << section.count << " entries" << std::endl;
    }
    for (const auto& world : manifest.saves.worlds) out_ << "  world: " << world.name << std::endl;

    if (name) {
        importer.set_destination_name(*name);
    } else {
        out_ << "Import as \"" << importer.destination_name() << "\"? [Y/n or a new name] " << std::flush;
        std::string answer;
        std::getline(in_, answer);
        if (answer == "n" || answer == "N") {
            importer.reset();
            out_ << "Import abandoned." << std::endl;
            return;
        }
        if (!answer.empty() && answer != "y" && answer != "Y") importer.set_destination_name(answer);
    }

    importer.confirm();
    while (importer.state() == ImportState::MATERIALIZING) {
        importer.wait_for_event(std::chrono::milliseconds(200));
    }

    if (importer.state() == ImportState::COMPLETE) {
        out_ << "Imported \"" << importer.result()->name << "\" into " << importer.result()->directory << std::endl;
    } else if (importer.last_error()) {
        print_error(out_, *importer.last_error());
    }
}

void CLI::cmd_agent(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: agent <bore|cloudflare>" << std::endl;
        return;
    }
    auto provider = parse_provider(args[0], out_);
    if (!provider) return;
    auto info = service_.check_tunnel_agent(*provider);
    if (!info) {
        out_ << "Not installed. Use 'install-agent " << args[0] << "'." << std::endl;
        return;
    }
    out_ << "Installed at " << info->path.string();
    if (info->version) out_ << " (" << *info->version << ")";
    out_ << std::endl;
}

void CLI::cmd_install_agent(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: install-agent <bore|cloudflare>" << std::endl;
        return;
    }
    auto provider = parse_provider(args[0], out_);
    if (!provider) return;
    AgentInfo info = service_.install_tunnel_agent(*provider);
    out_ << "Installed " << info.path.string();
    if (info.version) out_ << " (" << *info.version << ")";
    out_ << std::endl;
}
