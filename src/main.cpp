#include <iostream>
#include <string>
#include <asio.hpp>
#include <memory>
#include <thread>
#include <future>
#include <filesystem>
#include <csignal>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/version.hpp"
#include "sharing/sharing_service.hpp"
#include "sharing/task_runner.hpp"
#include "cli/cli.hpp"

namespace fs = std::filesystem;

void print_usage() {
    std::cout << "Usage: instshare [mode] [--config <file>]\n"
              << "Modes:\n"
              << "  interactive   - Restore shares and open the command shell (default)\n"
              << "  serve         - Restore shares and keep them running until SIGINT/SIGTERM\n";
}

void prepare_directories(const Config& config) {
    for (const auto& dir : {config.data_dir, config.instances_dir, config.temp_dir(), config.downloads_dir(),
                            config.tunnel.agent_dir}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("Cannot create " + dir.string() + ": " + ec.message());
        }
    }
}

void run_mode(const std::string& mode, const Config& config, asio::io_context& io_context) {
    AsioTaskRunner tasks(4);
    {
        SharingService service(config, io_context, tasks, SharingService::default_collaborators(config, io_context));

        auto restored = service.restore_shares();
        if (!restored.empty()) {
            std::cout << "Restored " << restored.size() << " share(s)" << std::endl;
        }

        if (mode == "interactive") {
            CLI cli(service, tasks);
            cli.run();
        } else {
            std::promise<void> stop_requested;
            asio::signal_set signals(io_context, SIGINT, SIGTERM);
            signals.async_wait([&stop_requested](const asio::error_code& error, int signal_number) {
                if (!error) LOG_INFO("Received signal ", signal_number, ", shutting down");
                stop_requested.set_value();
            });
            std::cout << "Serving " << service.shares().size() << " share(s). Press Ctrl+C to stop." << std::endl;
            stop_requested.get_future().wait();
        }

        // Rows and packages stay for the next restore.
        service.shutdown();
        tasks.join();
    }
}

int main(int argc, char* argv[]) {
    std::string mode = "interactive";
    fs::path config_path = Config::DEFAULT_CONFIG_FILE;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "interactive" || arg == "serve") {
            mode = arg;
        } else if (arg == "--version") {
            std::cout << "instshare " << INSTSHARE_VERSION << std::endl;
            return 0;
        } else {
            print_usage();
            return 1;
        }
    }

    Config config;
    try {
        config = Config::load(config_path);
        prepare_directories(config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    Logger::instance().init((config.data_dir / config.log_file).string());
    Logger::instance().set_level(Logger::parse_level(config.log_level));
    Logger::instance().set_console_output(config.log_to_console);
    LOG_INFO("Starting instshare ", INSTSHARE_VERSION, " (", mode, " mode)");

    asio::io_context io_context;
    auto work_guard = asio::make_work_guard(io_context);
    std::thread io_thread([&io_context]() {
        try {
            io_context.run();
        } catch (const std::exception& e) {
            LOG_ERR("IO Thread Error: ", e.what());
        }
    });

    int exit_code = 0;
    try {
        run_mode(mode, config, io_context);
    } catch (const std::exception& e) {
        LOG_ERR("Fatal Error: ", e.what());
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    work_guard.reset();
    io_context.stop();
    if (io_thread.joinable()) io_thread.join();
    LOG_INFO("instshare stopped");
    return exit_code;
}
