#ifndef INSTSHARE_CLI_HPP
#define INSTSHARE_CLI_HPP

#include <string>
#include <vector>
#include <iostream>

#include "../sharing/sharing_service.hpp"
#include "../sharing/task_runner.hpp"

class CLI {
public:
    CLI(SharingService& service, TaskRunner& tasks, std::istream& in = std::cin, std::ostream& out = std::cout);
    ~CLI();

    void run();

    // Runs one command line. Returns false once the shell should exit.
    bool handle_command(const std::string& line);

private:
    void print_help();

    void cmd_workspaces(const std::vector<std::string>& args);
    void cmd_inventory(const std::vector<std::string>& args);
    void cmd_export(const std::vector<std::string>& args);
    void cmd_shares(const std::vector<std::string>& args);
    void cmd_stop(const std::vector<std::string>& args);
    void cmd_stop_all(const std::vector<std::string>& args);
    void cmd_import(const std::vector<std::string>& args);
    void cmd_agent(const std::vector<std::string>& args);
    void cmd_install_agent(const std::vector<std::string>& args);

    void print_report(const TeardownReport& report);

    SharingService& service_;
    TaskRunner& tasks_;
    std::istream& in_;
    std::ostream& out_;
    bool running_;
};

// "1.5 MB" style sizes for the shell.
std::string format_bytes(uint64_t bytes);

#endif // INSTSHARE_CLI_HPP
