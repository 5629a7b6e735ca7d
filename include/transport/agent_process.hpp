#ifndef INSTSHARE_AGENT_PROCESS_HPP
#define INSTSHARE_AGENT_PROCESS_HPP

#include <asio.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace fs = std::filesystem;

/**
 * @brief A tunnel agent child process with its output streamed line by line.
 *
 * stdout and stderr share one pipe read on the io_context. Handlers run on
 * the io_context thread. The exit handler is not called for a process that
 * was terminated through terminate().
 */
class AgentProcess : public std::enable_shared_from_this<AgentProcess> {
public:
    using LineHandler = std::function<void(const std::string&)>;
    using ExitHandler = std::function<void()>;

    /**
     * @brief Starts `program` with `args`.
     * @throws SharingError(PROVISIONING) if the process cannot be started.
     */
    static std::shared_ptr<AgentProcess> spawn(asio::io_context& io_context, const fs::path& program,
                                               const std::vector<std::string>& args,
                                               LineHandler on_line, ExitHandler on_exit);

    ~AgentProcess();

    // SIGTERM, then SIGKILL if the process is still alive after the grace period. Blocks.
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    pid_t pid() const { return pid_; }
    bool running();

    /**
     * @brief Runs a program to completion and returns its combined output.
     * @return std::nullopt if it cannot be started, exits non-zero or outlives `timeout`.
     */
    static std::optional<std::string> run_capture(const fs::path& program, const std::vector<std::string>& args,
                                                  std::chrono::milliseconds timeout);

private:
    AgentProcess(asio::io_context& io_context, pid_t pid, int read_fd, LineHandler on_line, ExitHandler on_exit);

    void read_lines();
    bool reap(bool block);

    asio::posix::stream_descriptor output_;
    asio::streambuf buffer_;
    pid_t pid_;
    LineHandler on_line_;
    ExitHandler on_exit_;
    std::atomic<bool> terminating_{false};
    std::mutex reap_mutex_;
    bool reaped_ = false;
};

#endif // INSTSHARE_AGENT_PROCESS_HPP
