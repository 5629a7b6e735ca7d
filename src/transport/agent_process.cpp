#include "transport/agent_process.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

// Forks and execs `program`; the child's stdout and stderr go to the returned fd.
pid_t fork_with_pipe(const fs::path& program, const std::vector<std::string>& args, int& read_fd) {
    int fds[2];
    if (pipe(fds) != 0) {
        return -1;
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(program.string());
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return -1;
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }

    close(fds[1]);
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    read_fd = fds[0];
    return pid;
}

} // namespace

std::shared_ptr<AgentProcess> AgentProcess::spawn(asio::io_context& io_context, const fs::path& program,
                                                  const std::vector<std::string>& args,
                                                  LineHandler on_line, ExitHandler on_exit) {
    int read_fd = -1;
    pid_t pid = fork_with_pipe(program, args, read_fd);
    if (pid < 0) {
        throw SharingError(ErrorKind::PROVISIONING,
                           "Cannot start " + program.string() + ": " + std::strerror(errno));
    }
    LOG_INFO("Started ", program.filename().string(), " (pid ", pid, ")");

    auto process = std::shared_ptr<AgentProcess>(
        new AgentProcess(io_context, pid, read_fd, std::move(on_line), std::move(on_exit)));
    asio::post(io_context, [process]() { process->read_lines(); });
    return process;
}

AgentProcess::AgentProcess(asio::io_context& io_context, pid_t pid, int read_fd,
                           LineHandler on_line, ExitHandler on_exit)
    : output_(io_context, read_fd), pid_(pid), on_line_(std::move(on_line)), on_exit_(std::move(on_exit)) {}

AgentProcess::~AgentProcess() {
    if (!reap(false)) {
        terminate(std::chrono::milliseconds(500));
    }
}

void AgentProcess::read_lines() {
    asio::async_read_until(output_, buffer_, '\n',
        [self = shared_from_this()](const asio::error_code& error, size_t bytes) {
            if (!error) {
                std::string line(asio::buffers_begin(self->buffer_.data()),
                                 asio::buffers_begin(self->buffer_.data()) + static_cast<std::ptrdiff_t>(bytes));
                self->buffer_.consume(bytes);
                while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
                if (!line.empty() && !self->terminating_ && self->on_line_) {
                    self->on_line_(line);
                }
                self->read_lines();
                return;
            }

            asio::error_code ec;
            self->output_.close(ec);
            if (self->terminating_) return;

            // Output closed: the agent exited or is about to.
            self->reap(false);
            LOG_WARN("Tunnel agent (pid ", self->pid_, ") closed its output");
            if (self->on_exit_) self->on_exit_();
        });
}

bool AgentProcess::reap(bool block) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_) return true;
    int status = 0;
    pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
    }
    return reaped_;
}

bool AgentProcess::running() {
    return !reap(false);
}

void AgentProcess::terminate(std::chrono::milliseconds grace) {
    terminating_ = true;
    if (reap(false)) return;

    kill(pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) {
            LOG_DEBUG("Agent (pid ", pid_, ") terminated");
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    LOG_WARN("Agent (pid ", pid_, ") ignored SIGTERM, killing");
    kill(pid_, SIGKILL);
    reap(true);
}

std::optional<std::string> AgentProcess::run_capture(const fs::path& program, const std::vector<std::string>& args,
                                                     std::chrono::milliseconds timeout) {
    int read_fd = -1;
    pid_t pid = fork_with_pipe(program, args, read_fd);
    if (pid < 0) return std::nullopt;

    std::string output;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    bool timed_out = false;
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            timed_out = true;
            break;
        }
        pollfd pfd{read_fd, POLLIN, 0};
        int pr = poll(&pfd, 1, static_cast<int>(left.count()));
        if (pr < 0 && errno == EINTR) continue;
        if (pr <= 0) {
            timed_out = pr == 0;
            break;
        }
        ssize_t n = read(read_fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        output.append(buf, static_cast<size_t>(n));
    }
    close(read_fd);

    int status = 0;
    if (timed_out) {
        kill(pid, SIGKILL);
    }
    waitpid(pid, &status, 0);
    if (timed_out || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }
    return output;
}
