#ifndef INSTSHARE_TASK_RUNNER_HPP
#define INSTSHARE_TASK_RUNNER_HPP

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <cstddef>
#include <functional>

// Runs collaborator work off the orchestrator's thread.
class TaskRunner {
public:
    using Task = std::function<void()>;

    virtual ~TaskRunner() = default;
    virtual void post(Task task) = 0;
};

class AsioTaskRunner : public TaskRunner {
public:
    explicit AsioTaskRunner(size_t threads = 4) : pool_(threads) {}
    ~AsioTaskRunner() override { pool_.join(); }

    void post(Task task) override {
        asio::post(pool_, std::move(task));
    }

    // Waits for queued tasks to finish.
    void join() { pool_.join(); }

private:
    asio::thread_pool pool_;
};

#endif // INSTSHARE_TASK_RUNNER_HPP
