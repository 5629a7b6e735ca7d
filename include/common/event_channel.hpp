#ifndef INSTSHARE_EVENT_CHANNEL_HPP
#define INSTSHARE_EVENT_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

/**
 * @brief Multi-producer, single-consumer queue of typed events.
 *
 * Collaborator tasks push from any thread; the owning orchestrator pops.
 * A closed channel drops further pushes.
 */
template<typename Event>
class EventChannel {
public:
    bool push(Event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<Event> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        Event ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    // Blocks until an event arrives, the channel closes or the timeout passes.
    std::optional<Event> wait_pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return std::nullopt;
        Event ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            queue_.clear();
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_ = false;
};

#endif // INSTSHARE_EVENT_CHANNEL_HPP
