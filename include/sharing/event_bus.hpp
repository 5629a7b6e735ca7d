#ifndef INSTSHARE_EVENT_BUS_HPP
#define INSTSHARE_EVENT_BUS_HPP

#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <variant>

// Push events leaving the subsystem: progress, share status, download statistics.
using SharingEvent = std::variant<ProgressEvent, ShareStatusEvent, ShareDownloadEvent>;

/**
 * @brief Fan-out of SharingEvents to subscribers.
 *
 * Handlers run on the publishing thread, outside the bus lock. A Subscription
 * unsubscribes when destroyed and may outlive the bus.
 */
class SharingEventBus {
public:
    using Handler = std::function<void(const SharingEvent&)>;

    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) { other.id_ = 0; }
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();
        bool active() const { return id_ != 0 && !state_.expired(); }

    private:
        friend class SharingEventBus;
        Subscription(std::weak_ptr<void> state, uint64_t id) : state_(std::move(state)), id_(id) {}

        std::weak_ptr<void> state_;
        uint64_t id_ = 0;
    };

    SharingEventBus();

    [[nodiscard]] Subscription subscribe(Handler handler);
    void publish(const SharingEvent& event);
    size_t subscriber_count() const;

private:
    struct State {
        std::mutex mutex;
        std::map<uint64_t, Handler> handlers;
        uint64_t next_id = 1;
    };

    std::shared_ptr<State> state_;

    static void unsubscribe(const std::shared_ptr<void>& state, uint64_t id);
};

#endif // INSTSHARE_EVENT_BUS_HPP
