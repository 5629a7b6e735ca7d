#include "sharing/event_bus.hpp"
#include "common/logger.hpp"
#include <vector>

SharingEventBus::SharingEventBus() : state_(std::make_shared<State>()) {}

SharingEventBus::Subscription SharingEventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    uint64_t id = state_->next_id++;
    state_->handlers.emplace(id, std::move(handler));
    return Subscription(std::static_pointer_cast<void>(state_), id);
}

void SharingEventBus::publish(const SharingEvent& event) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        handlers.reserve(state_->handlers.size());
        for (const auto& [id, handler] : state_->handlers) {
            handlers.push_back(handler);
        }
    }
    for (const auto& handler : handlers) {
        handler(event);
    }
}

size_t SharingEventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->handlers.size();
}

void SharingEventBus::unsubscribe(const std::shared_ptr<void>& state, uint64_t id) {
    auto typed = std::static_pointer_cast<State>(state);
    std::lock_guard<std::mutex> lock(typed->mutex);
    typed->handlers.erase(id);
}

void SharingEventBus::Subscription::reset() {
    if (id_ == 0) return;
    if (auto state = state_.lock()) {
        SharingEventBus::unsubscribe(state, id_);
    }
    state_.reset();
    id_ = 0;
}
