#include "events/EventQueue.hpp"
#include <utility>

namespace kitsune::events {

void EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<Event> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(items_.front());
    items_.pop_front();
    return event;
}

std::optional<Event> EventQueue::pop(std::stop_token stop, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, stop, timeout, [this] { return !items_.empty(); })) {
        return std::nullopt;
    }
    Event event = std::move(items_.front());
    items_.pop_front();
    return event;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

}  // namespace kitsune::events
