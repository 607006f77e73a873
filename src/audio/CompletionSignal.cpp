#include "audio/CompletionSignal.hpp"
#include <utility>

namespace kitsune::audio {

void CompletionSignal::notify(PlaybackResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = std::move(result);
    }
    cv_.notify_all();
}

std::optional<PlaybackResult> CompletionSignal::wait(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, stop, [this] { return pending_.has_value(); });
    return std::exchange(pending_, std::nullopt);
}

std::optional<PlaybackResult> CompletionSignal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return pending_.has_value(); });
    return std::exchange(pending_, std::nullopt);
}

std::optional<PlaybackResult> CompletionSignal::try_take() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(pending_, std::nullopt);
}

void CompletionSignal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.reset();
}

} // namespace kitsune::audio
