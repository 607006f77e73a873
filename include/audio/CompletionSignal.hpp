#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace kitsune::audio {

struct PlaybackResult {
    enum class Status {
        Finished,
        DecodeError,
    };

    uint64_t session_id = 0;
    Status status = Status::Finished;
    std::string message;

    bool ok() const { return status == Status::Finished; }
};

/// Capacity-1 mailbox carrying "the session ended".
///
/// notify() never waits for a consumer: a pending result is overwritten.
/// wait() can be abandoned through a stop token so shutdown never hangs on it.
class CompletionSignal {
public:
    void notify(PlaybackResult result);

    std::optional<PlaybackResult> wait(std::stop_token stop);
    std::optional<PlaybackResult> wait_for(std::chrono::milliseconds timeout);
    std::optional<PlaybackResult> try_take();

    // Drops a pending result.
    void reset();

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::optional<PlaybackResult> pending_;
};

} // namespace kitsune::audio
