#pragma once

#include "audio/CompletionSignal.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace kitsune::events {

struct Event {
    enum class Type {
        TrackEnded,
        PlayPause,
        NextTrack,
        Stop,
        PlaySelected,
        RemoveSelected,
        MoveUp,
        MoveDown,
        CursorUp,
        CursorDown,
    };
    Type type;
    audio::PlaybackResult result;  // For TrackEnded
};

// Multi-producer queue drained by the orchestration thread.
class EventQueue {
public:
    void push(Event event);

    std::optional<Event> try_pop();

    // Waits until an event arrives, the timeout elapses or stop is requested.
    std::optional<Event> pop(std::stop_token stop, std::chrono::milliseconds timeout);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Event> items_;
};

}  // namespace kitsune::events
