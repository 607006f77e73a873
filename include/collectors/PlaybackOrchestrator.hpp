#pragma once

#include "audio/PlaybackController.hpp"
#include "backend/Queue.hpp"
#include "events/EventQueue.hpp"
#include "net/Notifier.hpp"
#include "net/StreamProvider.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace kitsune::collectors {

// Glues queue, controller and notifications together. Every method except
// run() and post() belongs to the orchestration thread.
class PlaybackOrchestrator {
public:
    using ErrorCallback = std::function<void(const std::string&)>;

    PlaybackOrchestrator(audio::PlaybackController& controller,
                         backend::Queue& queue,
                         net::StreamProvider& provider,
                         net::Notifier& notifier,
                         std::vector<std::string> transcode_formats = {"m4a", "aac", "wma"});

    // Done watcher. Forwards each completion into the event queue until stop is requested.
    void run(std::stop_token stop_token);

    void post(events::Event event);
    size_t process_pending();
    bool wait_and_process(std::stop_token stop_token, std::chrono::milliseconds timeout);

    bool play_tracks(std::vector<model::Track> tracks, int start_index);
    bool play_selected();
    bool skip();
    bool toggle_pause();
    void stop();
    void remove_selected();
    void move_up();
    void move_down();
    void cursor_up();
    void cursor_down();

    void on_track_ended(const audio::PlaybackResult& result);

    // Server-side format to request for a track, empty for the raw file.
    std::string transcode_hint(const std::string& format) const;

    std::optional<std::string> last_error() const { return last_error_; }
    void set_error_callback(ErrorCallback callback) { on_error_ = std::move(callback); }

private:
    bool start(const model::Track& track);
    void handle(const events::Event& event);
    void report(const std::string& message);

    audio::PlaybackController& controller_;
    backend::Queue& queue_;
    net::StreamProvider& provider_;
    net::Notifier& notifier_;
    std::vector<std::string> transcode_formats_;

    events::EventQueue events_;
    std::optional<model::Track> playing_;
    std::optional<std::string> last_error_;
    ErrorCallback on_error_;
};

}  // namespace kitsune::collectors
