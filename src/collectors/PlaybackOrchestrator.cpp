#include "collectors/PlaybackOrchestrator.hpp"
#include "audio/DecoderFactory.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <utility>

namespace kitsune::collectors {

namespace {
constexpr const char* kTranscodeTarget = "mp3";
}

PlaybackOrchestrator::PlaybackOrchestrator(audio::PlaybackController& controller,
                                           backend::Queue& queue,
                                           net::StreamProvider& provider,
                                           net::Notifier& notifier,
                                           std::vector<std::string> transcode_formats)
    : controller_(controller),
      queue_(queue),
      provider_(provider),
      notifier_(notifier),
      transcode_formats_(std::move(transcode_formats)) {
    for (auto& format : transcode_formats_) {
        format = audio::to_lower(format);
    }
}

void PlaybackOrchestrator::run(std::stop_token stop_token) {
    util::Logger::debug("PlaybackOrchestrator: Done watcher started");

    while (!stop_token.stop_requested()) {
        auto result = controller_.done().wait(stop_token);
        if (!result) {
            break;
        }
        post(events::Event{events::Event::Type::TrackEnded, std::move(*result)});
    }

    util::Logger::debug("PlaybackOrchestrator: Done watcher stopped");
}

void PlaybackOrchestrator::post(events::Event event) {
    events_.push(std::move(event));
}

size_t PlaybackOrchestrator::process_pending() {
    size_t handled = 0;
    while (auto event = events_.try_pop()) {
        handle(*event);
        handled++;
    }
    return handled;
}

bool PlaybackOrchestrator::wait_and_process(std::stop_token stop_token, std::chrono::milliseconds timeout) {
    auto event = events_.pop(stop_token, timeout);
    if (!event) {
        return false;
    }
    handle(*event);
    process_pending();
    return true;
}

void PlaybackOrchestrator::handle(const events::Event& event) {
    using Type = events::Event::Type;
    switch (event.type) {
        case Type::TrackEnded:     on_track_ended(event.result); break;
        case Type::PlayPause:      toggle_pause(); break;
        case Type::NextTrack:      skip(); break;
        case Type::Stop:           stop(); break;
        case Type::PlaySelected:   play_selected(); break;
        case Type::RemoveSelected: remove_selected(); break;
        case Type::MoveUp:         move_up(); break;
        case Type::MoveDown:       move_down(); break;
        case Type::CursorUp:       cursor_up(); break;
        case Type::CursorDown:     cursor_down(); break;
    }
}

bool PlaybackOrchestrator::play_tracks(std::vector<model::Track> tracks, int start_index) {
    queue_.replace(std::move(tracks), start_index);
    auto track = queue_.current();
    if (!track) {
        util::Logger::warn("PlaybackOrchestrator: Nothing to play");
        stop();
        return false;
    }
    return start(*track);
}

bool PlaybackOrchestrator::play_selected() {
    auto track = queue_.jump_to();
    if (!track) {
        return false;
    }
    return start(*track);
}

bool PlaybackOrchestrator::skip() {
    auto track = queue_.next();
    if (!track) {
        util::Logger::info("PlaybackOrchestrator: End of queue");
        stop();
        return false;
    }
    return start(*track);
}

bool PlaybackOrchestrator::toggle_pause() {
    return controller_.toggle_pause();
}

void PlaybackOrchestrator::stop() {
    controller_.stop();
    playing_.reset();
}

void PlaybackOrchestrator::remove_selected() {
    if (queue_.remove()) {
        util::Logger::info("PlaybackOrchestrator: Playing track removed, stopping");
        stop();
    }
}

void PlaybackOrchestrator::move_up() { queue_.move_up(); }
void PlaybackOrchestrator::move_down() { queue_.move_down(); }
void PlaybackOrchestrator::cursor_up() { queue_.cursor_up(); }
void PlaybackOrchestrator::cursor_down() { queue_.cursor_down(); }

void PlaybackOrchestrator::on_track_ended(const audio::PlaybackResult& result) {
    if (result.session_id != controller_.session_id()) {
        util::Logger::debug("PlaybackOrchestrator: Ignoring stale result for session " +
                            std::to_string(result.session_id));
        return;
    }

    if (!result.ok()) {
        report("playback error: " + result.message);
    }

    if (playing_) {
        notifier_.announce_scrobble(playing_->id);
        playing_.reset();
    }

    auto next = queue_.next();
    if (!next) {
        util::Logger::info("PlaybackOrchestrator: Queue finished");
        controller_.stop();
        return;
    }
    start(*next);
}

std::string PlaybackOrchestrator::transcode_hint(const std::string& format) const {
    std::string lower = audio::to_lower(format);
    if (std::find(transcode_formats_.begin(), transcode_formats_.end(), lower) != transcode_formats_.end()) {
        return kTranscodeTarget;
    }
    return "";
}

bool PlaybackOrchestrator::start(const model::Track& track) {
    std::string hint = transcode_hint(track.format);
    auto opener = [this, id = track.id, hint] { return provider_.open_stream(id, hint); };

    try {
        controller_.play(opener, audio::to_lower(track.format), track);
    } catch (const audio::PlaybackError& e) {
        playing_.reset();
        report(e.what());
        return false;
    }

    playing_ = track;
    notifier_.announce_playing(track.id);
    return true;
}

void PlaybackOrchestrator::report(const std::string& message) {
    util::Logger::error("PlaybackOrchestrator: " + message);
    last_error_ = message;
    if (on_error_) {
        on_error_(message);
    }
}

}  // namespace kitsune::collectors
