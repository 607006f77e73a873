#pragma once

#include "audio/AudioSink.hpp"
#include "audio/ByteStream.hpp"
#include "audio/CompletionSignal.hpp"
#include "audio/DecoderFactory.hpp"
#include "audio/PlaybackError.hpp"
#include "model/Track.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kitsune::audio {

/// Owns at most one playback session and drives it through the sink:
/// stream -> decoder -> [resampler] -> position tracker -> pause gate -> sink.
///
/// play/stop/toggle_pause are called from the control thread. The sink's render
/// thread only touches the session through the tracker and gate, each of which
/// takes mutex_ for a single flag read or counter update. mutex_ is never held
/// while calling into the sink.
class PlaybackController {
public:
    // Opens the byte stream for a session. Throws ConnectError on failure.
    using StreamOpener = std::function<std::unique_ptr<ByteStream>()>;

    PlaybackController(AudioSink& sink, DecoderFactory make_decoder);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    // Stops the current session, then starts a new one. Returns once the sink is
    // rendering. Throws ConnectError or DecodeError and stays Idle on failure.
    void play(const StreamOpener& opener, const std::string& format_hint, const model::Track& track);

    void stop();

    // Returns false when there is no session to pause.
    bool toggle_pause();

    double elapsed() const;
    std::optional<model::NowPlaying> current() const;
    model::PlaybackState state() const;
    bool is_paused() const;

    // Id of the latest session started (0 before the first play).
    uint64_t session_id() const;

    CompletionSignal& done() { return done_; }

private:
    struct Session;

    void on_session_complete(uint64_t id);
    std::unique_ptr<Session> detach_session();
    void teardown(std::unique_ptr<Session> session);
    bool session_live() const;  // mutex_ held

    AudioSink& sink_;
    DecoderFactory make_decoder_;
    const int output_rate_;

    // Serializes play/stop between control-thread callers
    std::mutex control_mutex_;

    mutable std::mutex mutex_;
    std::unique_ptr<Session> session_;
    std::optional<model::NowPlaying> now_playing_;
    model::PlaybackState state_ = model::PlaybackState::Idle;
    uint64_t last_session_id_ = 0;

    CompletionSignal done_;
};

} // namespace kitsune::audio
