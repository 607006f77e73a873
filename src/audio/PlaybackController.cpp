#include "audio/PlaybackController.hpp"
#include "audio/PlaybackStages.hpp"
#include "audio/Resampler.hpp"
#include "util/Logger.hpp"
#include <utility>

namespace kitsune::audio {

struct PlaybackController::Session {
    uint64_t id = 0;
    bool finished = false;
    TransportState transport;

    std::unique_ptr<ByteStream> stream;
    std::unique_ptr<AudioDecoder> decoder;
    std::unique_ptr<Resampler> resampler;
    std::unique_ptr<PositionTracker> tracker;
    std::unique_ptr<PauseGate> gate;

    ~Session() {
        if (decoder) {
            decoder->close();
        }
        if (stream) {
            stream->close();
        }
    }
};

PlaybackController::PlaybackController(AudioSink& sink, DecoderFactory make_decoder)
    : sink_(sink),
      make_decoder_(std::move(make_decoder)),
      output_rate_(sink.get_sample_rate()) {
    if (!make_decoder_) {
        make_decoder_ = default_decoder_factory();
    }
}

PlaybackController::~PlaybackController() {
    stop();
}

void PlaybackController::play(const StreamOpener& opener, const std::string& format_hint,
                              const model::Track& track) {
    std::lock_guard<std::mutex> control(control_mutex_);

    // Never two sessions on the same sink
    teardown(detach_session());
    done_.reset();

    auto session = std::make_unique<Session>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->id = ++last_session_id_;
        state_ = model::PlaybackState::Loading;
    }

    kitsune::util::Logger::info("PlaybackController: Loading '" + track.title + "' by " + track.artist +
                                " (format=" + (format_hint.empty() ? "?" : format_hint) +
                                ", session=" + std::to_string(session->id) + ")");

    try {
        try {
            session->stream = opener();
        } catch (const ConnectError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConnectError(std::string("streaming ") + track.title + ": " + e.what());
        }
        if (!session->stream) {
            throw ConnectError("streaming " + track.title + ": no stream");
        }

        session->decoder = make_decoder_(format_hint);
        if (!session->decoder) {
            throw DecodeError("decoding " + track.title + ": no decoder for '" + format_hint + "'");
        }
        if (!session->decoder->open(*session->stream)) {
            throw DecodeError("decoding " + track.title + " (" + session->decoder->name() + "): " +
                              session->decoder->last_error());
        }

        FrameSource* upstream = session->decoder.get();
        if (upstream->get_sample_rate() != output_rate_ ||
            upstream->get_channels() != sink_.get_channels()) {
            session->resampler = std::make_unique<Resampler>(*upstream, output_rate_, sink_.get_channels());
            if (!session->resampler->init()) {
                throw DecodeError("decoding " + track.title + ": cannot convert " +
                                  std::to_string(upstream->get_sample_rate()) + "Hz/" +
                                  std::to_string(upstream->get_channels()) + "ch to output format");
            }
            upstream = session->resampler.get();
        }

        session->tracker = std::make_unique<PositionTracker>(*upstream, mutex_, session->transport);
        session->gate = std::make_unique<PauseGate>(*session->tracker, mutex_, session->transport);
    } catch (const PlaybackError& e) {
        kitsune::util::Logger::error("PlaybackController: " + std::string(e.what()));
        session.reset();
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = model::PlaybackState::Idle;
        throw;
    } catch (...) {
        kitsune::util::Logger::error("PlaybackController: Unexpected failure while loading track");
        session.reset();
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = model::PlaybackState::Idle;
        throw;
    }

    uint64_t id = session->id;
    FrameSource* head = session->gate.get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = std::move(session);
        now_playing_ = model::NowPlaying{track, id};
        state_ = model::PlaybackState::Playing;
    }

    sink_.play(head, [this, id] { on_session_complete(id); });
}

void PlaybackController::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    teardown(detach_session());
}

bool PlaybackController::toggle_pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_live()) {
        kitsune::util::Logger::debug("PlaybackController: toggle_pause with no active session");
        return false;
    }

    session_->transport.paused = !session_->transport.paused;
    state_ = session_->transport.paused ? model::PlaybackState::Paused : model::PlaybackState::Playing;
    kitsune::util::Logger::info(std::string("PlaybackController: ") +
                                (session_->transport.paused ? "Paused" : "Resumed"));
    return true;
}

double PlaybackController::elapsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_live() || output_rate_ <= 0) {
        return 0.0;
    }
    return static_cast<double>(session_->transport.frames_played) / output_rate_;
}

std::optional<model::NowPlaying> PlaybackController::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_playing_;
}

model::PlaybackState PlaybackController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool PlaybackController::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_live() && session_->transport.paused;
}

uint64_t PlaybackController::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_session_id_;
}

// Render thread
void PlaybackController::on_session_complete(uint64_t id) {
    PlaybackResult result;
    result.session_id = id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->id != id || session_->finished) {
            return;
        }
        session_->finished = true;

        const AudioDecoder& decoder = *session_->decoder;
        if (decoder.has_error()) {
            result.status = PlaybackResult::Status::DecodeError;
            result.message = decoder.last_error();
        }
        now_playing_.reset();
        state_ = model::PlaybackState::Ended;
    }

    if (result.ok()) {
        kitsune::util::Logger::info("PlaybackController: Session " + std::to_string(id) + " finished");
    } else {
        kitsune::util::Logger::error("PlaybackController: Session " + std::to_string(id) +
                                     " ended with decode error: " + result.message);
    }
    done_.notify(std::move(result));
}

std::unique_ptr<PlaybackController::Session> PlaybackController::detach_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    now_playing_.reset();
    state_ = model::PlaybackState::Idle;
    return std::move(session_);
}

void PlaybackController::teardown(std::unique_ptr<Session> session) {
    if (!session) {
        return;
    }

    kitsune::util::Logger::debug("PlaybackController: Tearing down session " + std::to_string(session->id));

    // Unblock a render thread stuck in a network read before waiting on it
    if (session->stream) {
        session->stream->cancel();
    }
    sink_.clear();
    session.reset();
}

bool PlaybackController::session_live() const {
    return session_ && !session_->finished;
}

} // namespace kitsune::audio
