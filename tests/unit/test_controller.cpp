#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "audio/PlaybackController.hpp"
#include <memory>
#include <stdexcept>

using namespace kitsune;
using kitsune::test::DecoderScript;
using kitsune::test::FakeStream;
using kitsune::test::ManualSink;
using kitsune::test::StreamLog;
using kitsune::test::make_track;

namespace {

struct Rig {
    ManualSink sink;
    std::shared_ptr<DecoderScript> script = std::make_shared<DecoderScript>();
    std::shared_ptr<StreamLog> log = std::make_shared<StreamLog>();
    audio::PlaybackController controller{sink, test::fake_decoder_factory(script)};

    audio::PlaybackController::StreamOpener opener(const std::string& id) {
        return [log = log, id] { return std::make_unique<FakeStream>(log, id); };
    }

    void play(const std::string& id, const std::string& format = "mp3") {
        controller.play(opener(id), format, make_track(id, format));
    }
};

}  // namespace

TEST_CASE(test_play_reports_now_playing) {
    Rig rig;
    rig.play("t1");

    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Playing);
    auto now = rig.controller.current();
    ASSERT_TRUE(now.has_value());
    ASSERT_EQ(now->track.id, std::string("t1"));
    ASSERT_EQ(now->session_id, rig.controller.session_id());
    ASSERT_TRUE(rig.sink.attached());
    ASSERT_NEAR(rig.controller.elapsed(), 0.0, 1e-9);
}

TEST_CASE(test_elapsed_follows_rendered_frames) {
    Rig rig;
    rig.play("t1");

    double last = rig.controller.elapsed();
    for (int i = 0; i < 5; ++i) {
        rig.sink.render(4410);
        double now = rig.controller.elapsed();
        ASSERT_TRUE(now > last);
        last = now;
    }
    ASSERT_NEAR(last, 0.5, 1e-6);
}

TEST_CASE(test_low_rate_mono_track_is_resampled_to_sink_format) {
    Rig rig;
    rig.script->sample_rate = 22050;
    rig.script->channels = 1;
    rig.script->total_frames = 22050;
    rig.play("t1");

    long rendered = 0;
    for (int i = 0; i < 5; ++i) {
        rendered += rig.sink.render(4410);
        ASSERT_NEAR(rig.controller.elapsed(), static_cast<double>(rendered) / 44100.0, 1e-9);
    }
    ASSERT_TRUE(rendered > 0);
    ASSERT_FALSE(rig.sink.last_buffer_silent());

    // One second of input comes out as one second at the sink rate
    rendered += rig.sink.drain(4410);
    ASSERT_NEAR(static_cast<double>(rendered), 44100.0, 512.0);

    auto result = rig.controller.done().try_take();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->ok());
}

TEST_CASE(test_pause_freezes_elapsed_and_emits_silence) {
    Rig rig;
    rig.play("t1");
    rig.sink.render(4410);

    ASSERT_TRUE(rig.controller.toggle_pause());
    ASSERT_TRUE(rig.controller.is_paused());
    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Paused);

    double frozen = rig.controller.elapsed();
    ASSERT_EQ(rig.sink.render(4410), 4410);
    ASSERT_TRUE(rig.sink.last_buffer_silent());
    rig.sink.render(4410);
    ASSERT_NEAR(rig.controller.elapsed(), frozen, 1e-9);

    ASSERT_TRUE(rig.controller.toggle_pause());
    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Playing);
    rig.sink.render(4410);
    ASSERT_FALSE(rig.sink.last_buffer_silent());
    ASSERT_NEAR(rig.controller.elapsed(), frozen + 0.1, 1e-6);
}

TEST_CASE(test_toggle_pause_without_session_is_noop) {
    Rig rig;
    ASSERT_FALSE(rig.controller.toggle_pause());
    ASSERT_FALSE(rig.controller.is_paused());
    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Idle);
}

TEST_CASE(test_stop_releases_session) {
    Rig rig;
    rig.play("t1");
    rig.sink.render(1024);
    rig.controller.stop();

    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Idle);
    ASSERT_FALSE(rig.controller.current().has_value());
    ASSERT_NEAR(rig.controller.elapsed(), 0.0, 1e-9);
    ASSERT_FALSE(rig.sink.attached());
    ASSERT_EQ(rig.log->cancelled, 1);
    ASSERT_EQ(rig.log->closed, 1);
    ASSERT_FALSE(rig.controller.done().try_take().has_value());

    rig.controller.stop();
    ASSERT_EQ(rig.log->closed, 1);
}

TEST_CASE(test_second_play_replaces_first_session) {
    Rig rig;
    rig.play("t1");
    rig.sink.render(4410);
    rig.play("t2");

    ASSERT_EQ(rig.log->opened.size(), 2u);
    ASSERT_EQ(rig.log->closed, 1);
    ASSERT_EQ(rig.sink.plays(), 2);
    ASSERT_EQ(rig.controller.current()->track.id, std::string("t2"));
    ASSERT_EQ(rig.controller.session_id(), 2u);
    ASSERT_NEAR(rig.controller.elapsed(), 0.0, 1e-9);
}

TEST_CASE(test_connect_error_leaves_controller_idle) {
    Rig rig;
    auto failing = [] () -> std::unique_ptr<audio::ByteStream> {
        throw audio::ConnectError("opening stream: stream returned 404");
    };
    ASSERT_THROWS(rig.controller.play(failing, "mp3", make_track("t1")), audio::ConnectError);

    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Idle);
    ASSERT_FALSE(rig.controller.current().has_value());
    ASSERT_FALSE(rig.sink.attached());
    ASSERT_TRUE(rig.script->requested_formats.empty());
    ASSERT_FALSE(rig.controller.done().try_take().has_value());
}

TEST_CASE(test_opener_failure_is_reported_as_connect_error) {
    Rig rig;
    auto failing = [] () -> std::unique_ptr<audio::ByteStream> {
        throw std::runtime_error("resolver exploded");
    };
    ASSERT_THROWS(rig.controller.play(failing, "mp3", make_track("t1")), audio::ConnectError);
    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Idle);
}

TEST_CASE(test_unexpected_decoder_factory_failure_leaves_controller_idle) {
    ManualSink sink;
    auto log = std::make_shared<StreamLog>();
    audio::PlaybackController controller{sink, [](const std::string&) -> std::unique_ptr<audio::AudioDecoder> {
        throw std::runtime_error("decoder table corrupted");
    }};
    auto opener = [log] { return std::make_unique<FakeStream>(log, "t1"); };

    ASSERT_THROWS(controller.play(opener, "mp3", make_track("t1")), std::runtime_error);
    ASSERT_TRUE(controller.state() == model::PlaybackState::Idle);
    ASSERT_FALSE(controller.current().has_value());
    ASSERT_FALSE(sink.attached());
    ASSERT_EQ(log->closed, 1);
    ASSERT_FALSE(controller.toggle_pause());
}

TEST_CASE(test_decoder_open_failure_releases_stream) {
    Rig rig;
    rig.script->fail_open = true;
    ASSERT_THROWS(rig.play("t1"), audio::DecodeError);

    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Idle);
    ASSERT_FALSE(rig.controller.current().has_value());
    ASSERT_FALSE(rig.sink.attached());
    ASSERT_EQ(rig.log->closed, 1);
}

TEST_CASE(test_failed_play_after_success_stops_previous) {
    Rig rig;
    rig.play("t1");
    rig.script->fail_open = true;
    ASSERT_THROWS(rig.play("t2"), audio::DecodeError);

    ASSERT_EQ(rig.log->closed, 2);
    ASSERT_FALSE(rig.sink.attached());
    ASSERT_FALSE(rig.controller.current().has_value());
}

TEST_CASE(test_natural_end_signals_once) {
    Rig rig;
    rig.script->total_frames = 3000;
    rig.play("t1");
    uint64_t id = rig.controller.session_id();

    ASSERT_EQ(rig.sink.drain(1024), 3000);
    ASSERT_FALSE(rig.sink.attached());

    auto result = rig.controller.done().try_take();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->ok());
    ASSERT_EQ(result->session_id, id);
    ASSERT_TRUE(rig.controller.state() == model::PlaybackState::Ended);
    ASSERT_FALSE(rig.controller.current().has_value());
    ASSERT_NEAR(rig.controller.elapsed(), 0.0, 1e-9);

    rig.sink.render(1024);
    ASSERT_FALSE(rig.controller.done().try_take().has_value());
    ASSERT_FALSE(rig.controller.toggle_pause());
}

TEST_CASE(test_mid_stream_error_ends_with_decode_error) {
    Rig rig;
    rig.script->fail_after_frames = 2048;
    rig.play("t1");

    rig.sink.drain(1024);
    auto result = rig.controller.done().try_take();
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->ok());
    ASSERT_TRUE(result->status == audio::PlaybackResult::Status::DecodeError);
    ASSERT_EQ(result->message, std::string("corrupt frame"));
}

TEST_CASE(test_stop_discards_pending_completion_on_next_play) {
    Rig rig;
    rig.script->total_frames = 100;
    rig.play("t1");
    rig.sink.drain();
    rig.play("t2");
    ASSERT_FALSE(rig.controller.done().try_take().has_value());
}

TEST_CASE(test_format_hint_reaches_decoder_factory) {
    Rig rig;
    rig.play("t1", "flac");
    rig.play("t2", "m4a");
    ASSERT_EQ(rig.script->requested_formats.size(), 2u);
    ASSERT_EQ(rig.script->requested_formats[0], std::string("flac"));
    ASSERT_EQ(rig.script->requested_formats[1], std::string("m4a"));
}

TEST_CASE(test_default_factory_picks_decoder_by_format) {
    ASSERT_EQ(std::string(audio::create_decoder("mp3")->name()), std::string("mp3"));
    ASSERT_EQ(std::string(audio::create_decoder("FLAC")->name()), std::string("flac"));
    ASSERT_EQ(std::string(audio::create_decoder("wav")->name()), std::string("flac"));
    ASSERT_EQ(std::string(audio::create_decoder("oga")->name()), std::string("ogg"));
    ASSERT_EQ(std::string(audio::create_decoder("m4a")->name()), std::string("mp3"));
    ASSERT_EQ(std::string(audio::create_decoder("", "ogg")->name()), std::string("ogg"));
    ASSERT_FALSE(audio::has_native_decoder("aac"));
}

int main(int argc, char** argv) {
    return kitsune::test::TestRunner::instance().run_all(argc, argv);
}
