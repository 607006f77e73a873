#include "../framework/SimpleTest.hpp"
#include "audio/CompletionSignal.hpp"
#include "events/EventQueue.hpp"
#include <chrono>
#include <thread>

using namespace kitsune;
using namespace std::chrono_literals;

TEST_CASE(test_signal_try_take_empty) {
    audio::CompletionSignal signal;
    ASSERT_FALSE(signal.try_take().has_value());
}

TEST_CASE(test_signal_keeps_latest_result) {
    audio::CompletionSignal signal;
    signal.notify({1, audio::PlaybackResult::Status::Finished, ""});
    signal.notify({2, audio::PlaybackResult::Status::DecodeError, "bad header"});

    auto result = signal.try_take();
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->session_id, 2u);
    ASSERT_FALSE(result->ok());
    ASSERT_FALSE(signal.try_take().has_value());
}

TEST_CASE(test_signal_reset_drops_pending) {
    audio::CompletionSignal signal;
    signal.notify({7, audio::PlaybackResult::Status::Finished, ""});
    signal.reset();
    ASSERT_FALSE(signal.wait_for(10ms).has_value());
}

TEST_CASE(test_signal_wakes_waiter_across_threads) {
    audio::CompletionSignal signal;
    std::jthread producer([&signal] {
        std::this_thread::sleep_for(20ms);
        signal.notify({3, audio::PlaybackResult::Status::Finished, ""});
    });

    std::stop_source stop;
    auto result = signal.wait(stop.get_token());
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->session_id, 3u);
}

TEST_CASE(test_signal_wait_cancelled_by_stop) {
    audio::CompletionSignal signal;
    std::stop_source stop;
    std::jthread canceller([&stop] {
        std::this_thread::sleep_for(20ms);
        stop.request_stop();
    });

    ASSERT_FALSE(signal.wait(stop.get_token()).has_value());
}

TEST_CASE(test_event_queue_is_fifo) {
    events::EventQueue queue;
    queue.push({events::Event::Type::PlayPause, {}});
    queue.push({events::Event::Type::NextTrack, {}});
    ASSERT_EQ(queue.size(), 2u);
    ASSERT_TRUE(queue.try_pop()->type == events::Event::Type::PlayPause);
    ASSERT_TRUE(queue.try_pop()->type == events::Event::Type::NextTrack);
    ASSERT_FALSE(queue.try_pop().has_value());
}

TEST_CASE(test_event_queue_pop_times_out) {
    events::EventQueue queue;
    std::stop_source stop;
    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(queue.pop(stop.get_token(), 30ms).has_value());
    ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 25ms);
}

int main(int argc, char** argv) {
    return kitsune::test::TestRunner::instance().run_all(argc, argv);
}
