#pragma once

#include "audio/FrameSource.hpp"
#include <mutex>

namespace kitsune::audio {

// Per-session state shared between the control thread and the render thread.
// Always accessed under the owning controller's mutex.
struct TransportState {
    bool paused = false;
    long frames_played = 0;
};

// Counts frames pulled through it.
class PositionTracker : public FrameSource {
public:
    PositionTracker(FrameSource& upstream, std::mutex& mutex, TransportState& state)
        : upstream_(upstream), mutex_(mutex), state_(state) {}

    int read_pcm(float* buffer, int max_frames) override;

    int get_sample_rate() const override { return upstream_.get_sample_rate(); }
    int get_channels() const override { return upstream_.get_channels(); }

private:
    FrameSource& upstream_;
    std::mutex& mutex_;
    TransportState& state_;
};

// While paused, emits silence without pulling from upstream.
class PauseGate : public FrameSource {
public:
    PauseGate(FrameSource& upstream, std::mutex& mutex, TransportState& state)
        : upstream_(upstream), mutex_(mutex), state_(state) {}

    int read_pcm(float* buffer, int max_frames) override;

    int get_sample_rate() const override { return upstream_.get_sample_rate(); }
    int get_channels() const override { return upstream_.get_channels(); }

private:
    FrameSource& upstream_;
    std::mutex& mutex_;
    TransportState& state_;
};

} // namespace kitsune::audio
