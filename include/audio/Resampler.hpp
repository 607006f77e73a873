#pragma once

#include "audio/FrameSource.hpp"
#include <vector>

struct SwrContext;

namespace kitsune::audio {

// Converts an upstream source to a target rate and channel count with libswresample.
class Resampler : public FrameSource {
public:
    Resampler(FrameSource& upstream, int out_sample_rate, int out_channels);
    ~Resampler() override;

    Resampler(const Resampler&) = delete;
    Resampler& operator=(const Resampler&) = delete;

    [[nodiscard]] bool init();

    int read_pcm(float* buffer, int max_frames) override;

    int get_sample_rate() const override { return out_sample_rate_; }
    int get_channels() const override { return out_channels_; }

private:
    FrameSource& upstream_;
    SwrContext* swr_ctx_ = nullptr;
    int in_sample_rate_ = 0;
    int in_channels_ = 0;
    int out_sample_rate_ = 0;
    int out_channels_ = 0;
    bool upstream_done_ = false;
    std::vector<float> in_buffer_;
};

} // namespace kitsune::audio
