#pragma once

namespace kitsune::audio {

// One stage of the playback pipeline. Produces interleaved float frames.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Returns frames written to buffer; 0 means the source is exhausted.
    virtual int read_pcm(float* buffer, int max_frames) = 0;

    virtual int get_sample_rate() const = 0;
    virtual int get_channels() const = 0;
};

} // namespace kitsune::audio
