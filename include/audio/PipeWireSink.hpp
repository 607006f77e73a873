#pragma once

#include "audio/AudioSink.hpp"
#include "audio/PipeWireContext.hpp"

struct pw_stream;

namespace kitsune::audio {

// Pull-mode PipeWire playback stream. The thread loop's process callback
// renders the attached source; with nothing attached it renders silence.
class PipeWireSink : public AudioSink {
public:
    PipeWireSink();
    ~PipeWireSink() override;

    PipeWireSink(const PipeWireSink&) = delete;
    PipeWireSink& operator=(const PipeWireSink&) = delete;

    bool init(PipeWireContext& context, int sample_rate, int channels);
    void close();

    void play(FrameSource* source, CompletionCallback on_complete) override;
    void clear() override;

    bool is_initialized() const { return stream_ != nullptr; }

    // Process callback body; runs on the thread loop with its lock held.
    void render();

    int get_sample_rate() const override { return sample_rate_; }
    int get_channels() const override { return channels_; }

private:
    int sample_rate_ = 0;
    int channels_ = 0;

    // Guarded by the thread loop lock
    FrameSource* source_ = nullptr;  // Non-owning
    CompletionCallback on_complete_;

    struct pw_stream* stream_ = nullptr;
    PipeWireContext* context_ = nullptr; // Non-owning
};

} // namespace kitsune::audio
