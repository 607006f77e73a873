#pragma once

#include "audio/FrameSource.hpp"
#include <functional>

namespace kitsune::audio {

// Real-time output. Pulls frames from the attached source on its own thread.
class AudioSink {
public:
    using CompletionCallback = std::function<void()>;

    virtual ~AudioSink() = default;

    // Attaches `source` (non-owning) and starts rendering it. `on_complete` runs on
    // the render thread once the source returns 0 frames; the sink detaches the
    // source before invoking it.
    virtual void play(FrameSource* source, CompletionCallback on_complete) = 0;

    // Detaches the current source without invoking its callback. When this returns
    // the render thread no longer touches the previous source.
    virtual void clear() = 0;

    virtual int get_sample_rate() const = 0;
    virtual int get_channels() const = 0;
};

} // namespace kitsune::audio
