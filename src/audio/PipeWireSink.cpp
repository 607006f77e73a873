#include "audio/PipeWireSink.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/utils/result.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace kitsune::audio {

static void on_process(void* userdata) {
    static_cast<PipeWireSink*>(userdata)->render();
}

static const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .destroy = nullptr,
    .state_changed = nullptr,
    .control_info = nullptr,
    .io_changed = nullptr,
    .param_changed = nullptr,
    .add_buffer = nullptr,
    .remove_buffer = nullptr,
    .process = on_process,
    .drained = nullptr,
    .command = nullptr,
    .trigger_done = nullptr,
};

PipeWireSink::PipeWireSink() {
}

PipeWireSink::~PipeWireSink() {
    close();
}

bool PipeWireSink::init(PipeWireContext& context, int sample_rate, int channels) {
    kitsune::util::Logger::debug("PipeWireSink: Initializing (" +
                                 std::to_string(sample_rate) + "Hz, " +
                                 std::to_string(channels) + "ch)");

    if (stream_) {
        kitsune::util::Logger::debug("PipeWireSink: Already initialized, skipping");
        return false;
    }

    context_ = &context;
    sample_rate_ = sample_rate;
    channels_ = channels;

    struct pw_thread_loop* loop = context_->get_loop();
    if (!loop) {
        kitsune::util::Logger::error("PipeWireSink: Context loop is null");
        return false;
    }

    // CRITICAL: Lock the thread loop for all PipeWire operations
    pw_thread_loop_lock(loop);

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Music",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop),
        "kitsune",
        props,
        &stream_events,
        this
    );

    if (!stream_) {
        kitsune::util::Logger::error("PipeWireSink: Failed to create stream");
        pw_thread_loop_unlock(loop);
        return false;
    }

    uint8_t buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));

    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = static_cast<uint32_t>(channels_);
    info.rate = static_cast<uint32_t>(sample_rate_);
    if (channels_ == 2) {
        info.position[0] = SPA_AUDIO_CHANNEL_FL;
        info.position[1] = SPA_AUDIO_CHANNEL_FR;
    }

    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    int result = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT |
            PW_STREAM_FLAG_MAP_BUFFERS
        ),
        params, 1
    );

    pw_thread_loop_unlock(loop);

    if (result < 0) {
        kitsune::util::Logger::error("PipeWireSink: Stream connect failed (" +
                                     std::string(spa_strerror(result)) + ")");
        close();
        return false;
    }

    kitsune::util::Logger::info("PipeWireSink: Initialized successfully");
    return true;
}

void PipeWireSink::close() {
    kitsune::util::Logger::debug("PipeWireSink: Closing output");
    if (stream_ && context_ && context_->get_loop()) {
        struct pw_thread_loop* loop = context_->get_loop();

        pw_thread_loop_lock(loop);
        source_ = nullptr;
        on_complete_ = nullptr;
        pw_stream_destroy(stream_);
        pw_thread_loop_unlock(loop);

        stream_ = nullptr;
    } else if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
}

void PipeWireSink::play(FrameSource* source, CompletionCallback on_complete) {
    if (!stream_ || !context_ || !context_->get_loop()) {
        kitsune::util::Logger::error("PipeWireSink: play() on an uninitialized stream");
        return;
    }

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    source_ = source;
    on_complete_ = std::move(on_complete);
    pw_thread_loop_unlock(loop);
}

void PipeWireSink::clear() {
    if (!context_ || !context_->get_loop()) {
        source_ = nullptr;
        on_complete_ = nullptr;
        return;
    }

    // Waits for an in-flight process callback to return
    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    source_ = nullptr;
    on_complete_ = nullptr;
    pw_thread_loop_unlock(loop);
}

void PipeWireSink::render() {
    struct pw_buffer* pw_buf = pw_stream_dequeue_buffer(stream_);
    if (!pw_buf) {
        return;
    }

    struct spa_buffer* buf = pw_buf->buffer;
    float* dst = static_cast<float*>(buf->datas[0].data);
    if (!dst) {
        pw_stream_queue_buffer(stream_, pw_buf);
        return;
    }

    const uint32_t stride = static_cast<uint32_t>(sizeof(float) * channels_);
    uint32_t n_frames = buf->datas[0].maxsize / stride;
    if (pw_buf->requested > 0) {
        n_frames = std::min<uint32_t>(static_cast<uint32_t>(pw_buf->requested), n_frames);
    }

    uint32_t filled = 0;
    bool finished = false;
    while (source_ && filled < n_frames) {
        int got = source_->read_pcm(dst + static_cast<size_t>(filled) * channels_,
                                    static_cast<int>(n_frames - filled));
        if (got <= 0) {
            finished = true;
            break;
        }
        filled += static_cast<uint32_t>(got);
    }

    // Clamp decoded samples, pad the rest with silence
    size_t total_samples = static_cast<size_t>(n_frames) * channels_;
    size_t live_samples = static_cast<size_t>(filled) * channels_;
    for (size_t i = 0; i < live_samples; ++i) {
        float val = dst[i];
        if (!std::isfinite(val)) {
            val = 0.0f;
        }
        dst[i] = std::clamp(val, -1.0f, 1.0f);
    }
    std::fill(dst + live_samples, dst + total_samples, 0.0f);

    buf->datas[0].chunk->offset = 0;
    buf->datas[0].chunk->stride = static_cast<int32_t>(stride);
    buf->datas[0].chunk->size = n_frames * stride;
    pw_stream_queue_buffer(stream_, pw_buf);

    if (finished) {
        CompletionCallback callback = std::move(on_complete_);
        on_complete_ = nullptr;
        source_ = nullptr;
        if (callback) {
            callback();
        }
    }
}

} // namespace kitsune::audio
