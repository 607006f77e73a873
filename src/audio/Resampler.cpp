#include "audio/Resampler.hpp"
#include "util/Logger.hpp"
#include <algorithm>

extern "C" {
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace kitsune::audio {

Resampler::Resampler(FrameSource& upstream, int out_sample_rate, int out_channels)
    : upstream_(upstream),
      in_sample_rate_(upstream.get_sample_rate()),
      in_channels_(upstream.get_channels()),
      out_sample_rate_(out_sample_rate),
      out_channels_(out_channels) {
}

Resampler::~Resampler() {
    if (swr_ctx_) {
        swr_free(&swr_ctx_);
        swr_ctx_ = nullptr;
    }
}

bool Resampler::init() {
    kitsune::util::Logger::debug("Resampler: " + std::to_string(in_sample_rate_) + "Hz/" +
                                 std::to_string(in_channels_) + "ch -> " +
                                 std::to_string(out_sample_rate_) + "Hz/" +
                                 std::to_string(out_channels_) + "ch");

    if (in_sample_rate_ <= 0 || in_channels_ <= 0) {
        kitsune::util::Logger::error("Resampler: Upstream has no valid format");
        return false;
    }

    swr_ctx_ = swr_alloc();
    if (!swr_ctx_) {
        kitsune::util::Logger::error("Resampler: Failed to allocate resampler");
        return false;
    }

    AVChannelLayout in_ch_layout;
    AVChannelLayout out_ch_layout;
    av_channel_layout_default(&in_ch_layout, in_channels_);
    av_channel_layout_default(&out_ch_layout, out_channels_);

    av_opt_set_chlayout(swr_ctx_, "in_chlayout", &in_ch_layout, 0);
    av_opt_set_chlayout(swr_ctx_, "out_chlayout", &out_ch_layout, 0);
    av_opt_set_int(swr_ctx_, "in_sample_rate", in_sample_rate_, 0);
    av_opt_set_int(swr_ctx_, "out_sample_rate", out_sample_rate_, 0);
    av_opt_set_sample_fmt(swr_ctx_, "in_sample_fmt", AV_SAMPLE_FMT_FLT, 0);
    av_opt_set_sample_fmt(swr_ctx_, "out_sample_fmt", AV_SAMPLE_FMT_FLT, 0);

    av_channel_layout_uninit(&in_ch_layout);
    av_channel_layout_uninit(&out_ch_layout);

    int ret = swr_init(swr_ctx_);
    if (ret < 0) {
        kitsune::util::Logger::error("Resampler: Failed to initialize resampler");
        swr_free(&swr_ctx_);
        swr_ctx_ = nullptr;
        return false;
    }
    return true;
}

int Resampler::read_pcm(float* buffer, int max_frames) {
    if (!swr_ctx_ || !buffer || max_frames <= 0) return 0;

    uint8_t* out_ptr = reinterpret_cast<uint8_t*>(buffer);

    // swr may swallow a whole input chunk before producing output
    while (true) {
        // Whatever swr already holds
        if (swr_get_out_samples(swr_ctx_, 0) >= max_frames) {
            return std::max(swr_convert(swr_ctx_, &out_ptr, max_frames, nullptr, 0), 0);
        }

        if (upstream_done_) {
            // Flush the tail
            int flushed = swr_convert(swr_ctx_, &out_ptr, max_frames, nullptr, 0);
            return std::max(flushed, 0);
        }

        int in_wanted = static_cast<int>(
            static_cast<long long>(max_frames) * in_sample_rate_ / out_sample_rate_) + 1;
        in_buffer_.resize(static_cast<size_t>(in_wanted) * in_channels_);

        int in_frames = upstream_.read_pcm(in_buffer_.data(), in_wanted);
        if (in_frames <= 0) {
            upstream_done_ = true;
            continue;
        }

        const uint8_t* in_ptr = reinterpret_cast<const uint8_t*>(in_buffer_.data());
        int converted = swr_convert(swr_ctx_, &out_ptr, max_frames, &in_ptr, in_frames);
        if (converted < 0) {
            kitsune::util::Logger::error("Resampler: swr_convert failed");
            return 0;
        }
        if (converted > 0) {
            return converted;
        }
    }
}

} // namespace kitsune::audio
