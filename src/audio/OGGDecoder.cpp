#include "audio/OGGDecoder.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>

namespace kitsune::audio {

OGGDecoder::OGGDecoder() {
    std::memset(&vf_, 0, sizeof(vf_));
}

OGGDecoder::~OGGDecoder() {
    close();
}

size_t OGGDecoder::read_callback(void* ptr, size_t size, size_t nmemb, void* datasource) {
    auto* stream = static_cast<ByteStream*>(datasource);
    long n = stream->read(static_cast<unsigned char*>(ptr), size * nmemb);
    if (n < 0) {
        errno = EIO;
        return 0;
    }
    return static_cast<size_t>(n) / size;
}

bool OGGDecoder::open(ByteStream& stream) {
    kitsune::util::Logger::debug("OGGDecoder: Opening stream");
    clear_error();

    // No seek/tell: vorbisfile treats the source as unseekable
    ov_callbacks callbacks = {};
    callbacks.read_func = &OGGDecoder::read_callback;
    callbacks.seek_func = nullptr;
    callbacks.close_func = nullptr;
    callbacks.tell_func = nullptr;

    int ret = ov_open_callbacks(&stream, &vf_, nullptr, 0, callbacks);
    if (ret < 0) {
        set_error("ogg open failed (code=" + std::to_string(ret) + ")");
        kitsune::util::Logger::error("OGGDecoder: " + last_error());
        return false;
    }

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info) {
        set_error("ogg stream has no vorbis info");
        kitsune::util::Logger::error("OGGDecoder: " + last_error());
        ov_clear(&vf_);
        return false;
    }

    stream_ = &stream;
    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    position_frames_ = 0;
    is_open_ = true;

    kitsune::util::Logger::info("OGGDecoder: Opened successfully - " +
                                std::to_string(sample_rate_) + "Hz, " +
                                std::to_string(channels_) + "ch");
    return true;
}

void OGGDecoder::close() {
    kitsune::util::Logger::debug("OGGDecoder: Closing decoder");
    if (is_open_) {
        ov_clear(&vf_);
        is_open_ = false;
    }
    stream_ = nullptr;
    sample_rate_ = 0;
    channels_ = 0;
    position_frames_ = 0;
}

int OGGDecoder::read_pcm(float* buffer, int max_frames) {
    if (!is_open_ || !buffer) return 0;

    float** pcm;
    int frames_read = 0;
    int section = 0;

    while (frames_read < max_frames) {
        long ret = ov_read_float(&vf_, &pcm, max_frames - frames_read, &section);
        if (ret == OV_HOLE) {
            kitsune::util::Logger::warn("OGGDecoder: Hole in stream, continuing");
            continue;
        }
        if (ret < 0) {
            set_error("ogg decode error (code=" + std::to_string(ret) + ")");
            kitsune::util::Logger::error("OGGDecoder: " + last_error());
            break;
        }
        if (ret == 0) {
            if (stream_ && stream_->failed()) {
                set_error("ogg stream interrupted");
                kitsune::util::Logger::error("OGGDecoder: " + last_error());
            }
            break;
        }

        // Interleave channels
        for (long i = 0; i < ret; i++) {
            for (int ch = 0; ch < channels_; ch++) {
                buffer[(frames_read + i) * channels_ + ch] = pcm[ch][i];
            }
        }

        frames_read += static_cast<int>(ret);
    }

    position_frames_ += frames_read;
    return frames_read;
}

} // namespace kitsune::audio
