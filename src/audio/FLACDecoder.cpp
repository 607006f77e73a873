#include "audio/FLACDecoder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

namespace kitsune::audio {

FLACDecoder::FLACDecoder() {
    std::memset(&info_, 0, sizeof(info_));
}

FLACDecoder::~FLACDecoder() {
    close();
}

sf_count_t FLACDecoder::vio_get_filelen(void* user_data) {
    auto* self = static_cast<FLACDecoder*>(user_data);
    long long length = self->stream_ ? self->stream_->content_length() : -1;
    if (length < 0) {
        return std::numeric_limits<sf_count_t>::max();
    }
    return static_cast<sf_count_t>(length);
}

sf_count_t FLACDecoder::vio_seek(sf_count_t offset, int whence, void* user_data) {
    auto* self = static_cast<FLACDecoder*>(user_data);

    sf_count_t target;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = self->position_ + offset; break;
        case SEEK_END: {
            long long length = self->stream_ ? self->stream_->content_length() : -1;
            if (length < 0) return -1;
            target = static_cast<sf_count_t>(length) + offset;
            break;
        }
        default: return -1;
    }
    if (target < 0) return -1;

    // Backwards only inside bytes we still hold
    bool history_covers = self->stream_offset_ == static_cast<sf_count_t>(self->history_.size());
    if (target <= self->stream_offset_) {
        if (target < self->position_ && !history_covers) return -1;
        self->position_ = target;
        return target;
    }

    if (!self->skip_to(target)) return -1;
    return self->position_;
}

sf_count_t FLACDecoder::vio_read(void* ptr, sf_count_t count, void* user_data) {
    auto* self = static_cast<FLACDecoder*>(user_data);
    return self->pull(static_cast<unsigned char*>(ptr), count);
}

sf_count_t FLACDecoder::vio_tell(void* user_data) {
    return static_cast<FLACDecoder*>(user_data)->position_;
}

sf_count_t FLACDecoder::pull(unsigned char* dst, sf_count_t count) {
    sf_count_t copied = 0;

    // Replay header bytes first
    sf_count_t held = static_cast<sf_count_t>(history_.size());
    if (position_ < held && stream_offset_ == held) {
        sf_count_t n = std::min(count, held - position_);
        std::memcpy(dst, history_.data() + position_, static_cast<size_t>(n));
        position_ += n;
        copied += n;
    }

    while (copied < count && stream_) {
        long n = stream_->read(dst + copied, static_cast<size_t>(count - copied));
        if (n <= 0) break;
        if (recording_) {
            history_.insert(history_.end(), dst + copied, dst + copied + n);
        }
        copied += n;
        position_ += n;
        stream_offset_ += n;
    }
    return copied;
}

bool FLACDecoder::skip_to(sf_count_t target) {
    unsigned char scratch[4096];
    position_ = stream_offset_;
    while (position_ < target) {
        sf_count_t want = std::min<sf_count_t>(sizeof(scratch), target - position_);
        if (pull(scratch, want) <= 0) return false;
    }
    return true;
}

bool FLACDecoder::open(ByteStream& stream) {
    kitsune::util::Logger::debug("FLACDecoder: Opening stream");
    clear_error();

    stream_ = &stream;
    history_.clear();
    recording_ = true;
    position_ = 0;
    stream_offset_ = 0;

    SF_VIRTUAL_IO vio = {};
    vio.get_filelen = &FLACDecoder::vio_get_filelen;
    vio.seek = &FLACDecoder::vio_seek;
    vio.read = &FLACDecoder::vio_read;
    vio.write = nullptr;
    vio.tell = &FLACDecoder::vio_tell;

    std::memset(&info_, 0, sizeof(info_));
    file_ = sf_open_virtual(&vio, SFM_READ, &info_, this);
    recording_ = false;

    if (!file_) {
        set_error(std::string("flac open failed: ") + sf_strerror(nullptr));
        kitsune::util::Logger::error("FLACDecoder: " + last_error());
        stream_ = nullptr;
        history_.clear();
        return false;
    }

    sample_rate_ = info_.samplerate;
    channels_ = info_.channels;
    position_frames_ = 0;

    kitsune::util::Logger::info("FLACDecoder: Opened successfully - " +
                                std::to_string(sample_rate_) + "Hz, " +
                                std::to_string(channels_) + "ch");
    return true;
}

void FLACDecoder::close() {
    kitsune::util::Logger::debug("FLACDecoder: Closing decoder");
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
    stream_ = nullptr;
    history_.clear();
    sample_rate_ = 0;
    channels_ = 0;
    position_frames_ = 0;
}

int FLACDecoder::read_pcm(float* buffer, int max_frames) {
    if (!file_ || !buffer) {
        kitsune::util::Logger::error("FLACDecoder: Invalid state - file or buffer is null");
        return 0;
    }

    sf_count_t frames_read = sf_readf_float(file_, buffer, max_frames);
    position_frames_ += static_cast<long>(frames_read);

    if (frames_read <= 0) {
        if (stream_ && stream_->failed()) {
            set_error("flac stream interrupted");
        } else if (sf_error(file_) != SF_ERR_NO_ERROR) {
            set_error(std::string("flac decode error: ") + sf_strerror(file_));
        }
        if (has_error()) {
            kitsune::util::Logger::error("FLACDecoder: " + last_error());
        }
        return 0;
    }

    return static_cast<int>(frames_read);
}

} // namespace kitsune::audio
