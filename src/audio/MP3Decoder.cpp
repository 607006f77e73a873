#include "audio/MP3Decoder.hpp"
#include "util/Logger.hpp"
#include <cstring>

namespace kitsune::audio {

MP3Decoder::MP3Decoder() {
    kitsune::util::Logger::debug("MP3Decoder: Constructor called");
    mpg123_init();
    int err = MPG123_OK;
    handle_ = mpg123_new(nullptr, &err);
    if (!handle_) {
        kitsune::util::Logger::error("MP3Decoder: mpg123_new failed (" +
                                     std::string(mpg123_plain_strerror(err)) + ")");
    }
}

MP3Decoder::~MP3Decoder() {
    kitsune::util::Logger::debug("MP3Decoder: Destructor called");
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
}

ssize_t MP3Decoder::read_callback(void* handle, void* buffer, size_t size) {
    auto* stream = static_cast<ByteStream*>(handle);
    long n = stream->read(static_cast<unsigned char*>(buffer), size);
    return n < 0 ? -1 : static_cast<ssize_t>(n);
}

off_t MP3Decoder::seek_callback(void*, off_t, int) {
    // Network bodies are forward-only
    return -1;
}

bool MP3Decoder::open(ByteStream& stream) {
    kitsune::util::Logger::debug("MP3Decoder: Opening stream");

    if (!handle_) {
        set_error("mp3 decoder unavailable");
        kitsune::util::Logger::error("MP3Decoder: Handle is null");
        return false;
    }
    clear_error();

    mpg123_param(handle_, MPG123_ADD_FLAGS, MPG123_NO_PEEK_END | MPG123_QUIET, 0.0);

    // Decode every rate mpg123 supports to signed 16-bit
    mpg123_format_none(handle_);
    const long* rates = nullptr;
    size_t rate_count = 0;
    mpg123_rates(&rates, &rate_count);
    for (size_t i = 0; i < rate_count; ++i) {
        mpg123_format(handle_, rates[i], MPG123_MONO | MPG123_STEREO, MPG123_ENC_SIGNED_16);
    }

    if (mpg123_replace_reader_handle(handle_, &MP3Decoder::read_callback,
                                     &MP3Decoder::seek_callback, nullptr) != MPG123_OK ||
        mpg123_open_handle(handle_, &stream) != MPG123_OK) {
        set_error(std::string("mp3 open failed: ") + mpg123_strerror(handle_));
        kitsune::util::Logger::error("MP3Decoder: " + last_error());
        return false;
    }

    long rate;
    int channels, encoding;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        set_error(std::string("mp3 stream has no decodable frames: ") + mpg123_strerror(handle_));
        kitsune::util::Logger::error("MP3Decoder: " + last_error());
        mpg123_close(handle_);
        return false;
    }

    // Lock the output format so it cannot change under the pipeline
    mpg123_format_none(handle_);
    mpg123_format(handle_, rate, channels, MPG123_ENC_SIGNED_16);

    stream_ = &stream;
    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;
    position_frames_ = 0;

    kitsune::util::Logger::info("MP3Decoder: Opened successfully - " +
                                std::to_string(sample_rate_) + "Hz, " +
                                std::to_string(channels_) + "ch");
    return true;
}

void MP3Decoder::close() {
    kitsune::util::Logger::debug("MP3Decoder: Closing decoder");
    if (handle_ && stream_) {
        mpg123_close(handle_);
    }
    stream_ = nullptr;
    sample_rate_ = 0;
    channels_ = 0;
    position_frames_ = 0;
}

int MP3Decoder::read_pcm(float* buffer, int max_frames) {
    if (!handle_ || !stream_ || !buffer || max_frames <= 0) return 0;

    size_t s16_bytes_wanted = static_cast<size_t>(max_frames) * channels_ * sizeof(short);
    s16_buffer_.resize(static_cast<size_t>(max_frames) * channels_);

    size_t bytes_read = 0;
    int result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(s16_buffer_.data()),
                             s16_bytes_wanted, &bytes_read);

    if (result == MPG123_NEW_FORMAT) {
        kitsune::util::Logger::debug("MP3Decoder: Format notice mid-stream, retrying read");
        result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(s16_buffer_.data()),
                             s16_bytes_wanted, &bytes_read);
    }

    if (result == MPG123_ERR) {
        // Never use partial data from a failed read
        set_error(stream_->failed() ? "mp3 stream interrupted"
                                    : std::string("mp3 decode error: ") + mpg123_strerror(handle_));
        kitsune::util::Logger::error("MP3Decoder: " + last_error());
        return 0;
    }

    if (result == MPG123_DONE && bytes_read == 0) {
        return 0;
    }

    // Convert S16 to Float [-1.0, 1.0]
    int samples_read = static_cast<int>(bytes_read / sizeof(short));
    for (int i = 0; i < samples_read; ++i) {
        buffer[i] = s16_buffer_[i] / 32768.0f;
    }

    int frames_read = samples_read / channels_;
    position_frames_ += frames_read;
    return frames_read;
}

} // namespace kitsune::audio
