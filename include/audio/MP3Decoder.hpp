#pragma once

#include "AudioDecoder.hpp"
#include <mpg123.h>
#include <sys/types.h>
#include <vector>

namespace kitsune::audio {

class MP3Decoder : public AudioDecoder {
public:
    MP3Decoder();
    ~MP3Decoder() override;

    bool open(ByteStream& stream) override;
    void close() override;

    int read_pcm(float* buffer, int max_frames) override;

    int get_sample_rate() const override { return sample_rate_; }
    int get_channels() const override { return channels_; }
    long get_position_frames() const override { return position_frames_; }

    bool is_open() const override { return stream_ != nullptr; }
    const char* name() const override { return "mp3"; }

private:
    static ssize_t read_callback(void* handle, void* buffer, size_t size);
    static off_t seek_callback(void* handle, off_t offset, int whence);

    mpg123_handle* handle_ = nullptr;
    ByteStream* stream_ = nullptr;  // Non-owning
    std::vector<short> s16_buffer_;
    int sample_rate_ = 0;
    int channels_ = 0;
    long position_frames_ = 0;
};

} // namespace kitsune::audio
