#pragma once

#include "AudioDecoder.hpp"
#include <vorbis/vorbisfile.h>

namespace kitsune::audio {

class OGGDecoder : public AudioDecoder {
public:
    OGGDecoder();
    ~OGGDecoder() override;

    bool open(ByteStream& stream) override;
    void close() override;

    int read_pcm(float* buffer, int max_frames) override;

    int get_sample_rate() const override { return sample_rate_; }
    int get_channels() const override { return channels_; }
    long get_position_frames() const override { return position_frames_; }

    bool is_open() const override { return is_open_; }
    const char* name() const override { return "ogg"; }

private:
    static size_t read_callback(void* ptr, size_t size, size_t nmemb, void* datasource);

    OggVorbis_File vf_{};
    ByteStream* stream_ = nullptr;  // Non-owning
    bool is_open_ = false;
    int sample_rate_ = 0;
    int channels_ = 0;
    long position_frames_ = 0;
};

} // namespace kitsune::audio
