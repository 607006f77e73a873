#pragma once

#include "AudioDecoder.hpp"
#include <sndfile.h>
#include <vector>

namespace kitsune::audio {

// libsndfile over a forward-only stream. Handles FLAC and WAV.
class FLACDecoder : public AudioDecoder {
public:
    FLACDecoder();
    ~FLACDecoder() override;

    [[nodiscard]] bool open(ByteStream& stream) override;
    void close() override;

    [[nodiscard]] int read_pcm(float* buffer, int max_frames) override;

    [[nodiscard]] int get_sample_rate() const override { return sample_rate_; }
    [[nodiscard]] int get_channels() const override { return channels_; }
    [[nodiscard]] long get_position_frames() const override { return position_frames_; }

    [[nodiscard]] bool is_open() const override { return file_ != nullptr; }
    const char* name() const override { return "flac"; }

private:
    static sf_count_t vio_get_filelen(void* user_data);
    static sf_count_t vio_seek(sf_count_t offset, int whence, void* user_data);
    static sf_count_t vio_read(void* ptr, sf_count_t count, void* user_data);
    static sf_count_t vio_tell(void* user_data);

    sf_count_t pull(unsigned char* dst, sf_count_t count);
    bool skip_to(sf_count_t target);

    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
    ByteStream* stream_ = nullptr;  // Non-owning

    // Bytes consumed while libsndfile parses the header, so it can seek back into them.
    std::vector<unsigned char> history_;
    bool recording_ = false;
    sf_count_t position_ = 0;         // Offset libsndfile believes it is at
    sf_count_t stream_offset_ = 0;    // Bytes actually pulled from the stream

    int sample_rate_ = 0;
    int channels_ = 0;
    long position_frames_ = 0;
};

} // namespace kitsune::audio
