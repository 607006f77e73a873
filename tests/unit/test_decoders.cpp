#include "../framework/SimpleTest.hpp"
#include "audio/FLACDecoder.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/OGGDecoder.hpp"
#include "audio/Resampler.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

using namespace kitsune;

namespace {

// Serves a byte buffer in chunks of at most `chunk` bytes.
class MemoryStream : public audio::ByteStream {
public:
    explicit MemoryStream(std::vector<unsigned char> data, size_t chunk = 0)
        : data_(std::move(data)), chunk_(chunk) {}

    long read(unsigned char* buffer, size_t size) override {
        if (offset_ >= data_.size()) return 0;
        size_t n = std::min(size, data_.size() - offset_);
        if (chunk_ > 0) n = std::min(n, chunk_);
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        return static_cast<long>(n);
    }

    void cancel() override {}
    void close() override {}
    bool failed() const override { return false; }

    long long content_length() const override { return static_cast<long long>(data_.size()); }

private:
    std::vector<unsigned char> data_;
    size_t chunk_;
    size_t offset_ = 0;
};

void put_u32(std::vector<unsigned char>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<unsigned char>((v >> (8 * i)) & 0xff));
}

void put_u16(std::vector<unsigned char>& out, uint16_t v) {
    out.push_back(static_cast<unsigned char>(v & 0xff));
    out.push_back(static_cast<unsigned char>((v >> 8) & 0xff));
}

void put_tag(std::vector<unsigned char>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// 16-bit PCM WAV with every sample set to `value`.
std::vector<unsigned char> make_wav(int rate, int channels, int frames, int16_t value) {
    uint32_t block_align = static_cast<uint32_t>(channels) * 2;
    uint32_t data_size = static_cast<uint32_t>(frames) * block_align;

    std::vector<unsigned char> out;
    put_tag(out, "RIFF");
    put_u32(out, 36 + data_size);
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1);
    put_u16(out, static_cast<uint16_t>(channels));
    put_u32(out, static_cast<uint32_t>(rate));
    put_u32(out, static_cast<uint32_t>(rate) * block_align);
    put_u16(out, static_cast<uint16_t>(block_align));
    put_u16(out, 16);
    put_tag(out, "data");
    put_u32(out, data_size);
    for (int i = 0; i < frames * channels; ++i) {
        put_u16(out, static_cast<uint16_t>(value));
    }
    return out;
}

std::vector<unsigned char> text_bytes(size_t size) {
    std::string junk;
    while (junk.size() < size) junk += "this is a playlist, not audio\n";
    return std::vector<unsigned char>(junk.begin(), junk.begin() + static_cast<long>(size));
}

long decode_all(audio::AudioDecoder& decoder, std::vector<float>& first_buffer) {
    std::vector<float> buffer(256 * static_cast<size_t>(decoder.get_channels()));
    long total = 0;
    int n;
    while ((n = decoder.read_pcm(buffer.data(), 256)) > 0) {
        if (total == 0) first_buffer.assign(buffer.begin(), buffer.begin() + n * decoder.get_channels());
        total += n;
    }
    return total;
}

// Constant-valued upstream at a fixed format.
class ConstantSource : public audio::FrameSource {
public:
    ConstantSource(int rate, int channels, long frames) : rate_(rate), channels_(channels), remaining_(frames) {}

    int read_pcm(float* buffer, int max_frames) override {
        int n = static_cast<int>(std::min<long>(max_frames, remaining_));
        std::fill(buffer, buffer + static_cast<long>(n) * channels_, 0.25f);
        remaining_ -= n;
        return n;
    }

    int get_sample_rate() const override { return rate_; }
    int get_channels() const override { return channels_; }

private:
    int rate_;
    int channels_;
    long remaining_;
};

}  // namespace

TEST_CASE(test_wav_stream_decodes_to_float) {
    MemoryStream stream(make_wav(22050, 1, 1000, 16384));
    audio::FLACDecoder decoder;
    ASSERT_EQ(std::string(decoder.name()), std::string("flac"));
    ASSERT_TRUE(decoder.open(stream));
    ASSERT_TRUE(decoder.is_open());
    ASSERT_EQ(decoder.get_sample_rate(), 22050);
    ASSERT_EQ(decoder.get_channels(), 1);

    std::vector<float> first;
    ASSERT_EQ(decode_all(decoder, first), 1000L);
    ASSERT_FALSE(first.empty());
    ASSERT_NEAR(first[0], 0.5f, 1e-4f);
    ASSERT_FALSE(decoder.has_error());
    ASSERT_EQ(decoder.get_position_frames(), 1000L);
    ASSERT_EQ(decoder.get_position_ms(), 45L);

    decoder.close();
    ASSERT_FALSE(decoder.is_open());
}

TEST_CASE(test_wav_header_split_across_small_reads) {
    MemoryStream stream(make_wav(48000, 2, 4800, -8192), 7);
    audio::FLACDecoder decoder;
    ASSERT_TRUE(decoder.open(stream));
    ASSERT_EQ(decoder.get_sample_rate(), 48000);
    ASSERT_EQ(decoder.get_channels(), 2);

    std::vector<float> first;
    ASSERT_EQ(decode_all(decoder, first), 4800L);
    ASSERT_NEAR(first[0], -0.25f, 1e-4f);
    ASSERT_NEAR(first[1], -0.25f, 1e-4f);
    ASSERT_FALSE(decoder.has_error());
}

TEST_CASE(test_flac_decoder_rejects_non_audio) {
    MemoryStream stream(text_bytes(2048));
    audio::FLACDecoder decoder;
    ASSERT_FALSE(decoder.open(stream));
    ASSERT_TRUE(decoder.has_error());
    ASSERT_FALSE(decoder.is_open());
}

TEST_CASE(test_ogg_decoder_rejects_non_ogg) {
    MemoryStream stream(text_bytes(8192));
    audio::OGGDecoder decoder;
    ASSERT_EQ(std::string(decoder.name()), std::string("ogg"));
    ASSERT_FALSE(decoder.open(stream));
    ASSERT_TRUE(decoder.has_error());
    ASSERT_TRUE(decoder.last_error().rfind("ogg open failed", 0) == 0);
    ASSERT_FALSE(decoder.is_open());
}

TEST_CASE(test_mp3_decoder_rejects_stream_without_frames) {
    MemoryStream stream(text_bytes(8192));
    audio::MP3Decoder decoder;
    ASSERT_EQ(std::string(decoder.name()), std::string("mp3"));
    ASSERT_FALSE(decoder.open(stream));
    ASSERT_TRUE(decoder.has_error());
    ASSERT_FALSE(decoder.is_open());
}

TEST_CASE(test_resampler_converts_rate_and_channels) {
    ConstantSource upstream(22050, 1, 22050);
    audio::Resampler resampler(upstream, 44100, 2);
    ASSERT_TRUE(resampler.init());
    ASSERT_EQ(resampler.get_sample_rate(), 44100);
    ASSERT_EQ(resampler.get_channels(), 2);

    std::vector<float> buffer(1024 * 2);
    long total = 0;
    bool audible = false;
    int n;
    while ((n = resampler.read_pcm(buffer.data(), 1024)) > 0) {
        ASSERT_TRUE(n <= 1024);
        if (std::any_of(buffer.begin(), buffer.begin() + n * 2, [](float s) { return s != 0.0f; })) {
            audible = true;
        }
        total += n;
    }
    ASSERT_NEAR(static_cast<double>(total), 44100.0, 512.0);
    ASSERT_TRUE(audible);
    ASSERT_EQ(resampler.read_pcm(buffer.data(), 1024), 0);
}

TEST_CASE(test_resampler_downsamples) {
    ConstantSource upstream(48000, 2, 48000);
    audio::Resampler resampler(upstream, 44100, 2);
    ASSERT_TRUE(resampler.init());

    std::vector<float> buffer(512 * 2);
    long total = 0;
    int n;
    while ((n = resampler.read_pcm(buffer.data(), 512)) > 0) {
        total += n;
    }
    ASSERT_NEAR(static_cast<double>(total), 44100.0, 512.0);
}

TEST_CASE(test_resampler_rejects_unknown_upstream_format) {
    ConstantSource upstream(0, 0, 0);
    audio::Resampler resampler(upstream, 44100, 2);
    ASSERT_FALSE(resampler.init());
    float buffer[16];
    ASSERT_EQ(resampler.read_pcm(buffer, 8), 0);
}

int main(int argc, char** argv) {
    return kitsune::test::TestRunner::instance().run_all(argc, argv);
}
