#pragma once

#include "audio/ByteStream.hpp"
#include "audio/FrameSource.hpp"
#include <string>

namespace kitsune::audio {

class AudioDecoder : public FrameSource {
public:
    ~AudioDecoder() override = default;

    // Reads far enough into the stream to learn the output format.
    virtual bool open(ByteStream& stream) = 0;
    virtual void close() = 0;

    virtual long get_position_frames() const = 0;
    virtual bool is_open() const = 0;

    // Set when read_pcm() stopped because of a decode or transport failure
    // rather than a clean end of stream.
    bool has_error() const { return !error_.empty(); }
    const std::string& last_error() const { return error_; }

    virtual const char* name() const = 0;

    long get_position_ms() const {
        if (get_sample_rate() == 0) return 0;
        return (get_position_frames() * 1000) / get_sample_rate();
    }

protected:
    void set_error(const std::string& error) { error_ = error; }
    void clear_error() { error_.clear(); }

private:
    std::string error_;
};

} // namespace kitsune::audio
