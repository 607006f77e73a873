#pragma once

#include <cstddef>

namespace kitsune::audio {

// Readable byte source backing one playback session (usually an HTTP body).
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Blocks until data is available.
    // Returns bytes copied, 0 at a clean end of stream, -1 on failure or after cancel().
    virtual long read(unsigned char* buffer, size_t size) = 0;

    // Safe to call from any thread; wakes a blocked read().
    virtual void cancel() = 0;
    virtual void close() = 0;

    virtual bool failed() const = 0;

    // -1 when the length is not known up front.
    virtual long long content_length() const { return -1; }
};

} // namespace kitsune::audio
