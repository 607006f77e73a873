#pragma once

#include "audio/ByteStream.hpp"
#include <memory>
#include <string>

namespace kitsune::net {

class StreamProvider {
public:
    virtual ~StreamProvider() = default;

    // Returns an opened stream for the track, or throws audio::ConnectError.
    // An empty transcode_format asks for the original file.
    virtual std::unique_ptr<audio::ByteStream> open_stream(const std::string& track_id,
                                                           const std::string& transcode_format) = 0;
};

} // namespace kitsune::net
