#pragma once

#include <stdexcept>
#include <string>

namespace kitsune::audio {

class PlaybackError : public std::runtime_error {
public:
    explicit PlaybackError(const std::string& msg) : std::runtime_error(msg) {}
};

// The stream could not be opened: connection failure, timeout or non-success HTTP status.
class ConnectError : public PlaybackError {
public:
    explicit ConnectError(const std::string& msg) : PlaybackError(msg) {}
};

// The container or codec could not be parsed.
class DecodeError : public PlaybackError {
public:
    explicit DecodeError(const std::string& msg) : PlaybackError(msg) {}
};

} // namespace kitsune::audio
