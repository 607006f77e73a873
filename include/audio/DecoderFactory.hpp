#pragma once

#include "audio/AudioDecoder.hpp"
#include <functional>
#include <memory>
#include <string>

namespace kitsune::audio {

using DecoderFactory = std::function<std::unique_ptr<AudioDecoder>(const std::string& format)>;

// True for labels with a dedicated decoder ("mp3", "flac", "wav", "ogg", "oga").
bool has_native_decoder(const std::string& format);

// Anything without a native decoder is assumed to have been transcoded by the
// server and is decoded as `fallback_format`.
std::unique_ptr<AudioDecoder> create_decoder(const std::string& format,
                                             const std::string& fallback_format = "mp3");

DecoderFactory default_decoder_factory(std::string fallback_format = "mp3");

std::string to_lower(std::string value);

} // namespace kitsune::audio
