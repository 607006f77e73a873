#include "audio/DecoderFactory.hpp"
#include "audio/MP3Decoder.hpp"
#include "audio/FLACDecoder.hpp"
#include "audio/OGGDecoder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace kitsune::audio {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool has_native_decoder(const std::string& format) {
    std::string f = to_lower(format);
    return f == "mp3" || f == "flac" || f == "wav" || f == "ogg" || f == "oga";
}

static std::unique_ptr<AudioDecoder> make_native(const std::string& format) {
    if (format == "mp3") return std::make_unique<MP3Decoder>();
    if (format == "flac" || format == "wav") return std::make_unique<FLACDecoder>();
    if (format == "ogg" || format == "oga") return std::make_unique<OGGDecoder>();
    return nullptr;
}

std::unique_ptr<AudioDecoder> create_decoder(const std::string& format, const std::string& fallback_format) {
    std::string f = to_lower(format);
    if (has_native_decoder(f)) {
        return make_native(f);
    }

    std::string fallback = to_lower(fallback_format);
    kitsune::util::Logger::debug("DecoderFactory: No native decoder for '" + f +
                                 "', decoding as " + fallback);
    return make_native(fallback);
}

DecoderFactory default_decoder_factory(std::string fallback_format) {
    return [fallback = std::move(fallback_format)](const std::string& format) {
        return create_decoder(format, fallback);
    };
}

} // namespace kitsune::audio
