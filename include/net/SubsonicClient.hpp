#pragma once

#include "model/Track.hpp"
#include "net/StreamProvider.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kitsune::net {

class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Client for a Subsonic-compatible server (Navidrome and friends).
/// Requests are plain GETs against <base>/rest/<endpoint>.view with the
/// credentials in the query string.
class SubsonicClient : public StreamProvider {
public:
    using Params = std::vector<std::pair<std::string, std::string>>;

    static constexpr const char* kApiVersion = "1.16.1";
    static constexpr const char* kClientName = "kitsune";

    SubsonicClient(std::string base_url, std::string user, std::string password,
                   std::chrono::seconds timeout = std::chrono::seconds(30));

    std::string build_url(const std::string& endpoint, const Params& params = {}) const;
    std::string stream_url(const std::string& track_id, const std::string& format = "") const;

    std::unique_ptr<audio::ByteStream> open_stream(const std::string& track_id,
                                                   const std::string& transcode_format) override;

    bool ping() const;
    std::vector<model::Track> get_album(const std::string& album_id) const;

    // submission=false reports "now playing", true records a completed play.
    void scrobble(const std::string& track_id, bool submission) const;

    static std::vector<model::Track> parse_album(const nlohmann::json& response);

private:
    nlohmann::json get(const std::string& endpoint, const Params& params) const;

    std::string base_url_;
    std::string user_;
    std::string password_;
    std::chrono::seconds timeout_;
};

std::string url_escape(const std::string& value);

} // namespace kitsune::net
