#include "net/SubsonicClient.hpp"
#include "net/HttpStream.hpp"
#include "audio/DecoderFactory.hpp"
#include "util/Logger.hpp"
#include <curl/curl.h>
#include <memory>

namespace kitsune::net {

std::string url_escape(const std::string& value) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return value;
    }
    char* encoded = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length()));
    if (!encoded) {
        return value;
    }
    std::string result(encoded);
    curl_free(encoded);
    return result;
}

SubsonicClient::SubsonicClient(std::string base_url, std::string user, std::string password,
                               std::chrono::seconds timeout)
    : base_url_(std::move(base_url)),
      user_(std::move(user)),
      password_(std::move(password)),
      timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string SubsonicClient::build_url(const std::string& endpoint, const Params& params) const {
    std::string url = base_url_ + "/rest/" + endpoint + ".view?";

    Params all = params;
    all.emplace_back("u", user_);
    all.emplace_back("p", password_);
    all.emplace_back("v", kApiVersion);
    all.emplace_back("c", kClientName);
    all.emplace_back("f", "json");

    bool first = true;
    for (const auto& [key, value] : all) {
        if (!first) url += '&';
        url += url_escape(key) + "=" + url_escape(value);
        first = false;
    }
    return url;
}

std::string SubsonicClient::stream_url(const std::string& track_id, const std::string& format) const {
    Params params = {{"id", track_id}};
    if (!format.empty()) {
        params.emplace_back("format", format);
    }
    return build_url("stream", params);
}

std::unique_ptr<audio::ByteStream> SubsonicClient::open_stream(const std::string& track_id,
                                                               const std::string& transcode_format) {
    kitsune::util::Logger::debug("SubsonicClient: Opening stream for " + track_id +
                                 (transcode_format.empty() ? "" : " as " + transcode_format));

    auto stream = std::make_unique<HttpStream>(stream_url(track_id, transcode_format), timeout_);
    stream->open();
    return stream;
}

nlohmann::json SubsonicClient::get(const std::string& endpoint, const Params& params) const {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw CatalogError(endpoint + ": curl_easy_init failed");
    }

    std::string url = build_url(endpoint, params);
    std::string body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
                     +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
                         static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
                         return size * nmemb;
                     });
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "kitsune/1.0");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw CatalogError(endpoint + ": request failed: " + curl_easy_strerror(res));
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (code != 200) {
        throw CatalogError(endpoint + ": unexpected status: " + std::to_string(code));
    }

    nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.contains("subsonic-response")) {
        throw CatalogError(endpoint + ": malformed response");
    }

    const nlohmann::json& response = doc["subsonic-response"];
    if (response.value("status", "") != "ok") {
        if (response.contains("error")) {
            const auto& err = response["error"];
            throw CatalogError("subsonic error " + std::to_string(err.value("code", 0)) + ": " +
                               err.value("message", std::string("unknown")));
        }
        throw CatalogError(endpoint + ": unknown API error");
    }
    return response;
}

bool SubsonicClient::ping() const {
    try {
        get("ping", {});
        return true;
    } catch (const CatalogError& e) {
        kitsune::util::Logger::warn("SubsonicClient: Ping failed: " + std::string(e.what()));
        return false;
    }
}

std::vector<model::Track> SubsonicClient::get_album(const std::string& album_id) const {
    kitsune::util::Logger::info("SubsonicClient: Fetching album " + album_id);
    return parse_album(get("getAlbum", {{"id", album_id}}));
}

std::vector<model::Track> SubsonicClient::parse_album(const nlohmann::json& response) {
    std::vector<model::Track> tracks;
    if (!response.contains("album") || !response["album"].is_object()) {
        throw CatalogError("getAlbum: response has no album");
    }

    const auto& album = response["album"];
    if (!album.contains("song")) {
        return tracks;
    }

    for (const auto& song : album["song"]) {
        model::Track track;
        track.id = song.value("id", "");
        track.title = song.value("title", "");
        track.artist = song.value("artist", album.value("artist", ""));
        track.album = song.value("album", album.value("name", ""));
        track.album_id = song.value("albumId", album.value("id", ""));
        track.year = song.value("year", album.value("year", 0));
        track.duration_ms = song.value("duration", 0) * 1000;
        track.format = audio::to_lower(song.value("suffix", ""));
        tracks.push_back(std::move(track));
    }
    return tracks;
}

void SubsonicClient::scrobble(const std::string& track_id, bool submission) const {
    get("scrobble", {{"id", track_id}, {"submission", submission ? "true" : "false"}});
}

} // namespace kitsune::net
