#include "../framework/SimpleTest.hpp"
#include "net/ScrobbleNotifier.hpp"
#include "net/SubsonicClient.hpp"
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace kitsune;
using namespace std::chrono_literals;

TEST_CASE(test_build_url_appends_credentials) {
    net::SubsonicClient client("http://host:4533/", "al ice", "p&w");
    std::string url = client.build_url("getAlbum", {{"id", "42"}});

    ASSERT_EQ(url.rfind("http://host:4533/rest/getAlbum.view?id=42&", 0), 0u);
    ASSERT_TRUE(url.find("u=al%20ice") != std::string::npos);
    ASSERT_TRUE(url.find("p=p%26w") != std::string::npos);
    ASSERT_TRUE(url.find("v=1.16.1") != std::string::npos);
    ASSERT_TRUE(url.find("c=kitsune") != std::string::npos);
    ASSERT_TRUE(url.find("f=json") != std::string::npos);
}

TEST_CASE(test_stream_url_format_parameter) {
    net::SubsonicClient client("http://host", "u", "p");
    ASSERT_TRUE(client.stream_url("7", "mp3").find("format=mp3") != std::string::npos);
    ASSERT_TRUE(client.stream_url("7").find("format=") == std::string::npos);
    ASSERT_TRUE(client.stream_url("7").find("/rest/stream.view?id=7") != std::string::npos);
}

TEST_CASE(test_parse_album_maps_songs) {
    auto response = nlohmann::json::parse(R"({
        "status": "ok",
        "album": {
            "id": "al-9", "name": "Blue Train", "artist": "John Coltrane", "year": 1957,
            "song": [
                {"id": "s1", "title": "Blue Train", "duration": 643, "suffix": "FLAC", "year": 1958},
                {"id": "s2", "title": "Moment's Notice", "artist": "Coltrane Sextet",
                 "album": "Blue Train", "albumId": "al-9", "duration": 550, "suffix": "m4a"}
            ]
        }
    })");

    auto tracks = net::SubsonicClient::parse_album(response);
    ASSERT_EQ(tracks.size(), 2u);
    ASSERT_EQ(tracks[0].id, std::string("s1"));
    ASSERT_EQ(tracks[0].artist, std::string("John Coltrane"));
    ASSERT_EQ(tracks[0].album, std::string("Blue Train"));
    ASSERT_EQ(tracks[0].album_id, std::string("al-9"));
    ASSERT_EQ(tracks[0].year, 1958);
    ASSERT_EQ(tracks[0].duration_ms, 643000);
    ASSERT_EQ(tracks[0].format, std::string("flac"));
    ASSERT_EQ(tracks[1].artist, std::string("Coltrane Sextet"));
    ASSERT_EQ(tracks[1].year, 1957);
    ASSERT_EQ(tracks[1].format, std::string("m4a"));
}

TEST_CASE(test_parse_album_without_songs) {
    auto response = nlohmann::json::parse(R"({"status": "ok", "album": {"id": "x", "name": "Empty"}})");
    ASSERT_TRUE(net::SubsonicClient::parse_album(response).empty());
}

TEST_CASE(test_parse_album_rejects_missing_album) {
    auto response = nlohmann::json::parse(R"({"status": "ok"})");
    ASSERT_THROWS(net::SubsonicClient::parse_album(response), net::CatalogError);
}

namespace {

struct SentLog {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<std::string, bool>> sent;

    bool wait_for_count(size_t count) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, 2s, [&] { return sent.size() >= count; });
    }
};

}  // namespace

TEST_CASE(test_notifier_delivers_in_order) {
    SentLog log;
    net::ScrobbleNotifier notifier([&log](const std::string& id, bool submission) {
        std::lock_guard<std::mutex> lock(log.mutex);
        log.sent.emplace_back(id, submission);
        log.cv.notify_all();
    });

    notifier.announce_playing("t1");
    notifier.announce_scrobble("t1");
    notifier.announce_playing("t2");

    ASSERT_TRUE(log.wait_for_count(3));
    std::lock_guard<std::mutex> lock(log.mutex);
    ASSERT_EQ(log.sent[0].first, std::string("t1"));
    ASSERT_FALSE(log.sent[0].second);
    ASSERT_TRUE(log.sent[1].second);
    ASSERT_EQ(log.sent[2].first, std::string("t2"));
}

TEST_CASE(test_notifier_survives_failing_sender) {
    SentLog log;
    net::ScrobbleNotifier notifier([&log](const std::string& id, bool submission) {
        if (id == "bad") {
            throw std::runtime_error("server unreachable");
        }
        std::lock_guard<std::mutex> lock(log.mutex);
        log.sent.emplace_back(id, submission);
        log.cv.notify_all();
    });

    notifier.announce_scrobble("bad");
    notifier.announce_scrobble("good");
    ASSERT_TRUE(log.wait_for_count(1));
    std::lock_guard<std::mutex> lock(log.mutex);
    ASSERT_EQ(log.sent[0].first, std::string("good"));
}

TEST_CASE(test_notifier_never_blocks_caller) {
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    net::ScrobbleNotifier notifier([released](const std::string&, bool) { released.wait(); });

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 100; ++i) {
        notifier.announce_playing("t" + std::to_string(i));
    }
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1s);
    ASSERT_TRUE(notifier.pending() > 0);
    release.set_value();
}

int main(int argc, char** argv) {
    return kitsune::test::TestRunner::instance().run_all(argc, argv);
}
