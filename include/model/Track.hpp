#pragma once

#include <cstdint>
#include <string>

namespace kitsune::model {

enum class PlaybackState {
    Idle,
    Loading,
    Playing,
    Paused,
    Ended,
};

// A queued track as delivered by the catalog. Never mutated once queued.
struct Track {
    std::string id;
    std::string title;
    std::string artist;
    std::string album;
    std::string album_id;
    int year = 0;
    int duration_ms = 0;

    // Lowercase source container/codec label from the server ("mp3", "flac", "m4a").
    std::string format;

    bool operator==(const Track&) const = default;
};

/// Snapshot of the track a playback session was started for.
/// Lives exactly as long as the session; every play() replaces it.
struct NowPlaying {
    Track track;
    uint64_t session_id = 0;

    bool operator==(const NowPlaying&) const = default;
};

inline const char* to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::Idle: return "idle";
        case PlaybackState::Loading: return "loading";
        case PlaybackState::Playing: return "playing";
        case PlaybackState::Paused: return "paused";
        case PlaybackState::Ended: return "ended";
    }
    return "unknown";
}

}  // namespace kitsune::model
