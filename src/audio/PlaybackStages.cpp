#include "audio/PlaybackStages.hpp"
#include <algorithm>

namespace kitsune::audio {

int PositionTracker::read_pcm(float* buffer, int max_frames) {
    int frames = upstream_.read_pcm(buffer, max_frames);
    if (frames > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.frames_played += frames;
    }
    return frames;
}

int PauseGate::read_pcm(float* buffer, int max_frames) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.paused) {
            std::fill(buffer, buffer + static_cast<long>(max_frames) * get_channels(), 0.0f);
            return max_frames;
        }
    }
    return upstream_.read_pcm(buffer, max_frames);
}

} // namespace kitsune::audio
