#include "backend/Queue.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <utility>

namespace kitsune::backend {

Queue::Queue() {}

void Queue::replace(std::vector<model::Track> tracks, int start_index) {
    kitsune::util::Logger::info("Queue: Replacing contents (" + std::to_string(tracks.size()) +
                                " tracks, start=" + std::to_string(start_index) + ")");

    tracks_ = std::move(tracks);
    if (tracks_.empty()) {
        current_ = -1;
        cursor_ = 0;
        return;
    }

    int last = static_cast<int>(tracks_.size()) - 1;
    current_ = std::clamp(start_index, 0, last);
    cursor_ = current_;
}

void Queue::add_tracks(const std::vector<model::Track>& tracks) {
    kitsune::util::Logger::info("Queue: Appending " + std::to_string(tracks.size()) + " tracks");

    tracks_.insert(tracks_.end(), tracks.begin(), tracks.end());
}

void Queue::clear() {
    kitsune::util::Logger::info("Queue: Clearing queue");

    tracks_.clear();
    current_ = -1;
    cursor_ = 0;
}

std::optional<model::Track> Queue::current() const {
    if (current_ >= 0 && current_ < static_cast<int>(tracks_.size())) {
        return tracks_[current_];
    }
    return std::nullopt;
}

std::optional<model::Track> Queue::next() {
    kitsune::util::Logger::debug("Queue: Moving to next track");

    if (current_ + 1 < static_cast<int>(tracks_.size())) {
        current_++;
        return tracks_[current_];
    }

    // End of queue, no wraparound
    current_ = -1;
    return std::nullopt;
}

std::optional<model::Track> Queue::jump_to() {
    if (cursor_ < 0 || cursor_ >= static_cast<int>(tracks_.size())) {
        return std::nullopt;
    }

    kitsune::util::Logger::debug("Queue: Jumping to cursor " + std::to_string(cursor_));
    current_ = cursor_;
    return tracks_[current_];
}

bool Queue::remove() {
    if (cursor_ < 0 || cursor_ >= static_cast<int>(tracks_.size())) {
        return false;
    }

    kitsune::util::Logger::info("Queue: Removing track at index " + std::to_string(cursor_));

    bool removed_current = (cursor_ == current_);
    tracks_.erase(tracks_.begin() + cursor_);

    if (current_ > cursor_) {
        current_--;
    } else if (removed_current) {
        // Caller decides whether to stop or advance
        current_ = -1;
    }

    clamp();
    return removed_current;
}

void Queue::move_up() {
    if (cursor_ <= 0 || cursor_ >= static_cast<int>(tracks_.size())) {
        return;
    }

    std::swap(tracks_[cursor_], tracks_[cursor_ - 1]);
    if (current_ == cursor_) {
        current_--;
    } else if (current_ == cursor_ - 1) {
        current_++;
    }
    cursor_--;
}

void Queue::move_down() {
    if (cursor_ < 0 || cursor_ + 1 >= static_cast<int>(tracks_.size())) {
        return;
    }

    std::swap(tracks_[cursor_], tracks_[cursor_ + 1]);
    if (current_ == cursor_) {
        current_++;
    } else if (current_ == cursor_ + 1) {
        current_--;
    }
    cursor_++;
}

void Queue::cursor_up() {
    if (cursor_ > 0) {
        cursor_--;
    }
}

void Queue::cursor_down() {
    if (cursor_ + 1 < static_cast<int>(tracks_.size())) {
        cursor_++;
    }
}

void Queue::clamp() {
    int size = static_cast<int>(tracks_.size());
    if (size == 0) {
        cursor_ = 0;
        current_ = -1;
        return;
    }
    cursor_ = std::clamp(cursor_, 0, size - 1);
    if (current_ >= size) {
        current_ = -1;
    }
}

}  // namespace kitsune::backend
