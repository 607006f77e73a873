#pragma once

#include "model/Track.hpp"
#include <optional>
#include <vector>

namespace kitsune::backend {

/// Ordered playback queue with two independent positions:
/// current is the entry assigned to playback (-1 when nothing plays),
/// cursor is the on-screen selection and always a valid index when non-empty.
class Queue {
public:
    Queue();

    void replace(std::vector<model::Track> tracks, int start_index);
    void add_tracks(const std::vector<model::Track>& tracks);
    void clear();

    std::optional<model::Track> current() const;
    std::optional<model::Track> next();
    std::optional<model::Track> jump_to();

    // Returns true when the removed entry was the one playing.
    bool remove();
    void move_up();
    void move_down();

    void cursor_up();
    void cursor_down();

    const std::vector<model::Track>& tracks() const { return tracks_; }
    size_t len() const { return tracks_.size(); }
    bool empty() const { return tracks_.empty(); }
    int current_index() const { return current_; }
    int cursor() const { return cursor_; }

private:
    void clamp();

    std::vector<model::Track> tracks_;
    int current_ = -1;
    int cursor_ = 0;
};

}  // namespace kitsune::backend
