#pragma once

#include <string>

namespace kitsune::net {

// Side-channel play reporting. Implementations must return immediately and
// must not throw; delivery is best effort.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void announce_playing(const std::string& track_id) = 0;
    virtual void announce_scrobble(const std::string& track_id) = 0;
};

} // namespace kitsune::net
