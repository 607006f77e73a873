#pragma once

#include "net/Notifier.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace kitsune::net {

class SubsonicClient;

// Queues announcements and delivers them from a worker thread. Failed
// deliveries are logged and dropped.
class ScrobbleNotifier : public Notifier {
public:
    // Throws on delivery failure; the worker logs and drops.
    using Sender = std::function<void(const std::string& track_id, bool submission)>;

    explicit ScrobbleNotifier(SubsonicClient& client);
    explicit ScrobbleNotifier(Sender sender);
    ~ScrobbleNotifier() override;

    void announce_playing(const std::string& track_id) override;
    void announce_scrobble(const std::string& track_id) override;

    size_t pending() const;

private:
    struct Job {
        std::string track_id;
        bool submission = false;
    };

    void enqueue(Job job);
    void run(std::stop_token stop);

    Sender sender_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> jobs_;
    std::jthread worker_;
};

} // namespace kitsune::net
