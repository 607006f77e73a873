#include "net/ScrobbleNotifier.hpp"
#include "net/SubsonicClient.hpp"
#include "util/Logger.hpp"

namespace kitsune::net {

ScrobbleNotifier::ScrobbleNotifier(SubsonicClient& client)
    : ScrobbleNotifier(Sender([&client](const std::string& track_id, bool submission) {
          client.scrobble(track_id, submission);
      })) {
}

ScrobbleNotifier::ScrobbleNotifier(Sender sender)
    : sender_(std::move(sender)),
      worker_([this](std::stop_token stop) { run(stop); }) {
}

ScrobbleNotifier::~ScrobbleNotifier() {
    worker_.request_stop();
    cv_.notify_all();
}

void ScrobbleNotifier::announce_playing(const std::string& track_id) {
    enqueue({track_id, false});
}

void ScrobbleNotifier::announce_scrobble(const std::string& track_id) {
    enqueue({track_id, true});
}

size_t ScrobbleNotifier::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void ScrobbleNotifier::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void ScrobbleNotifier::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait(lock, stop, [this] { return !jobs_.empty(); })) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        const char* kind = job.submission ? "scrobble" : "now playing";
        try {
            sender_(job.track_id, job.submission);
            kitsune::util::Logger::debug(std::string("ScrobbleNotifier: Sent ") + kind + " for " + job.track_id);
        } catch (const std::exception& e) {
            kitsune::util::Logger::warn(std::string("ScrobbleNotifier: ") + kind + " for " + job.track_id +
                                        " failed: " + e.what());
        }
    }
}

} // namespace kitsune::net
