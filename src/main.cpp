#include "audio/DecoderFactory.hpp"
#include "audio/PipeWireContext.hpp"
#include "audio/PipeWireSink.hpp"
#include "audio/PlaybackController.hpp"
#include "backend/Config.hpp"
#include "backend/Queue.hpp"
#include "collectors/PlaybackOrchestrator.hpp"
#include "config/KeyMap.hpp"
#include "net/HttpStream.hpp"
#include "net/ScrobbleNotifier.hpp"
#include "net/SubsonicClient.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <poll.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true);
}

std::string format_time(double seconds) {
    int total = static_cast<int>(seconds);
    return std::format("{}:{:02}", total / 60, total % 60);
}

void print_status(const kitsune::audio::PlaybackController& controller, const kitsune::backend::Queue& queue) {
    auto now = controller.current();
    std::string line;
    if (now) {
        const auto& track = now->track;
        line = std::format("[{}] {}/{} {} - {} {}/{}",
                           kitsune::model::to_string(controller.state()),
                           queue.current_index() + 1, queue.len(),
                           track.artist, track.title,
                           format_time(controller.elapsed()),
                           format_time(track.duration_ms / 1000.0));
    } else {
        line = std::format("[{}] cursor {}/{}", kitsune::model::to_string(controller.state()),
                           queue.empty() ? 0 : queue.cursor() + 1, queue.len());
    }
    std::cout << "\r\033[K" << line << std::flush;
}

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <album-id> [start-index]\n"
              << "commands (one per line): p play/pause, n next, s stop, o play selected,\n"
              << "  j/k cursor down/up, J/K move down/up, d remove, q quit\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        kitsune::util::Logger::init();
        kitsune::util::Logger::info("kitsune starting...");

        auto config = kitsune::backend::ConfigLoader::load_config();
        kitsune::util::Logger::init(config.log_path.string(),
                                    kitsune::util::Logger::parse_level(config.log_level));
        kitsune::util::Logger::info("Configuration loaded");

        if (config.server_url.empty()) {
            std::cerr << "No server configured. Edit " << kitsune::backend::ConfigLoader::get_config_file()
                      << " or set KITSUNE_SERVER_URL.\n";
            return 1;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        kitsune::net::CurlGlobal curl_global;

        kitsune::audio::PipeWireContext audio_context;
        if (!audio_context.init()) {
            throw std::runtime_error("failed to initialize PipeWire context");
        }
        kitsune::audio::PipeWireSink sink;
        if (!sink.init(audio_context, config.sample_rate, config.channels)) {
            throw std::runtime_error("failed to open PipeWire stream");
        }

        kitsune::net::SubsonicClient client(config.server_url, config.user, config.password,
                                            std::chrono::seconds(config.stream_timeout_seconds));
        if (!client.ping()) {
            std::cerr << "Warning: server did not answer ping, continuing\n";
        }

        kitsune::net::ScrobbleNotifier notifier(client);
        kitsune::audio::PlaybackController controller(
            sink, kitsune::audio::default_decoder_factory(config.fallback_format));
        kitsune::backend::Queue queue;
        kitsune::collectors::PlaybackOrchestrator orchestrator(controller, queue, client, notifier,
                                                               config.transcode_formats);
        orchestrator.set_error_callback([](const std::string& message) {
            std::cout << "\r\033[K" << "error: " << message << std::endl;
        });

        std::jthread watcher([&orchestrator](std::stop_token st) { orchestrator.run(st); });

        kitsune::config::KeyMap keymap;
        keymap.load_bindings(config.keybinds);
        kitsune::config::CommandReader commands(STDIN_FILENO);

        auto tracks = client.get_album(argv[1]);
        int start_index = argc > 2 ? std::atoi(argv[2]) : 0;
        std::cout << "Loaded " << tracks.size() << " tracks\n";
        orchestrator.play_tracks(std::move(tracks), start_index);

        while (!g_shutdown.load()) {
            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, 1, 250);

            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                kitsune::util::Logger::error("Poll failed: errno=" + std::to_string(errno));
                break;
            }

            bool input_open = true;
            if (ret > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
                std::vector<std::string> lines;
                input_open = commands.read_available(lines);
                for (const auto& line : lines) {
                    std::string action = keymap.lookup_action(line);
                    if (action == "quit") {
                        input_open = false;
                        break;
                    }
                    if (auto type = kitsune::config::action_to_event(action)) {
                        orchestrator.post(kitsune::events::Event{*type, {}});
                    } else if (!line.empty()) {
                        kitsune::util::Logger::debug("Main: Unbound key '" + line + "'");
                    }
                }
            }
            orchestrator.process_pending();
            print_status(controller, queue);
            if (!input_open) {
                break;
            }
        }

        std::cout << "\n";
        kitsune::util::Logger::info("Shutting down...");

        watcher.request_stop();
        watcher.join();
        orchestrator.stop();
        sink.close();

        kitsune::util::Logger::info("kitsune shutdown");
        return 0;
    } catch (const std::exception& e) {
        kitsune::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
