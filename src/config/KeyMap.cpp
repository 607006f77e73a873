#include "config/KeyMap.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <iterator>
#include <utility>
#include <unistd.h>

namespace kitsune::config {

KeyMap::KeyMap() {
    load_default_keybinds();
}

void KeyMap::load_default_keybinds() {
    bindings_["p"] = "play_pause";
    bindings_["n"] = "next";
    bindings_["s"] = "stop";
    bindings_["o"] = "play_selected";
    bindings_["d"] = "remove";
    bindings_["k"] = "cursor_up";
    bindings_["j"] = "cursor_down";
    bindings_["K"] = "move_up";
    bindings_["J"] = "move_down";
    bindings_["q"] = "quit";
}

void KeyMap::load_bindings(const std::unordered_map<std::string, std::string>& action_to_key) {
    for (const auto& [action, key] : action_to_key) {
        if (key.empty()) continue;
        if (action != "quit" && !action_to_event(action)) {
            util::Logger::warn("KeyMap: Unknown action '" + action + "'");
            continue;
        }
        // Drop the default key for this action
        for (auto it = bindings_.begin(); it != bindings_.end();) {
            it = (it->second == action) ? bindings_.erase(it) : std::next(it);
        }
        add_binding(action, key);
    }
}

void KeyMap::add_binding(const std::string& action, const std::string& key_sequence) {
    bindings_[key_sequence] = action;
}

std::string KeyMap::lookup_action(const std::string& key_sequence) const {
    auto it = bindings_.find(key_sequence);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

bool CommandReader::read_available(std::vector<std::string>& lines) {
    char buf[256];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return true;
        }
        util::Logger::error("CommandReader: read failed: errno=" + std::to_string(errno));
        return false;
    }
    if (n == 0) {
        // Last line without a newline still counts
        if (!pending_.empty()) {
            lines.push_back(std::move(pending_));
            pending_.clear();
        }
        return false;
    }
    auto complete = feed(buf, static_cast<size_t>(n));
    lines.insert(lines.end(), std::make_move_iterator(complete.begin()), std::make_move_iterator(complete.end()));
    return true;
}

std::vector<std::string> CommandReader::feed(const char* data, size_t size) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < size; ++i) {
        char c = data[i];
        if (c == '\n') {
            lines.push_back(std::move(pending_));
            pending_.clear();
        } else if (c != '\r') {
            pending_.push_back(c);
        }
    }
    return lines;
}

std::optional<events::Event::Type> action_to_event(const std::string& action) {
    using Type = events::Event::Type;
    static const std::unordered_map<std::string, Type> actions = {
        {"play_pause", Type::PlayPause},
        {"next", Type::NextTrack},
        {"stop", Type::Stop},
        {"play_selected", Type::PlaySelected},
        {"remove", Type::RemoveSelected},
        {"cursor_up", Type::CursorUp},
        {"cursor_down", Type::CursorDown},
        {"move_up", Type::MoveUp},
        {"move_down", Type::MoveDown},
    };
    auto it = actions.find(action);
    if (it == actions.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace kitsune::config
