#pragma once

#include "events/EventQueue.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kitsune::config {

class KeyMap {
public:
    KeyMap();

    void load_default_keybinds();
    // Config stores action -> key
    void load_bindings(const std::unordered_map<std::string, std::string>& action_to_key);
    void add_binding(const std::string& action, const std::string& key_sequence);
    std::string lookup_action(const std::string& key_sequence) const;

private:
    std::unordered_map<std::string, std::string> bindings_;
};

// Splits raw input from a file descriptor into command lines.
class CommandReader {
public:
    explicit CommandReader(int fd) : fd_(fd) {}

    // One read() of whatever the fd has ready. Complete lines are appended to
    // `lines`; returns false once the input is closed or unreadable.
    bool read_available(std::vector<std::string>& lines);

    // Buffers raw bytes and returns the lines they complete.
    std::vector<std::string> feed(const char* data, size_t size);

private:
    int fd_;
    std::string pending_;
};

// Orchestrator command for an action name; nullopt for "quit" and unknown actions.
std::optional<events::Event::Type> action_to_event(const std::string& action);

}  // namespace kitsune::config
