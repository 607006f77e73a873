#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace kitsune::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Out-of-range or malformed numbers keep the default
void parse_int(const std::string& key, const std::string& value, int min, int max, int& out) {
    try {
        int parsed = std::stoi(value);
        if (parsed < min || parsed > max) {
            util::Logger::warn("Config: " + key + " out of range: " + value);
            return;
        }
        out = parsed;
    } catch (const std::exception&) {
        util::Logger::warn("Config: Invalid number for " + key + ": " + value);
    }
}

std::string join_list(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ',';
        out += item;
    }
    return out;
}

}  // namespace

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(pos, comma - pos));
        if (!item.empty()) items.push_back(item);
        pos = comma + 1;
    }
    return items;
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    Config cfg;
    if (std::filesystem::exists(config_file)) {
        cfg = load_from_file(config_file);
    } else {
        util::Logger::info("Config: No config at " + config_file.string() + ", writing defaults");
        cfg = create_default_config();
        save_config(cfg, config_file);
    }

    apply_env_overrides(cfg);
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) return cfg;

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "server") {
            if (key == "url") cfg.server_url = value;
            else if (key == "user") cfg.user = value;
            else if (key == "password") cfg.password = value;
        }
        else if (current_section == "playback") {
            if (key == "sample_rate") parse_int(key, value, 8000, 384000, cfg.sample_rate);
            else if (key == "channels") parse_int(key, value, 1, 8, cfg.channels);
            else if (key == "fallback_format" && !value.empty()) cfg.fallback_format = value;
            else if (key == "transcode_formats") cfg.transcode_formats = split_list(value);
            else if (key == "stream_timeout_seconds") parse_int(key, value, 1, 3600, cfg.stream_timeout_seconds);
        }
        else if (current_section == "log") {
            if (key == "path" && !value.empty()) cfg.log_path = value;
            else if (key == "level") cfg.log_level = value;
        }
        else if (current_section == "keybinds") {
            cfg.keybinds[key] = value;
        }
    }

    return cfg;
}

void ConfigLoader::apply_env_overrides(Config& cfg) {
    if (const char* url = std::getenv("KITSUNE_SERVER_URL"); url && *url) cfg.server_url = url;
    if (const char* user = std::getenv("KITSUNE_USER"); user && *user) cfg.user = user;
    if (const char* password = std::getenv("KITSUNE_PASSWORD"); password && *password) cfg.password = password;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        util::Logger::warn("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return;
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot write " + path.string());
        return;
    }

    auto key_or = [&cfg](const std::string& name, const std::string& fallback) {
        auto it = cfg.keybinds.find(name);
        return it != cfg.keybinds.end() ? it->second : fallback;
    };

    file << "# kitsune config\n";
    file << "# Generated on first run; edit with care\n\n";

    file << "[server]\n";
    file << "# Subsonic-compatible server, e.g. \"https://music.example.com\"\n";
    file << "url = \"" << cfg.server_url << "\"\n";
    file << "user = \"" << cfg.user << "\"\n";
    file << "password = \"" << cfg.password << "\"\n\n";

    file << "[playback]\n";
    file << "# Output format of the audio device\n";
    file << "sample_rate = " << cfg.sample_rate << "\n";
    file << "channels = " << cfg.channels << "\n\n";
    file << "# Decoder used for formats without a native decoder\n";
    file << "fallback_format = \"" << cfg.fallback_format << "\"\n\n";
    file << "# Formats the server is asked to transcode to mp3\n";
    file << "transcode_formats = \"" << join_list(cfg.transcode_formats) << "\"\n\n";
    file << "stream_timeout_seconds = " << cfg.stream_timeout_seconds << "\n\n";

    file << "[log]\n";
    file << "path = \"" << cfg.log_path.string() << "\"\n";
    file << "# One of: debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n\n";

    file << "[keybinds]\n";
    file << "play_pause = \"" << key_or("play_pause", "p") << "\"\n";
    file << "next = \"" << key_or("next", "n") << "\"\n";
    file << "stop = \"" << key_or("stop", "s") << "\"\n";
    file << "play_selected = \"" << key_or("play_selected", "o") << "\"\n";
    file << "remove = \"" << key_or("remove", "d") << "\"\n";
    file << "cursor_up = \"" << key_or("cursor_up", "k") << "\"\n";
    file << "cursor_down = \"" << key_or("cursor_down", "j") << "\"\n";
    file << "move_up = \"" << key_or("move_up", "K") << "\"\n";
    file << "move_down = \"" << key_or("move_down", "J") << "\"\n";
    file << "quit = \"" << key_or("quit", "q") << "\"\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "kitsune" / "config.toml";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "kitsune" / "config.toml";
    }
    return ".config/kitsune/config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.keybinds["play_pause"] = "p";
    cfg.keybinds["next"] = "n";
    cfg.keybinds["stop"] = "s";
    cfg.keybinds["play_selected"] = "o";
    cfg.keybinds["remove"] = "d";
    cfg.keybinds["cursor_up"] = "k";
    cfg.keybinds["cursor_down"] = "j";
    cfg.keybinds["move_up"] = "K";
    cfg.keybinds["move_down"] = "J";
    cfg.keybinds["quit"] = "q";
    return cfg;
}

}  // namespace kitsune::backend
