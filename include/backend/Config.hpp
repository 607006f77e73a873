#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace kitsune::backend {

struct Config {
    // Server settings
    std::string server_url;
    std::string user;
    std::string password;

    // Playback settings
    int sample_rate = 44100;
    int channels = 2;
    std::string fallback_format = "mp3";
    std::vector<std::string> transcode_formats = {"m4a", "aac", "wma"};
    int stream_timeout_seconds = 30;

    // Logging
    std::filesystem::path log_path = "/tmp/kitsune_debug.log";
    std::string log_level = "debug";

    // Command name -> key
    std::unordered_map<std::string, std::string> keybinds;
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static void save_config(const Config& cfg, const std::filesystem::path& path);
    static void apply_env_overrides(Config& cfg);

    static std::filesystem::path get_config_file();
    static Config create_default_config();
};

std::vector<std::string> split_list(const std::string& value);

}  // namespace kitsune::backend
