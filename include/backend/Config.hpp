#pragma once

#include <string>
#include <unordered_map>
#include <filesystem>

namespace turntable::backend {

struct Config {
    // Playback settings
    int default_volume = 80;            // percent
    bool shuffle = false;
    std::string repeat = "off";         // "off" | "one"
    int tick_hz = 60;
    int seek_step_seconds = 5;
    int volume_step_percent = 10;

    // Logging
    std::filesystem::path log_file = "/tmp/turntable_debug.log";
    std::string log_level = "info";

    // Keybinds: action -> command word
    std::unordered_map<std::string, std::string> keybinds;

    // Added to the playlist at start-up when set
    std::filesystem::path music_directory;
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
};

}  // namespace turntable::backend
