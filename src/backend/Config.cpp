#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

namespace turntable::backend {

namespace {
    std::string trim(const std::string& str) {
        auto start = str.find_first_not_of(" \t\r");
        if (start == std::string::npos) return "";
        auto end = str.find_last_not_of(" \t\r");
        return str.substr(start, end - start + 1);
    }

    // Keeps the default when the value is not a number
    void parse_int(const std::string& key, const std::string& value, int& out) {
        try {
            out = std::stoi(value);
        } catch (const std::logic_error&) {
            util::Logger::warn("Config: Ignoring invalid number for " + key + ": " + value);
        }
    }
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }

    // First run: point at ~/Music so the playlist is not empty
    Config cfg = create_default_config();
    cfg.music_directory = util::Platform::get_music_directory();
    save_config(cfg, config_file);
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

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

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "playback") {
            if (key == "default_volume") parse_int(key, value, cfg.default_volume);
            else if (key == "shuffle") cfg.shuffle = (value == "true");
            else if (key == "repeat") cfg.repeat = value;
            else if (key == "tick_hz") parse_int(key, value, cfg.tick_hz);
            else if (key == "seek_step_seconds") parse_int(key, value, cfg.seek_step_seconds);
            else if (key == "volume_step_percent") parse_int(key, value, cfg.volume_step_percent);
        }
        else if (current_section == "logging") {
            if (key == "log_file") cfg.log_file = value;
            else if (key == "level") cfg.log_level = value;
        }
        else if (current_section == "keybinds") {
            cfg.keybinds[key] = value;
        }
        else if (current_section == "paths") {
            if (key == "music_directory") cfg.music_directory = std::filesystem::path(value);
        }
    }

    if (cfg.tick_hz <= 0) {
        util::Logger::warn("Config: tick_hz must be positive, using 60");
        cfg.tick_hz = 60;
    }
    if (cfg.default_volume < 0 || cfg.default_volume > 100) {
        util::Logger::warn("Config: default_volume out of range, clamping");
        cfg.default_volume = std::clamp(cfg.default_volume, 0, 100);
    }
    if (cfg.seek_step_seconds <= 0) cfg.seek_step_seconds = 5;
    if (cfg.volume_step_percent <= 0) cfg.volume_step_percent = 10;
    if (cfg.repeat != "off" && cfg.repeat != "one") {
        util::Logger::warn("Config: Unknown repeat mode \"" + cfg.repeat + "\", using off");
        cfg.repeat = "off";
    }

    return cfg;
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

    file << "# TURNTABLE Config\n\n";

    file << "[playback]\n";
    file << "# Start-up volume (0-100)\n";
    file << "default_volume = " << cfg.default_volume << "\n";
    file << "shuffle = " << (cfg.shuffle ? "true" : "false") << "\n";
    file << "# Repeat mode: \"off\", \"one\"\n";
    file << "repeat = \"" << cfg.repeat << "\"\n";
    file << "# UI tick rate; end of track is detected within one tick\n";
    file << "tick_hz = " << cfg.tick_hz << "\n";
    file << "seek_step_seconds = " << cfg.seek_step_seconds << "\n";
    file << "volume_step_percent = " << cfg.volume_step_percent << "\n\n";

    file << "[logging]\n";
    file << "log_file = \"" << cfg.log_file.string() << "\"\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n\n";

    file << "[keybinds]\n";
    file << "# action = \"command\"\n";
    for (const auto& [action, key] : cfg.keybinds) {
        file << action << " = \"" << key << "\"\n";
    }
    file << "\n";

    file << "[paths]\n";
    if (!cfg.music_directory.empty()) {
        file << "music_directory = \"" << cfg.music_directory.string() << "\"\n";
    } else {
        file << "# music_directory = \"~/Music\"\n";
    }
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    return Config{};
}

}  // namespace turntable::backend
