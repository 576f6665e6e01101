#pragma once

#include "model/Snapshot.hpp"
#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace turntable::util {

class Platform {
public:
    // Fixed set of extensions the player accepts, compared case-insensitively
    static constexpr std::array<std::string_view, 8> AUDIO_EXTENSIONS = {
        ".mp3", ".ogg", ".wav", ".flac", ".mod", ".xm", ".it", ".s3m"
    };

    static std::filesystem::path get_music_directory();
    static std::filesystem::path get_config_directory();

    static bool is_audio_file(const std::filesystem::path& path);
    static model::AudioFormat detect_format(const std::filesystem::path& path);

    // File name component shown to the user ("/music/a/b.mp3" -> "b.mp3")
    static std::string display_name(const std::string& path);

private:
    static std::string lowercase_extension(const std::filesystem::path& path);
};

}  // namespace turntable::util
