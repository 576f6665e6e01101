#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace turntable::util {

std::filesystem::path Platform::get_music_directory() {
    Logger::debug("Platform: Detecting music directory");
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / "Music";
        Logger::info("Platform: Using default music directory: " + path.string());
        return path;
    }
    Logger::warn("Platform: HOME env var not set, using fallback: ./Music");
    return "./Music";
}

std::filesystem::path Platform::get_config_directory() {
    Logger::debug("Platform: Detecting config directory");
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "turntable";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/turntable");
    return ".config/turntable";
}

std::string Platform::lowercase_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool Platform::is_audio_file(const std::filesystem::path& path) {
    auto ext = lowercase_extension(path);
    return std::find(AUDIO_EXTENSIONS.begin(), AUDIO_EXTENSIONS.end(), ext) != AUDIO_EXTENSIONS.end();
}

model::AudioFormat Platform::detect_format(const std::filesystem::path& path) {
    auto ext = lowercase_extension(path);

    if (ext == ".mp3") return model::AudioFormat::MP3;
    if (ext == ".ogg") return model::AudioFormat::OGG;
    if (ext == ".wav") return model::AudioFormat::WAV;
    if (ext == ".flac") return model::AudioFormat::FLAC;
    if (ext == ".mod") return model::AudioFormat::MOD;
    if (ext == ".xm") return model::AudioFormat::XM;
    if (ext == ".it") return model::AudioFormat::IT;
    if (ext == ".s3m") return model::AudioFormat::S3M;

    return model::AudioFormat::Unknown;
}

std::string Platform::display_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

}  // namespace turntable::util
