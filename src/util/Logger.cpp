#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <string_view>

namespace turntable::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::filesystem::path log_path = "/tmp/turntable_debug.log";
static Logger::Level min_level = Logger::Level::Debug;

void Logger::init(const std::filesystem::path& path, Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    // Close existing file if open
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    min_level = level;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) return;
    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << '\n';
    log_file.flush();  // Ensure writes are visible immediately
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

}  // namespace turntable::util
