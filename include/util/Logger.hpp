#pragma once

#include <string>
#include <filesystem>

namespace turntable::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::filesystem::path& log_file, Level min_level);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn", "error"; anything else maps to Info
    static Level parse_level(const std::string& name);
};

}  // namespace turntable::util
