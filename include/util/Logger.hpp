#pragma once

#include <filesystem>
#include <string>

namespace collagist::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file. Messages below min_level are dropped.
    static void init(const std::filesystem::path& log_path = default_log_path(),
                     Level min_level = Level::Info);
    static void shutdown();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static std::filesystem::path default_log_path();
};

}  // namespace collagist::util
