#pragma once

#include <string>
#include <mutex>
#include <optional>
#include <string_view>
#include "KeycodeTypes.hpp"

namespace nexus_keycode {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Security,
    Fatal
};

class Logger {
public:
    static void logEvent(LogLevel level, std::string_view message);
    static void logError(ErrorCode code, std::string_view details);

    static void setLogLevel(LogLevel minLevel);
    static LogLevel logLevel();
    static void setLogFile(std::string_view path);
    static void enableConsoleOutput(bool enable);

    // "debug", "info", "warning", "error", "security" or "fatal"
    static std::optional<LogLevel> parseLevel(std::string_view name);

    static void flush();

private:
    static std::mutex log_mutex_;
    static LogLevel min_log_level_;
    static std::string log_file_path_;
    static bool console_output_enabled_;

    static void write(const std::string& line);
    static void writeToFile(std::string_view message);

    Logger() = delete;
    ~Logger() = delete;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

} // namespace nexus_keycode
