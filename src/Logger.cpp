#include "Logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <fstream>

namespace nexus_keycode {

// Static member initialization
std::mutex Logger::log_mutex_;
LogLevel Logger::min_log_level_ = LogLevel::Warning;
std::string Logger::log_file_path_;
bool Logger::console_output_enabled_ = true;

namespace {
    std::string currentTimeString() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        #ifdef _WIN32
            localtime_s(&tm_buf, &time);
        #else
            localtime_r(&time, &tm_buf);
        #endif

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:    return "[DEBUG]   ";
            case LogLevel::Info:     return "[INFO]    ";
            case LogLevel::Warning:  return "[WARNING] ";
            case LogLevel::Error:    return "[ERROR]   ";
            case LogLevel::Security: return "[SECURITY]";
            case LogLevel::Fatal:    return "[FATAL]   ";
            default:                 return "[UNKNOWN] ";
        }
    }
}

void Logger::logEvent(LogLevel level, std::string_view message) {
    if (level < logLevel()) {
        return;
    }
    write(std::string(levelToString(level)) + " " + currentTimeString() + " " +
          std::string(message) + "\n");
}

void Logger::logError(ErrorCode code, std::string_view details) {
    if (LogLevel::Error < logLevel()) {
        return;
    }
    write(std::string(levelToString(LogLevel::Error)) + " " + currentTimeString() +
          " Code: " + toString(code) + " Details: " + std::string(details) + "\n");
}

void Logger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (console_output_enabled_) {
        std::cerr << line << std::flush;
    }

    if (!log_file_path_.empty()) {
        writeToFile(line);
    }
}

void Logger::writeToFile(std::string_view message) {
    std::ofstream file(log_file_path_, std::ios::app);
    if (!file.is_open()) {
        // If file logging fails, fall back to the console
        if (console_output_enabled_) {
            std::cerr << "[FILE_ERROR] Failed to open log file " << log_file_path_ << "\n";
        }
        return;
    }
    file << message;
    file.flush();
}

void Logger::setLogLevel(LogLevel minLevel) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = minLevel;
}

LogLevel Logger::logLevel() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return min_log_level_;
}

void Logger::setLogFile(std::string_view path) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_path_ = path;
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_enabled_ = enable;
}

std::optional<LogLevel> Logger::parseLevel(std::string_view name) {
    if (name == "debug")    return LogLevel::Debug;
    if (name == "info")     return LogLevel::Info;
    if (name == "warning")  return LogLevel::Warning;
    if (name == "error")    return LogLevel::Error;
    if (name == "security") return LogLevel::Security;
    if (name == "fatal")    return LogLevel::Fatal;
    return std::nullopt;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr.flush();
}

} // namespace nexus_keycode
