#include "paper/util/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace paper::util {

std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    if (text == "none") return LogLevel::None;
    return std::nullopt;
}

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
        case LogLevel::None:
            return "none";
    }
    return "?";
}

/*
    Meyer's Singleton pattern
    static local variable:
        - created on first call
        - lives until program ends
        - thread safe initialization (c++11 guarantee)
*/
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::set_stream(std::ostream* out) {
    std::lock_guard lock(mutex_);
    stream_ = out;
}

void Logger::debug(std::string_view message) {
    log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
    log(LogLevel::Info, message);
}

void Logger::warn(std::string_view message) {
    log(LogLevel::Warn, message);
}

void Logger::error(std::string_view message) {
    log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, std::string_view message) {
    if (level == LogLevel::None || level < level_.load()) {
        return;
    }

    std::string line = timestamp() + " [" + std::string(level_string(level)) + "] paper: " +
                       std::string(message) + "\n";
    std::lock_guard lock(mutex_);
    if (stream_ != nullptr) {
        *stream_ << line;
        return;
    }
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << line;
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    // localtime() shares a static buffer between threads
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream oss;
    // format: "2024-01-15 10:30:45.123"
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string_view Logger::level_string(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO ";
        case LogLevel::Warn:
            return "WARN ";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "?????";
    }
}

}  // namespace paper::util
