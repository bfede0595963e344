#ifndef PAPER_UTIL_LOGGER_HPP
#define PAPER_UTIL_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace paper::util {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    None = 4
};

// "debug", "info", "warn", "error", "none". nullopt for anything else
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);
[[nodiscard]] std::string_view to_string(LogLevel level);

/*
    process-wide logger. a library should stay quiet by default, so the level starts at Warn:
    connection faults show up, per-request chatter does not. applications raise or lower it.
*/
class Logger {
   public:
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    // send every line to one stream instead of stdout/stderr. nullptr restores the default
    void set_stream(std::ostream* out);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

   private:
    Logger() = default;

    [[nodiscard]] std::string timestamp() const;
    [[nodiscard]] std::string_view level_string(LogLevel level) const;

    std::atomic<LogLevel> level_{LogLevel::Warn};
    std::ostream* stream_ = nullptr;
    std::mutex mutex_;
};

// convenience macros. the message expression is only built when the level is enabled
#define PAPER_LOG(lvl, msg)                                                   \
    do {                                                                      \
        if ((lvl) >= ::paper::util::Logger::instance().level()) {             \
            ::paper::util::Logger::instance().log((lvl), (msg));              \
        }                                                                     \
    } while (0)

#define PAPER_LOG_DEBUG(msg) PAPER_LOG(::paper::util::LogLevel::Debug, msg)
#define PAPER_LOG_INFO(msg) PAPER_LOG(::paper::util::LogLevel::Info, msg)
#define PAPER_LOG_WARN(msg) PAPER_LOG(::paper::util::LogLevel::Warn, msg)
#define PAPER_LOG_ERROR(msg) PAPER_LOG(::paper::util::LogLevel::Error, msg)

}  // namespace paper::util

#endif
