#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace opstrend {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

enum class LogFormat {
    Plain,      // [WARN] message
    Structured  // one JSON object per line
};

std::string_view to_string(LogLevel level);
bool parse_log_level(std::string_view text, LogLevel& level);
bool parse_log_format(std::string_view text, LogFormat& format);

/// Logger handed to the engine by the caller.
///
/// Messages above the configured level are dropped. With a callback installed every
/// accepted line is forwarded to it, otherwise it is written to std::cerr. The callback
/// may be invoked from several threads at once when the batch engine runs in parallel.
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(LogLevel level = LogLevel::Warn, LogFormat format = LogFormat::Plain);

    void error(const std::string& message) const { log(LogLevel::Error, message); }
    void warn(const std::string& message) const { log(LogLevel::Warn, message); }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void debug(const std::string& message) const { log(LogLevel::Debug, message); }

    void log(LogLevel level, const std::string& message) const;

    bool enabled(LogLevel level) const noexcept { return level <= level_; }

    // The setters are not synchronized. Call them before the logger is shared.
    void set_level(LogLevel level) noexcept { level_ = level; }
    LogLevel level() const noexcept { return level_; }

    void set_format(LogFormat format) noexcept { format_ = format; }
    LogFormat format() const noexcept { return format_; }

    void set_callback(LogCallback cb) { callback_ = std::move(cb); }
    void clear_callback() { callback_ = nullptr; }

private:
    std::string format_line(LogLevel level, const std::string& message) const;

    LogLevel level_;
    LogFormat format_;
    LogCallback callback_;
    mutable std::mutex stream_mutex_;
};

// Null-safe helpers so engine code can take an optional logger.
inline void log_warn(const Logger* logger, const std::string& message)
{
    if (logger) {
        logger->warn(message);
    }
}

inline void log_error(const Logger* logger, const std::string& message)
{
    if (logger) {
        logger->error(message);
    }
}

inline void log_debug(const Logger* logger, const std::string& message)
{
    if (logger && logger->enabled(LogLevel::Debug)) {
        logger->debug(message);
    }
}

/// Logs the wall time of a scope on destruction.
/// Durations above the slow threshold are reported as warnings, others at debug level.
/// A std::exception thrown by the logger's callback is reported on std::cerr instead of
/// leaving the destructor.
class ScopedTimer {
public:
    ScopedTimer(const Logger* logger, std::string operation, double slow_threshold_ms = 1000.0);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double elapsed_ms() const;

private:
    const Logger* logger_;
    std::string operation_;
    double slow_threshold_ms_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace opstrend
