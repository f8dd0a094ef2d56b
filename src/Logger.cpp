#include "Logger.hpp"

#include <json/json.h>

#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace opstrend {

namespace {

std::string format_iso_timestamp(std::chrono::system_clock::time_point tp)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

std::string_view to_string(LogLevel level)
{
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

bool parse_log_level(std::string_view text, LogLevel& level)
{
    if (text == "error") {
        level = LogLevel::Error;
    } else if (text == "warn") {
        level = LogLevel::Warn;
    } else if (text == "info") {
        level = LogLevel::Info;
    } else if (text == "debug") {
        level = LogLevel::Debug;
    } else {
        return false;
    }
    return true;
}

bool parse_log_format(std::string_view text, LogFormat& format)
{
    if (text == "plain") {
        format = LogFormat::Plain;
    } else if (text == "structured") {
        format = LogFormat::Structured;
    } else {
        return false;
    }
    return true;
}

Logger::Logger(LogLevel level, LogFormat format)
    : level_(level)
    , format_(format)
{
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (!enabled(level)) {
        return;
    }

    const std::string line = format_line(level, message);
    if (callback_) {
        callback_(level, line);
        return;
    }

    std::lock_guard<std::mutex> lock(stream_mutex_);
    std::cerr << line << std::endl;
}

std::string Logger::format_line(LogLevel level, const std::string& message) const
{
    if (format_ == LogFormat::Plain) {
        std::string line;
        line.reserve(message.size() + 8);
        line += '[';
        line += to_string(level);
        line += "] ";
        line += message;
        return line;
    }

    Json::Value entry(Json::objectValue);
    entry["level"] = std::string(to_string(level));
    entry["message"] = message;
    entry["timestamp"] = format_iso_timestamp(std::chrono::system_clock::now());

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, entry);
}

ScopedTimer::ScopedTimer(const Logger* logger, std::string operation, double slow_threshold_ms)
    : logger_(logger)
    , operation_(std::move(operation))
    , slow_threshold_ms_(slow_threshold_ms)
    , start_(std::chrono::steady_clock::now())
{
}

ScopedTimer::~ScopedTimer()
{
    if (!logger_) {
        return;
    }

    try {
        const double ms = elapsed_ms();
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << ms << "ms";
        if (ms > slow_threshold_ms_) {
            logger_->warn("Slow operation: " + operation_ + " (" + oss.str() + ")");
        } else if (logger_->enabled(LogLevel::Debug)) {
            logger_->debug("Performance: " + operation_ + " (" + oss.str() + ")");
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Timer for " << operation_ << " failed to log: " << e.what() << std::endl;
    }
}

double ScopedTimer::elapsed_ms() const
{
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(now - start_).count();
}

} // namespace opstrend
