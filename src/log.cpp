#include "../include/seeborg/log.hpp"
#include "../include/seeborg/text.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace seeborg {

namespace {

struct LogState {
    std::mutex mutex;
    LogLevel level = LogLevel::Info;
    std::ostream* stream = nullptr;
};

LogState& state() {
    static LogState instance;
    return instance;
}

std::string timestamp_now() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto time = clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << milliseconds.count();
    return oss.str();
}

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace

void set_log_level(LogLevel level) {
    auto& s = state();
    std::scoped_lock lock(s.mutex);
    s.level = level;
}

LogLevel log_level() {
    auto& s = state();
    std::scoped_lock lock(s.mutex);
    return s.level;
}

void set_log_stream(std::ostream* stream) {
    auto& s = state();
    std::scoped_lock lock(s.mutex);
    s.stream = stream;
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    const std::string lowered = to_lower(trim(name));
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void log(LogLevel level, std::string_view component, std::string_view message) {
    auto& s = state();
    std::scoped_lock lock(s.mutex);
    if (level < s.level) {
        return;
    }
    std::ostream& out = s.stream != nullptr ? *s.stream : std::clog;
    out << '[' << component << ' ' << timestamp_now() << "] " << level_name(level) << ' ' << message << std::endl;
}

} // namespace seeborg
