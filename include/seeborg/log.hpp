#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace seeborg {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Redirects log output. Passing nullptr restores std::clog.
void set_log_stream(std::ostream* stream);

std::optional<LogLevel> parse_log_level(std::string_view name);

void log(LogLevel level, std::string_view component, std::string_view message);

} // namespace seeborg
