#pragma once

#include "log.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace seeborg {

struct Config {
    std::filesystem::path dictionary_path = "data/dictionary.json";
    bool learning = true;
    bool speaking = true;
    double reply_rate = 1.0;
    std::size_t autosave_every = 50;
    LogLevel log_level = LogLevel::Info;
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Reads SEEBORG_DICTIONARY, SEEBORG_LEARNING, SEEBORG_SPEAKING,
// SEEBORG_REPLY_RATE, SEEBORG_AUTOSAVE and SEEBORG_LOG_LEVEL. Invalid values
// keep the default and are reported as warnings.
Config resolve_config();
Config resolve_config(const EnvLookup& lookup);

std::optional<bool> parse_bool(const std::string& value);

} // namespace seeborg
