#include "../include/seeborg/config.hpp"
#include "../include/seeborg/text.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <stdexcept>

namespace seeborg {

namespace {

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0) {
        return std::nullopt;
    }
    std::unique_ptr<char, decltype(&std::free)> holder(buffer, &std::free);
    if (!buffer) {
        return std::nullopt;
    }
    return std::string(buffer);
#else
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

void warn_invalid(const char* name, const std::string& value) {
    log(LogLevel::Warn, "Config", std::string("Ignoring invalid ") + name + "=\"" + value + "\"");
}

std::optional<std::size_t> parse_size(const char* name, const std::string& raw) {
    const std::string value = trim(raw);
    std::size_t parsed = 0;
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
        warn_invalid(name, raw);
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> parse_double(const char* name, const std::string& raw) {
    const std::string value = trim(raw);
    try {
        std::size_t idx = 0;
        const double parsed = std::stod(value, &idx);
        if (idx == value.size() && !std::isnan(parsed)) {
            return parsed;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    warn_invalid(name, raw);
    return std::nullopt;
}

std::optional<bool> parse_flag(const char* name, const std::string& raw) {
    auto parsed = parse_bool(raw);
    if (!parsed) {
        warn_invalid(name, raw);
    }
    return parsed;
}

} // namespace

std::optional<bool> parse_bool(const std::string& value) {
    const std::string lowered = to_lower(trim(value));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

Config resolve_config() {
    return resolve_config(&read_env);
}

Config resolve_config(const EnvLookup& lookup) {
    Config config;
    if (auto path = lookup("SEEBORG_DICTIONARY"); path && !trim(*path).empty()) {
        config.dictionary_path = trim(*path);
    }
    if (auto raw = lookup("SEEBORG_LEARNING")) {
        if (auto flag = parse_flag("SEEBORG_LEARNING", *raw)) {
            config.learning = *flag;
        }
    }
    if (auto raw = lookup("SEEBORG_SPEAKING")) {
        if (auto flag = parse_flag("SEEBORG_SPEAKING", *raw)) {
            config.speaking = *flag;
        }
    }
    if (auto raw = lookup("SEEBORG_REPLY_RATE")) {
        if (auto rate = parse_double("SEEBORG_REPLY_RATE", *raw)) {
            config.reply_rate = std::clamp(*rate, 0.0, 1.0);
        }
    }
    if (auto raw = lookup("SEEBORG_AUTOSAVE")) {
        if (auto every = parse_size("SEEBORG_AUTOSAVE", *raw)) {
            config.autosave_every = *every;
        }
    }
    if (auto raw = lookup("SEEBORG_LOG_LEVEL")) {
        if (auto level = parse_log_level(*raw)) {
            config.log_level = *level;
        } else {
            warn_invalid("SEEBORG_LOG_LEVEL", *raw);
        }
    }
    return config;
}

} // namespace seeborg
