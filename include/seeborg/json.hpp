#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace seeborg {

class Json;

using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& message, std::size_t offset);

    std::size_t offset() const noexcept { return m_offset; }

private:
    std::size_t m_offset;
};

class Json {
public:
    using Value = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, JsonArray, JsonObject>;

    Json() : m_value(nullptr) {}
    Json(std::nullptr_t) : m_value(nullptr) {}
    Json(bool b) : m_value(b) {}
    Json(int i) : m_value(static_cast<std::int64_t>(i)) {}
    Json(std::int64_t i) : m_value(i) {}
    Json(std::uint64_t u) : m_value(static_cast<std::int64_t>(u)) {}
    Json(double d) : m_value(d) {}
    Json(std::string s) : m_value(std::move(s)) {}
    Json(const char* s) : m_value(std::string(s)) {}
    Json(JsonArray arr) : m_value(std::move(arr)) {}
    Json(JsonObject obj) : m_value(std::move(obj)) {}

    const Value& value() const noexcept { return m_value; }

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(m_value); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(m_value); }
    bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(m_value); }
    bool is_double() const noexcept { return std::holds_alternative<double>(m_value); }
    bool is_object() const noexcept { return std::holds_alternative<JsonObject>(m_value); }
    bool is_array() const noexcept { return std::holds_alternative<JsonArray>(m_value); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(m_value); }

    bool as_bool() const { return std::get<bool>(m_value); }
    std::int64_t as_integer() const { return std::get<std::int64_t>(m_value); }
    double as_double() const { return std::get<double>(m_value); }
    const JsonObject& as_object() const { return std::get<JsonObject>(m_value); }
    const JsonArray& as_array() const { return std::get<JsonArray>(m_value); }
    const std::string& as_string() const { return std::get<std::string>(m_value); }

    // Compact form, object keys in sorted order.
    std::string dump() const;

    // Throws JsonParseError on malformed or truncated input.
    static Json parse(std::string_view text);

    friend bool operator==(const Json& lhs, const Json& rhs) { return lhs.m_value == rhs.m_value; }
    friend bool operator!=(const Json& lhs, const Json& rhs) { return !(lhs == rhs); }

private:
    Value m_value;
};

} // namespace seeborg
