#include "../include/seeborg/json.hpp"
#include "../include/seeborg/text.hpp"

#include <charconv>
#include <cstdio>
#include <type_traits>

namespace seeborg {

namespace {

constexpr std::size_t kMaxDepth = 256;

bool is_json_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

int hex_value(char c) {
    if (is_digit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

void write_string(std::string& out, const std::string& value) {
    out.push_back('"');
    for (char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20) {
            char escape[8];
            std::snprintf(escape, sizeof(escape), "\\u%04x", static_cast<unsigned>(byte));
            out += escape;
        } else {
            out.push_back(c);
        }
    }
    out.push_back('"');
}

void write_value(std::string& out, const Json& json) {
    std::visit(
        [&out](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                out += "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out += value ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out += std::to_string(value);
            } else if constexpr (std::is_same_v<T, double>) {
                char buffer[32];
                const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
                out.append(buffer, result.ptr);
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_string(out, value);
            } else if constexpr (std::is_same_v<T, JsonArray>) {
                out.push_back('[');
                for (std::size_t i = 0; i < value.size(); ++i) {
                    if (i > 0) {
                        out.push_back(',');
                    }
                    write_value(out, value[i]);
                }
                out.push_back(']');
            } else if constexpr (std::is_same_v<T, JsonObject>) {
                out.push_back('{');
                const char* separator = "";
                for (const auto& [key, member] : value) {
                    out += separator;
                    separator = ",";
                    write_string(out, key);
                    out.push_back(':');
                    write_value(out, member);
                }
                out.push_back('}');
            }
        },
        json.value());
}

// Recursive-descent reader over one document. m_pos always points at the
// next unread byte.
class Reader {
public:
    explicit Reader(std::string_view text) : m_text(text) {}

    Json read_document() {
        Json value = read_value(0);
        skip_space();
        if (!at_end()) {
            fail("unexpected trailing characters");
        }
        return value;
    }

private:
    std::string_view m_text;
    std::size_t m_pos = 0;

    [[noreturn]] void fail(const char* message) const { throw JsonParseError(message, m_pos); }

    bool at_end() const { return m_pos >= m_text.size(); }
    char peek() const { return m_text[m_pos]; }

    void skip_space() {
        while (!at_end() && is_json_space(peek())) {
            ++m_pos;
        }
    }

    bool consume(char expected) {
        skip_space();
        if (!at_end() && peek() == expected) {
            ++m_pos;
            return true;
        }
        return false;
    }

    bool consume_literal(std::string_view literal) {
        if (m_text.substr(m_pos, literal.size()) == literal) {
            m_pos += literal.size();
            return true;
        }
        return false;
    }

    Json read_value(std::size_t depth) {
        skip_space();
        if (at_end()) {
            fail("unexpected end of input");
        }
        if (depth > kMaxDepth) {
            fail("nesting too deep");
        }
        switch (peek()) {
        case '"':
            return Json(read_string());
        case '[':
            return read_array(depth + 1);
        case '{':
            return read_object(depth + 1);
        default:
            break;
        }
        if (peek() == '-' || is_digit(peek())) {
            return read_number();
        }
        if (consume_literal("true")) {
            return Json(true);
        }
        if (consume_literal("false")) {
            return Json(false);
        }
        if (consume_literal("null")) {
            return Json(nullptr);
        }
        fail("invalid token");
    }

    std::size_t skip_digits() {
        const std::size_t begin = m_pos;
        while (!at_end() && is_digit(peek())) {
            ++m_pos;
        }
        return m_pos - begin;
    }

    // Integers that fit in int64 stay exact; anything with a fraction or an
    // exponent becomes a double.
    Json read_number() {
        const std::size_t start = m_pos;
        bool integral = true;
        if (peek() == '-') {
            ++m_pos;
        }
        if (skip_digits() == 0) {
            throw JsonParseError("invalid number", start);
        }
        if (!at_end() && peek() == '.') {
            integral = false;
            ++m_pos;
            if (skip_digits() == 0) {
                throw JsonParseError("invalid number", start);
            }
        }
        if (!at_end() && (peek() == 'e' || peek() == 'E')) {
            integral = false;
            ++m_pos;
            if (!at_end() && (peek() == '+' || peek() == '-')) {
                ++m_pos;
            }
            if (skip_digits() == 0) {
                throw JsonParseError("invalid number", start);
            }
        }

        const char* first = m_text.data() + start;
        const char* last = m_text.data() + m_pos;
        if (integral) {
            std::int64_t exact = 0;
            const auto [end, ec] = std::from_chars(first, last, exact);
            if (ec == std::errc() && end == last) {
                return Json(exact);
            }
        }
        try {
            return Json(std::stod(std::string(first, last)));
        } catch (const std::out_of_range&) {
            throw JsonParseError("number out of range", start);
        }
    }

    char32_t read_hex4() {
        if (m_pos + 4 > m_text.size()) {
            fail("truncated unicode escape");
        }
        char32_t code = 0;
        for (int i = 0; i < 4; ++i, ++m_pos) {
            const int digit = hex_value(peek());
            if (digit < 0) {
                fail("invalid unicode escape");
            }
            code = (code << 4) | static_cast<char32_t>(digit);
        }
        return code;
    }

    char32_t read_code_point() {
        char32_t code = read_hex4();
        if (code >= 0xDC00 && code <= 0xDFFF) {
            fail("unpaired surrogate");
        }
        if (code >= 0xD800 && code <= 0xDBFF) {
            if (!consume_literal("\\u")) {
                fail("unpaired surrogate");
            }
            const char32_t low = read_hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("invalid low surrogate");
            }
            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        }
        return code;
    }

    std::string read_string() {
        skip_space();
        if (at_end() || peek() != '"') {
            fail("expected string");
        }
        ++m_pos;
        std::string result;
        for (;;) {
            if (at_end()) {
                fail("unterminated string");
            }
            const char c = peek();
            if (c == '"') {
                ++m_pos;
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("unescaped control character in string");
            }
            ++m_pos;
            if (c != '\\') {
                result.push_back(c);
                continue;
            }
            if (at_end()) {
                fail("unterminated escape");
            }
            const char escaped = peek();
            ++m_pos;
            switch (escaped) {
            case '"':
            case '\\':
            case '/':
                result.push_back(escaped);
                break;
            case 'b': result.push_back('\b'); break;
            case 'f': result.push_back('\f'); break;
            case 'n': result.push_back('\n'); break;
            case 'r': result.push_back('\r'); break;
            case 't': result.push_back('\t'); break;
            case 'u':
                append_utf8(read_code_point(), result);
                break;
            default:
                --m_pos;
                fail("invalid escape");
            }
        }
    }

    Json read_array(std::size_t depth) {
        ++m_pos;
        JsonArray items;
        if (consume(']')) {
            return Json(std::move(items));
        }
        do {
            items.push_back(read_value(depth));
        } while (consume(','));
        if (!consume(']')) {
            fail(at_end() ? "unterminated array" : "expected comma or closing bracket");
        }
        return Json(std::move(items));
    }

    Json read_object(std::size_t depth) {
        ++m_pos;
        JsonObject members;
        if (consume('}')) {
            return Json(std::move(members));
        }
        do {
            std::string key = read_string();
            if (!consume(':')) {
                fail("expected colon");
            }
            members.insert_or_assign(std::move(key), read_value(depth));
        } while (consume(','));
        if (!consume('}')) {
            fail(at_end() ? "unterminated object" : "expected comma or closing brace");
        }
        return Json(std::move(members));
    }
};

} // namespace

JsonParseError::JsonParseError(const std::string& message, std::size_t offset)
    : std::runtime_error(message + " at offset " + std::to_string(offset)), m_offset(offset) {}

std::string Json::dump() const {
    std::string out;
    write_value(out, *this);
    return out;
}

Json Json::parse(std::string_view text) {
    return Reader(text).read_document();
}

} // namespace seeborg
