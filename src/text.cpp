#include "../include/seeborg/text.hpp"

#include <cctype>
#include <cstddef>

namespace seeborg {

namespace {

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Decodes one code point starting at text[pos]. Returns the sequence length,
// or 0 when the bytes do not form a valid sequence.
std::size_t decode_utf8(std::string_view text, std::size_t pos, char32_t& code) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    const std::size_t remaining = text.size() - pos;
    if (lead < 0x80) {
        code = lead;
        return 1;
    }
    if ((lead >> 5) == 0x6 && remaining >= 2 && is_continuation(static_cast<unsigned char>(text[pos + 1]))) {
        code = ((lead & 0x1F) << 6) | (static_cast<unsigned char>(text[pos + 1]) & 0x3F);
        return 2;
    }
    if ((lead >> 4) == 0xE && remaining >= 3 && is_continuation(static_cast<unsigned char>(text[pos + 1]))
        && is_continuation(static_cast<unsigned char>(text[pos + 2]))) {
        code = ((lead & 0x0F) << 12) | ((static_cast<unsigned char>(text[pos + 1]) & 0x3F) << 6)
               | (static_cast<unsigned char>(text[pos + 2]) & 0x3F);
        return 3;
    }
    if ((lead >> 3) == 0x1E && remaining >= 4 && is_continuation(static_cast<unsigned char>(text[pos + 1]))
        && is_continuation(static_cast<unsigned char>(text[pos + 2]))
        && is_continuation(static_cast<unsigned char>(text[pos + 3]))) {
        code = ((lead & 0x07) << 18) | ((static_cast<unsigned char>(text[pos + 1]) & 0x3F) << 12)
               | ((static_cast<unsigned char>(text[pos + 2]) & 0x3F) << 6)
               | (static_cast<unsigned char>(text[pos + 3]) & 0x3F);
        return 4;
    }
    return 0;
}

char32_t fold_case(char32_t code) {
    // Latin-1 Supplement, skipping the multiplication sign.
    if (code >= 0xC0 && code <= 0xDE && code != 0xD7) {
        return code + 0x20;
    }
    // Latin Extended-A alternates capital/small in pairs; U+0130 and U+0131
    // (dotted and dotless i) are left alone.
    if ((code >= 0x100 && code <= 0x12F) || (code >= 0x132 && code <= 0x137) || (code >= 0x14A && code <= 0x177)) {
        return (code % 2 == 0) ? code + 1 : code;
    }
    if ((code >= 0x139 && code <= 0x148) || (code >= 0x179 && code <= 0x17E)) {
        return (code % 2 == 1) ? code + 1 : code;
    }
    if (code == 0x178) {
        return 0xFF;
    }
    // Greek
    if (code >= 0x391 && code <= 0x3A9 && code != 0x3A2) {
        return code + 0x20;
    }
    if (code == 0x386) {
        return 0x3AC;
    }
    if (code >= 0x388 && code <= 0x38A) {
        return code + 0x25;
    }
    if (code == 0x38C) {
        return 0x3CC;
    }
    if (code == 0x38E || code == 0x38F) {
        return code + 0x3F;
    }
    // Cyrillic
    if (code >= 0x410 && code <= 0x42F) {
        return code + 0x20;
    }
    if (code >= 0x400 && code <= 0x40F) {
        return code + 0x50;
    }
    return code;
}

} // namespace

void append_utf8(char32_t code, std::string& out) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

std::string to_lower(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const unsigned char ch = static_cast<unsigned char>(text[pos]);
        if (ch < 0x80) {
            result.push_back(static_cast<char>(std::tolower(ch)));
            ++pos;
            continue;
        }
        char32_t code = 0;
        const std::size_t length = decode_utf8(text, pos, code);
        if (length == 0) {
            result.push_back(static_cast<char>(ch));
            ++pos;
            continue;
        }
        const char32_t folded = fold_case(code);
        if (folded == code) {
            result.append(text.substr(pos, length));
        } else {
            append_utf8(folded, result);
        }
        pos += length;
    }
    return result;
}

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string join(const std::vector<std::string>& words, std::string_view separator) {
    std::string result;
    bool first = true;
    for (const auto& word : words) {
        if (!first) {
            result.append(separator);
        }
        first = false;
        result.append(word);
    }
    return result;
}

} // namespace seeborg
