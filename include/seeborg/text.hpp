#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace seeborg {

// Lowercases ASCII and the common alphabetic UTF-8 ranges (Latin-1,
// Latin Extended-A, Greek, Cyrillic). Other bytes are copied unchanged.
std::string to_lower(std::string_view text);

std::string trim(std::string_view text);

std::string join(const std::vector<std::string>& words, std::string_view separator);

void append_utf8(char32_t code, std::string& out);

} // namespace seeborg
