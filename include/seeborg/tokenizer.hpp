#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace seeborg {

// Splits after a run of '.', '!' or '?' that is followed by whitespace.
// Segments are trimmed; empty ones are dropped. Punctuation with no
// whitespace after it ("we.cant.split.this.") never splits.
std::vector<std::string> split_sentences(std::string_view text);

// Splits on maximal runs of ',', '.', '!', '?', ':' and whitespace.
// Case is preserved; callers lowercase first when indexing or querying.
std::vector<std::string> split_words(std::string_view text);

} // namespace seeborg
