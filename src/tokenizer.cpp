#include "../include/seeborg/tokenizer.hpp"
#include "../include/seeborg/text.hpp"

#include <iterator>
#include <regex>

namespace seeborg {

namespace {

// Single-character patterns: libstdc++ matches a `+` run recursively, one
// frame per character, so long whitespace runs would exhaust the stack.
// Runs are collapsed by trimming segments and dropping empty tokens.
const std::regex& sentence_boundary_regex() {
    static const std::regex pattern(R"([.!?][ \t\r\n\v\f])", std::regex::ECMAScript | std::regex::optimize);
    return pattern;
}

const std::regex& word_delimiter_regex() {
    static const std::regex pattern(R"([,.!?: \t\r\n\v\f])", std::regex::ECMAScript | std::regex::optimize);
    return pattern;
}

void push_segment(std::vector<std::string>& out, std::string_view segment) {
    std::string trimmed = trim(segment);
    if (!trimmed.empty()) {
        out.push_back(std::move(trimmed));
    }
}

} // namespace

std::vector<std::string> split_sentences(std::string_view text) {
    std::vector<std::string> sentences;
    using Iterator = std::regex_iterator<std::string_view::const_iterator>;
    std::size_t segment_start = 0;
    for (Iterator it(text.begin(), text.end(), sentence_boundary_regex()), end; it != end; ++it) {
        // The match is a punctuation mark plus one whitespace character; the
        // mark stays with the sentence it closes.
        const auto match_pos = static_cast<std::size_t>(it->position(0));
        const std::size_t cut = match_pos + 1;
        push_segment(sentences, text.substr(segment_start, cut - segment_start));
        segment_start = match_pos + static_cast<std::size_t>(it->length(0));
    }
    if (segment_start < text.size()) {
        push_segment(sentences, text.substr(segment_start));
    }
    return sentences;
}

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    using TokenIterator = std::regex_token_iterator<std::string_view::const_iterator>;
    for (TokenIterator it(text.begin(), text.end(), word_delimiter_regex(), -1), end; it != end; ++it) {
        if (it->length() > 0) {
            words.emplace_back(it->first, it->second);
        }
    }
    return words;
}

} // namespace seeborg
