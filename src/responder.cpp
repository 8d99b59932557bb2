#include "../include/seeborg/responder.hpp"
#include "../include/seeborg/text.hpp"
#include "../include/seeborg/tokenizer.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace seeborg {

namespace {

std::optional<std::size_t> pivot_position(const std::vector<std::string>& words, const std::string& pivot) {
    auto it = std::find_if(words.begin(), words.end(), [&pivot](const std::string& word) {
        return to_lower(word) == pivot;
    });
    if (it == words.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(words.begin(), it));
}

} // namespace

std::optional<std::vector<std::string>> words_left_of_pivot(const std::string& sentence, const std::string& pivot) {
    auto words = split_words(sentence);
    const auto position = pivot_position(words, pivot);
    if (!position) {
        return std::nullopt;
    }
    words.resize(*position);
    return words;
}

std::optional<std::vector<std::string>> words_right_of_pivot_inclusive(const std::string& sentence,
                                                                       const std::string& pivot) {
    auto words = split_words(sentence);
    const auto position = pivot_position(words, pivot);
    if (!position) {
        return std::nullopt;
    }
    words.erase(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(*position));
    return words;
}

std::optional<std::string> respond_to(const Dictionary& dictionary, const std::string& line, RandomSource& random) {
    const auto known = dictionary.known_words(line);
    if (known.empty()) {
        return std::nullopt;
    }
    const std::string& pivot = known[pick_index(random, known.size())];

    const auto candidates = dictionary.sentences_with_word(pivot);
    if (candidates.size() < 2) {
        return std::nullopt;
    }
    const std::string& left_donor = candidates[pick_index(random, candidates.size())];
    const std::string& right_donor = candidates[pick_index(random, candidates.size())];

    const auto left = words_left_of_pivot(left_donor, pivot).value_or(std::vector<std::string>{});
    const auto right = words_right_of_pivot_inclusive(right_donor, pivot);
    if (!right) {
        throw std::logic_error("index lists sentence \"" + right_donor + "\" under \"" + pivot
                               + "\" but the sentence does not contain it");
    }

    std::string response = join(*right, " ");
    if (left.empty()) {
        return response;
    }
    return join(left, " ") + " " + response;
}

} // namespace seeborg
