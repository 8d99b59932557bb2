#pragma once

#include "dictionary.hpp"
#include "random_source.hpp"

#include <optional>
#include <string>
#include <vector>

namespace seeborg {

// Picks a pivot among the known words of `line`, draws two sentences that
// contain it and splices the words left of the pivot in the first with the
// pivot and everything after it in the second. Draw order: pivot, left
// donor, right donor. Returns nullopt when no word of the line is known or
// the pivot appears in fewer than two sentences.
std::optional<std::string> respond_to(const Dictionary& dictionary, const std::string& line, RandomSource& random);

// Words of `sentence` before the first occurrence of `pivot`; nullopt when
// `pivot` is not one of its words.
std::optional<std::vector<std::string>> words_left_of_pivot(const std::string& sentence, const std::string& pivot);

// Words of `sentence` from the first occurrence of `pivot` to the end.
std::optional<std::vector<std::string>> words_right_of_pivot_inclusive(const std::string& sentence,
                                                                       const std::string& pivot);

} // namespace seeborg
