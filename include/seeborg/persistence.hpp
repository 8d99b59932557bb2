#pragma once

#include "dictionary.hpp"
#include "json.hpp"

#include <filesystem>

namespace seeborg {

// {"indices": {word: [positions...]}, "sentences": [...]}
Json dictionary_to_json(const Dictionary& dictionary);

// Validates the document shape, rejects repeated sentences and checks that a
// non-empty index matches the sentences exactly. An empty "indices" object is
// legacy data that still needs a rebuild. Throws DictionaryError (Parse),
// naming `origin` when given.
Dictionary dictionary_from_json(const Json& document, const std::filesystem::path& origin = {});

Dictionary load_dictionary(const std::filesystem::path& path);
void save_dictionary(const Dictionary& dictionary, const std::filesystem::path& path);

} // namespace seeborg
