#include "../include/seeborg/persistence.hpp"
#include "../include/seeborg/log.hpp"
#include "../include/seeborg/text.hpp"
#include "../include/seeborg/tokenizer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace seeborg {

namespace {

constexpr const char* kSentencesKey = "sentences";
constexpr const char* kIndicesKey = "indices";

std::string errno_text() {
    return errno != 0 ? std::string(std::strerror(errno)) : std::string("unknown error");
}

[[noreturn]] void fail_parse(const std::filesystem::path& origin, const std::string& message) {
    throw DictionaryError(DictionaryError::Kind::Parse, origin, message);
}

[[noreturn]] void fail_io(const std::filesystem::path& path, const std::string& message) {
    throw DictionaryError(DictionaryError::Kind::Io, path, message);
}

std::vector<std::string> read_sentences(const Json& value, const std::filesystem::path& origin) {
    if (!value.is_array()) {
        fail_parse(origin, "\"sentences\" must be an array of strings");
    }
    std::vector<std::string> sentences;
    sentences.reserve(value.as_array().size());
    for (const auto& entry : value.as_array()) {
        if (!entry.is_string()) {
            fail_parse(origin, "sentence " + std::to_string(sentences.size()) + " is not a string");
        }
        sentences.push_back(entry.as_string());
    }

    std::unordered_set<std::string> seen;
    seen.reserve(sentences.size());
    for (std::size_t position = 0; position < sentences.size(); ++position) {
        if (!seen.insert(to_lower(sentences[position])).second) {
            fail_parse(origin, "sentence " + std::to_string(position) + " repeats an earlier sentence");
        }
    }
    return sentences;
}

Indices read_indices(const Json& value, const std::vector<std::string>& sentences,
                     const std::filesystem::path& origin) {
    if (!value.is_object()) {
        fail_parse(origin, "\"indices\" must be an object");
    }
    if (value.as_object().empty()) {
        return {};
    }

    std::vector<std::unordered_set<std::string>> words_by_sentence;
    words_by_sentence.reserve(sentences.size());
    for (const auto& sentence : sentences) {
        const auto words = split_words(to_lower(sentence));
        words_by_sentence.emplace_back(words.begin(), words.end());
    }

    Indices indices;
    indices.reserve(value.as_object().size());
    std::size_t listed = 0;
    for (const auto& [word, positions] : value.as_object()) {
        if (!positions.is_array()) {
            fail_parse(origin, "index entry \"" + word + "\" is not an array");
        }
        std::vector<std::size_t> list;
        list.reserve(positions.as_array().size());
        for (const auto& position : positions.as_array()) {
            if (!position.is_integer() || position.as_integer() < 0) {
                fail_parse(origin, "index entry \"" + word + "\" holds a value that is not a non-negative integer");
            }
            const auto index = static_cast<std::size_t>(position.as_integer());
            if (index >= sentences.size()) {
                fail_parse(origin, "index entry \"" + word + "\" points past the last sentence ("
                                       + std::to_string(index) + " >= " + std::to_string(sentences.size()) + ")");
            }
            if (words_by_sentence[index].count(word) == 0) {
                fail_parse(origin, "index entry \"" + word + "\" lists sentence " + std::to_string(index)
                                       + ", which does not contain it");
            }
            if (!list.empty() && index <= list.back()) {
                fail_parse(origin, "index entry \"" + word + "\" repeats sentence " + std::to_string(index)
                                       + " or is out of order");
            }
            list.push_back(index);
        }
        listed += list.size();
        indices.emplace(word, std::move(list));
    }

    // Every listed entry is a distinct (word, sentence) pair found in that
    // sentence, so equal totals mean no sentence word was left out.
    std::size_t expected = 0;
    for (const auto& words : words_by_sentence) {
        expected += words.size();
    }
    if (listed != expected) {
        fail_parse(origin, "index lists " + std::to_string(listed) + " word occurrences but the sentences hold "
                               + std::to_string(expected));
    }
    return indices;
}

} // namespace

Json dictionary_to_json(const Dictionary& dictionary) {
    JsonArray sentences;
    sentences.reserve(dictionary.sentences().size());
    for (const auto& sentence : dictionary.sentences()) {
        sentences.emplace_back(Json(sentence));
    }

    JsonObject indices;
    for (const auto& [word, positions] : dictionary.indices()) {
        JsonArray list;
        list.reserve(positions.size());
        for (std::size_t position : positions) {
            list.emplace_back(Json(static_cast<std::uint64_t>(position)));
        }
        indices.emplace(word, Json(std::move(list)));
    }

    JsonObject root;
    root[kSentencesKey] = Json(std::move(sentences));
    root[kIndicesKey] = Json(std::move(indices));
    return Json(std::move(root));
}

Dictionary dictionary_from_json(const Json& document, const std::filesystem::path& origin) {
    if (!document.is_object()) {
        fail_parse(origin, "dictionary document must be a JSON object");
    }
    const auto& root = document.as_object();

    auto sentences_it = root.find(kSentencesKey);
    if (sentences_it == root.end()) {
        fail_parse(origin, "missing \"sentences\" field");
    }
    std::vector<std::string> sentences = read_sentences(sentences_it->second, origin);

    auto indices_it = root.find(kIndicesKey);
    if (indices_it == root.end()) {
        fail_parse(origin, "missing \"indices\" field");
    }
    Indices indices = read_indices(indices_it->second, sentences, origin);
    return Dictionary(std::move(sentences), std::move(indices));
}

Dictionary load_dictionary(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    const bool exists = fs::is_regular_file(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        fail_io(path, ec.message());
    }
    if (!exists) {
        Dictionary dictionary = Dictionary::new_empty();
        save_dictionary(dictionary, path);
        log(LogLevel::Info, "Dictionary", "Created empty dictionary at " + path.string());
        return dictionary;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        fail_io(path, "unable to open for reading: " + errno_text());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        fail_io(path, "read failed: " + errno_text());
    }

    Json document;
    try {
        document = Json::parse(buffer.str());
    } catch (const JsonParseError& error) {
        fail_parse(path, error.what());
    }
    Dictionary dictionary = dictionary_from_json(document, path);
    log(LogLevel::Info, "Dictionary",
        "Loaded " + std::to_string(dictionary.sentence_count()) + " sentences and "
            + std::to_string(dictionary.word_count()) + " words from " + path.string());
    return dictionary;
}

void save_dictionary(const Dictionary& dictionary, const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            fail_io(path, "unable to create parent directory: " + ec.message());
        }
    }

    const std::string payload = dictionary_to_json(dictionary).dump();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        fail_io(path, "unable to open for writing: " + errno_text());
    }
    out << payload;
    out.flush();
    if (!out) {
        fail_io(path, "write failed: " + errno_text());
    }
}

} // namespace seeborg
