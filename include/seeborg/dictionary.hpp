#pragma once

#include "random_source.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace seeborg {

// word -> ascending, duplicate-free positions of the sentences containing it
using Indices = std::unordered_map<std::string, std::vector<std::size_t>>;

class DictionaryError : public std::runtime_error {
public:
    enum class Kind {
        Io,
        Parse
    };

    DictionaryError(Kind kind, std::filesystem::path path, const std::string& message);

    Kind kind() const noexcept { return m_kind; }
    const std::filesystem::path& path() const noexcept { return m_path; }

private:
    Kind m_kind;
    std::filesystem::path m_path;
};

// Adds `position` to the list for `word` unless it is already there.
void insert_word_into_indices(Indices& indices, const std::string& word, std::size_t position);

class Dictionary {
public:
    Dictionary() = default;
    Dictionary(std::vector<std::string> sentences, Indices indices);

    static Dictionary new_empty();

    // Reads the dictionary stored at `path`. When no file exists there an
    // empty dictionary is written to `path` first. Throws DictionaryError.
    static Dictionary load(const std::filesystem::path& path);
    void write_to_disk(const std::filesystem::path& path) const;

    // True when there are sentences but no index (legacy or reset data).
    bool needs_index_rebuild() const noexcept;

    // Sorts the sentences by their lowercase form and recomputes the index
    // from scratch. Sentence positions change.
    void rebuild_indices();

    bool knows_sentence(const std::string& sentence) const;
    bool knows_word(const std::string& word) const;

    // Learns every sentence of `line` not seen before. Returns true if at
    // least one sentence was added.
    bool learn(const std::string& line);

    std::vector<std::string> sentences_with_word(const std::string& word) const;

    // Tokens of `line` (lowercased) that are in the index, in input order and
    // with repeats kept.
    std::vector<std::string> known_words(const std::string& line) const;

    std::optional<std::string> respond_to(const std::string& line, RandomSource& random) const;

    const std::vector<std::string>& sentences() const noexcept { return m_sentences; }
    const Indices& indices() const noexcept { return m_indices; }
    std::size_t sentence_count() const noexcept { return m_sentences.size(); }
    std::size_t word_count() const noexcept { return m_indices.size(); }

    friend bool operator==(const Dictionary& lhs, const Dictionary& rhs) {
        return lhs.m_sentences == rhs.m_sentences && lhs.m_indices == rhs.m_indices;
    }
    friend bool operator!=(const Dictionary& lhs, const Dictionary& rhs) { return !(lhs == rhs); }

private:
    std::vector<std::string> m_sentences;
    Indices m_indices;
    // lowercase form of every sentence, for knows_sentence
    std::unordered_set<std::string> m_known_sentences;

    void rebuild_known_sentences();
};

} // namespace seeborg
