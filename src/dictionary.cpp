#include "../include/seeborg/dictionary.hpp"
#include "../include/seeborg/log.hpp"
#include "../include/seeborg/persistence.hpp"
#include "../include/seeborg/responder.hpp"
#include "../include/seeborg/text.hpp"
#include "../include/seeborg/tokenizer.hpp"

#include <algorithm>
#include <utility>

namespace seeborg {

DictionaryError::DictionaryError(Kind kind, std::filesystem::path path, const std::string& message)
    : std::runtime_error(path.empty() ? message : path.string() + ": " + message),
      m_kind(kind),
      m_path(std::move(path)) {}

void insert_word_into_indices(Indices& indices, const std::string& word, std::size_t position) {
    auto& entry = indices[word];
    // Positions arrive in ascending order from learn and rebuild_indices.
    if (entry.empty() || entry.back() < position) {
        entry.push_back(position);
        return;
    }
    if (std::find(entry.begin(), entry.end(), position) == entry.end()) {
        entry.push_back(position);
    }
}

Dictionary::Dictionary(std::vector<std::string> sentences, Indices indices)
    : m_sentences(std::move(sentences)), m_indices(std::move(indices)) {
    rebuild_known_sentences();
}

Dictionary Dictionary::new_empty() {
    return Dictionary();
}

Dictionary Dictionary::load(const std::filesystem::path& path) {
    return load_dictionary(path);
}

void Dictionary::write_to_disk(const std::filesystem::path& path) const {
    save_dictionary(*this, path);
}

bool Dictionary::needs_index_rebuild() const noexcept {
    return !m_sentences.empty() && m_indices.empty();
}

void Dictionary::rebuild_indices() {
    std::vector<std::pair<std::string, std::string>> keyed;
    keyed.reserve(m_sentences.size());
    for (auto& sentence : m_sentences) {
        std::string key = to_lower(sentence);
        keyed.emplace_back(std::move(key), std::move(sentence));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    m_indices.clear();
    m_known_sentences.clear();
    for (std::size_t position = 0; position < keyed.size(); ++position) {
        auto& [lowered, sentence] = keyed[position];
        log(LogLevel::Debug, "Dictionary", "Indexing: \"" + lowered + "\"");
        for (const auto& word : split_words(lowered)) {
            insert_word_into_indices(m_indices, word, position);
        }
        m_sentences[position] = std::move(sentence);
        m_known_sentences.insert(std::move(lowered));
    }
    log(LogLevel::Info, "Dictionary",
        "Rebuilt index: " + std::to_string(m_sentences.size()) + " sentences, "
            + std::to_string(m_indices.size()) + " words");
}

bool Dictionary::knows_sentence(const std::string& sentence) const {
    return m_known_sentences.find(to_lower(sentence)) != m_known_sentences.end();
}

bool Dictionary::knows_word(const std::string& word) const {
    return m_indices.find(word) != m_indices.end();
}

bool Dictionary::learn(const std::string& line) {
    bool learned_something = false;
    for (auto& sentence : split_sentences(to_lower(line))) {
        if (knows_sentence(sentence)) {
            continue;
        }
        const std::size_t position = m_sentences.size();
        for (const auto& word : split_words(sentence)) {
            insert_word_into_indices(m_indices, word, position);
        }
        m_known_sentences.insert(sentence);
        m_sentences.push_back(std::move(sentence));
        learned_something = true;
    }
    return learned_something;
}

std::vector<std::string> Dictionary::sentences_with_word(const std::string& word) const {
    std::vector<std::string> result;
    auto it = m_indices.find(word);
    if (it == m_indices.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (std::size_t position : it->second) {
        result.push_back(m_sentences.at(position));
    }
    return result;
}

std::vector<std::string> Dictionary::known_words(const std::string& line) const {
    std::vector<std::string> known;
    for (auto& word : split_words(to_lower(line))) {
        if (knows_word(word)) {
            known.push_back(std::move(word));
        }
    }
    return known;
}

std::optional<std::string> Dictionary::respond_to(const std::string& line, RandomSource& random) const {
    return seeborg::respond_to(*this, line, random);
}

void Dictionary::rebuild_known_sentences() {
    m_known_sentences.clear();
    m_known_sentences.reserve(m_sentences.size());
    for (const auto& sentence : m_sentences) {
        m_known_sentences.insert(to_lower(sentence));
    }
}

} // namespace seeborg
