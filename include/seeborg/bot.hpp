#pragma once

#include "config.hpp"
#include "dictionary.hpp"
#include "random_source.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace seeborg {

class Bot {
public:
    Bot(Config config, Dictionary dictionary, std::unique_ptr<RandomSource> random);
    Bot(const Bot&) = delete;
    Bot& operator=(const Bot&) = delete;
    Bot(Bot&&) = default;
    Bot& operator=(Bot&&) = default;

    // Loads (or creates) the dictionary at config.dictionary_path and
    // rebuilds its index when it has none. Throws DictionaryError.
    static Bot open(Config config, std::unique_ptr<RandomSource> random);

    // Answers (when speaking and the reply-rate draw passes), then learns
    // (when learning). Blank lines are ignored.
    std::optional<std::string> process(const std::string& line);

    // Throws DictionaryError.
    void save();
    // Reorders the sentences, so a non-empty dictionary counts as unsaved.
    void rebuild();

    const Config& config() const noexcept { return m_config; }
    const Dictionary& dictionary() const noexcept { return m_dictionary; }
    std::size_t unsaved_lines() const noexcept { return m_unsaved_lines; }

private:
    Config m_config;
    Dictionary m_dictionary;
    std::unique_ptr<RandomSource> m_random;
    std::size_t m_unsaved_lines = 0;

    bool should_reply();
    void maybe_autosave();
};

} // namespace seeborg
