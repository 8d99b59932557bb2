#include "../include/seeborg/bot.hpp"
#include "../include/seeborg/log.hpp"
#include "../include/seeborg/text.hpp"

#include <stdexcept>
#include <utility>

namespace seeborg {

Bot::Bot(Config config, Dictionary dictionary, std::unique_ptr<RandomSource> random)
    : m_config(std::move(config)), m_dictionary(std::move(dictionary)), m_random(std::move(random)) {
    if (!m_random) {
        throw std::invalid_argument("Bot requires a random source");
    }
}

Bot Bot::open(Config config, std::unique_ptr<RandomSource> random) {
    Dictionary dictionary = Dictionary::load(config.dictionary_path);
    const bool stale = dictionary.needs_index_rebuild();
    Bot bot(std::move(config), std::move(dictionary), std::move(random));
    if (stale) {
        log(LogLevel::Info, "Bot", "Dictionary has no index; rebuilding");
        bot.rebuild();
    }
    return bot;
}

std::optional<std::string> Bot::process(const std::string& line) {
    if (trim(line).empty()) {
        return std::nullopt;
    }

    std::optional<std::string> response;
    if (m_config.speaking && should_reply()) {
        response = m_dictionary.respond_to(line, *m_random);
    }

    if (m_config.learning && m_dictionary.learn(line)) {
        ++m_unsaved_lines;
        maybe_autosave();
    }
    return response;
}

void Bot::save() {
    m_dictionary.write_to_disk(m_config.dictionary_path);
    m_unsaved_lines = 0;
    log(LogLevel::Debug, "Bot", "Saved dictionary to " + m_config.dictionary_path.string());
}

void Bot::rebuild() {
    m_dictionary.rebuild_indices();
    // Sentence positions moved; the file on disk no longer matches.
    if (m_dictionary.sentence_count() > 0) {
        ++m_unsaved_lines;
    }
}

bool Bot::should_reply() {
    if (m_config.reply_rate >= 1.0) {
        return true;
    }
    if (m_config.reply_rate <= 0.0) {
        return false;
    }
    return draw_unit(*m_random) < m_config.reply_rate;
}

void Bot::maybe_autosave() {
    if (m_config.autosave_every == 0 || m_unsaved_lines < m_config.autosave_every) {
        return;
    }
    try {
        save();
    } catch (const DictionaryError& error) {
        // Keep the counter so the next learned line retries.
        log(LogLevel::Error, "Bot", std::string("Autosave failed: ") + error.what());
    }
}

} // namespace seeborg
