#include "../include/seeborg/console.hpp"
#include "../include/seeborg/log.hpp"
#include "../include/seeborg/text.hpp"

namespace seeborg {

Console::Console(Bot& bot) : m_bot(&bot) {}

void Console::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const CommandResult command = handle_command(line, out);
        if (command == CommandResult::Quit) {
            break;
        }
        if (command == CommandResult::Handled) {
            continue;
        }
        if (auto response = m_bot->process(line)) {
            out << *response << std::endl;
        }
    }
    if (m_bot->unsaved_lines() > 0) {
        try_save();
    }
}

Console::CommandResult Console::handle_command(const std::string& line, std::ostream& out) {
    const std::string command = trim(line);
    if (command == "!quit") {
        return CommandResult::Quit;
    }
    if (command == "!save") {
        out << (try_save() ? "Dictionary saved." : "Saving failed, see log.") << std::endl;
        return CommandResult::Handled;
    }
    if (command == "!rebuild") {
        m_bot->rebuild();
        out << "Index rebuilt." << std::endl;
        return CommandResult::Handled;
    }
    if (command == "!stats") {
        const auto& dictionary = m_bot->dictionary();
        out << dictionary.sentence_count() << " sentences, " << dictionary.word_count() << " words." << std::endl;
        return CommandResult::Handled;
    }
    return CommandResult::NotACommand;
}

bool Console::try_save() {
    try {
        m_bot->save();
        return true;
    } catch (const DictionaryError& error) {
        log(LogLevel::Error, "Console", std::string("Unable to save dictionary: ") + error.what());
        return false;
    }
}

} // namespace seeborg
