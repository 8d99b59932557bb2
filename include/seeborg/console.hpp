#pragma once

#include "bot.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace seeborg {

// Line-oriented front end. "!save", "!rebuild", "!stats" and "!quit" are
// commands; any other line is passed to the bot and its response, if any,
// is written back as one line. The dictionary is saved when the loop ends.
class Console {
public:
    explicit Console(Bot& bot);

    void run(std::istream& in, std::ostream& out);

private:
    enum class CommandResult {
        NotACommand,
        Handled,
        Quit
    };

    Bot* m_bot;

    CommandResult handle_command(const std::string& line, std::ostream& out);
    bool try_save();
};

} // namespace seeborg
