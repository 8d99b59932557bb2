#include "../include/seeborg/bot.hpp"
#include "../include/seeborg/config.hpp"
#include "../include/seeborg/console.hpp"
#include "../include/seeborg/log.hpp"

#include <iostream>
#include <memory>
#include <string>

int main() {
    using namespace seeborg;

    const Config config = resolve_config();
    set_log_level(config.log_level);

    try {
        Bot bot = Bot::open(config, std::make_unique<EngineRandomSource<>>());
        Console console(bot);
        console.run(std::cin, std::cout);
    } catch (const DictionaryError& error) {
        log(LogLevel::Error, "seeborg", std::string("Unable to load dictionary: ") + error.what());
        return 1;
    }
    return 0;
}
