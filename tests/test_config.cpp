// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "seeborg/config.hpp"
#include "seeborg/log.hpp"

#include <map>
#include <sstream>
#include <string>

using namespace seeborg;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_stream(&m_log); }
    void TearDown() override { set_log_stream(nullptr); }

    Config resolve() {
        return resolve_config([this](const char* name) -> std::optional<std::string> {
            auto it = m_env.find(name);
            if (it == m_env.end()) {
                return std::nullopt;
            }
            return it->second;
        });
    }

    std::map<std::string, std::string> m_env;
    std::ostringstream m_log;
};

TEST_F(ConfigTest, DefaultsWithEmptyEnvironment) {
    const Config config = resolve();
    EXPECT_EQ("data/dictionary.json", config.dictionary_path.string());
    EXPECT_TRUE(config.learning);
    EXPECT_TRUE(config.speaking);
    EXPECT_DOUBLE_EQ(1.0, config.reply_rate);
    EXPECT_EQ(50u, config.autosave_every);
    EXPECT_EQ(LogLevel::Info, config.log_level);
    EXPECT_TRUE(m_log.str().empty());
}

TEST_F(ConfigTest, ReadsOverrides) {
    m_env = {
        {"SEEBORG_DICTIONARY", " /tmp/bot/dict.json "},
        {"SEEBORG_LEARNING", "off"},
        {"SEEBORG_SPEAKING", "No"},
        {"SEEBORG_REPLY_RATE", "0.25"},
        {"SEEBORG_AUTOSAVE", "0"},
        {"SEEBORG_LOG_LEVEL", "debug"},
    };
    const Config config = resolve();
    EXPECT_EQ("/tmp/bot/dict.json", config.dictionary_path.string());
    EXPECT_FALSE(config.learning);
    EXPECT_FALSE(config.speaking);
    EXPECT_DOUBLE_EQ(0.25, config.reply_rate);
    EXPECT_EQ(0u, config.autosave_every);
    EXPECT_EQ(LogLevel::Debug, config.log_level);
}

TEST_F(ConfigTest, ReplyRateIsClamped) {
    m_env = {{"SEEBORG_REPLY_RATE", "3.5"}};
    EXPECT_DOUBLE_EQ(1.0, resolve().reply_rate);
    m_env = {{"SEEBORG_REPLY_RATE", "-1"}};
    EXPECT_DOUBLE_EQ(0.0, resolve().reply_rate);
}

TEST_F(ConfigTest, InvalidValuesKeepDefaultsAndWarn) {
    m_env = {
        {"SEEBORG_DICTIONARY", "   "},
        {"SEEBORG_LEARNING", "maybe"},
        {"SEEBORG_REPLY_RATE", "often"},
        {"SEEBORG_AUTOSAVE", "-3"},
        {"SEEBORG_LOG_LEVEL", "chatty"},
    };
    const Config config = resolve();
    EXPECT_EQ("data/dictionary.json", config.dictionary_path.string());
    EXPECT_TRUE(config.learning);
    EXPECT_DOUBLE_EQ(1.0, config.reply_rate);
    EXPECT_EQ(50u, config.autosave_every);
    EXPECT_EQ(LogLevel::Info, config.log_level);

    const std::string warnings = m_log.str();
    EXPECT_NE(std::string::npos, warnings.find("SEEBORG_LEARNING=\"maybe\""));
    EXPECT_NE(std::string::npos, warnings.find("SEEBORG_REPLY_RATE=\"often\""));
    EXPECT_NE(std::string::npos, warnings.find("SEEBORG_AUTOSAVE=\"-3\""));
    EXPECT_NE(std::string::npos, warnings.find("SEEBORG_LOG_LEVEL=\"chatty\""));
}

TEST_F(ConfigTest, NanReplyRateIsRejected) {
    m_env = {{"SEEBORG_REPLY_RATE", "nan"}};
    EXPECT_DOUBLE_EQ(1.0, resolve().reply_rate);
}

TEST(ParseBoolTest, AcceptedSpellings) {
    for (const char* yes : {"1", "true", "YES", " on "}) {
        EXPECT_EQ(std::optional<bool>(true), parse_bool(yes)) << yes;
    }
    for (const char* no : {"0", "False", "no", "OFF"}) {
        EXPECT_EQ(std::optional<bool>(false), parse_bool(no)) << no;
    }
    EXPECT_EQ(std::nullopt, parse_bool(""));
    EXPECT_EQ(std::nullopt, parse_bool("2"));
}
