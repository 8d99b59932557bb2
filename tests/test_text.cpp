#include <gtest/gtest.h>
#include "seeborg/text.hpp"

using namespace seeborg;

TEST(TextTest, LowercasesAscii) {
    EXPECT_EQ("hey there, everyone!", to_lower("Hey There, EVERYONE!"));
    EXPECT_EQ("", to_lower(""));
}

TEST(TextTest, LowercasesCommonUtf8Letters) {
    EXPECT_EQ("\xC3\xA9t\xC3\xA9", to_lower("\xC3\x89T\xC3\x89"));          // ÉTÉ -> été
    EXPECT_EQ("\xC5\xBE", to_lower("\xC5\xBD"));                            // Ž -> ž
    EXPECT_EQ("\xCE\xB1\xCE\xB2", to_lower("\xCE\x91\xCE\x92"));            // ΑΒ -> αβ
    EXPECT_EQ("\xD0\xBF\xD1\x80\xD0\xB8", to_lower("\xD0\x9F\xD0\xA0\xD0\x98")); // ПРИ -> при
}

TEST(TextTest, LeavesOtherBytesAlone) {
    EXPECT_EQ("\xC3\x97", to_lower("\xC3\x97"));           // multiplication sign
    EXPECT_EQ("\xE2\x80\x99", to_lower("\xE2\x80\x99"));   // right single quote
    EXPECT_EQ("a\xFF" "b", to_lower("A\xFF" "B"));         // malformed byte
}

TEST(TextTest, TrimAndJoin) {
    EXPECT_EQ("a b", trim(" \t a b \n"));
    EXPECT_EQ("", trim("   "));
    EXPECT_EQ("hey there everyone", join({"hey", "there", "everyone"}, " "));
    EXPECT_EQ("", join({}, " "));
    EXPECT_EQ("solo", join({"solo"}, ", "));
}
