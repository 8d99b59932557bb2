// =============================================================================
// Tokenizer Tests
// =============================================================================

#include <gtest/gtest.h>
#include "seeborg/tokenizer.hpp"

#include <string>
#include <vector>

using namespace seeborg;
using Strings = std::vector<std::string>;

TEST(SplitSentences, SplitsOnTerminalPunctuationFollowedBySpace) {
    EXPECT_EQ((Strings{"Hi.", "This is a test.", "We.cant.split.this."}),
              split_sentences("Hi. This is a test. We.cant.split.this."));
}

TEST(SplitSentences, KeepsUrlsAndPunctuationRunsTogether) {
    const Strings expected{
        "Hi.",
        "This sentence is going to be split.",
        "We.cant.split.things.that.look.like.urls.",
        "That's a single sentence.",
        "Lol!",
        "A single sentence!!!!",
        "Look at this image: https://imgur.com/gallery/PXSNky0",
    };
    EXPECT_EQ(expected,
              split_sentences("Hi. This sentence is going to be split. "
                              "We.cant.split.things.that.look.like.urls. That's a single sentence. "
                              "Lol! A single sentence!!!! Look at this image: https://imgur.com/gallery/PXSNky0"));
}

TEST(SplitSentences, MixedPunctuationRun) {
    EXPECT_EQ((Strings{"how is everyone doing today?!", "fine"}),
              split_sentences("how is everyone doing today?!   fine"));
}

TEST(SplitSentences, TrimsAndDropsEmptySegments) {
    EXPECT_EQ((Strings{"hello there.", "bye"}), split_sentences("  hello there. \n\t bye  "));
    EXPECT_TRUE(split_sentences("").empty());
    EXPECT_TRUE(split_sentences("   \t ").empty());
    EXPECT_EQ((Strings{"end."}), split_sentences("end.   "));
}

TEST(SplitSentences, NewlinesCountAsWhitespace) {
    EXPECT_EQ((Strings{"one!", "two?", "three"}), split_sentences("one!\ntwo?\r\nthree"));
}

TEST(SplitSentences, NoTerminatorMeansOneSentence) {
    EXPECT_EQ((Strings{"no punctuation at all"}), split_sentences("no punctuation at all"));
}

TEST(SplitWords, SplitsOnDelimiterRuns) {
    EXPECT_EQ((Strings{"Hello", "world", "This", "is", "a", "test", "I", "am", "a", "test"}),
              split_words("...Hello world!!!!This is a test? I.am.a.test."));
}

TEST(SplitWords, ColonsAndCommas) {
    EXPECT_EQ((Strings{"look", "at", "this", "https", "//imgur", "com/gallery"}),
              split_words("look at this: https://imgur.com/gallery"));
    EXPECT_EQ((Strings{"hey", "there", "everyone"}), split_words("hey there, everyone!"));
}

TEST(SplitWords, KeepsApostrophesAndCase) {
    EXPECT_EQ((Strings{"I've", "been", "doing", "FINE"}), split_words("I've been doing FINE"));
}

TEST(SplitWords, EmptyAndDelimiterOnly) {
    EXPECT_TRUE(split_words("").empty());
    EXPECT_TRUE(split_words(" ,.!?: \t").empty());
}

TEST(SplitWords, LongWhitespaceRun) {
    const std::string gap(200000, ' ');
    EXPECT_EQ((Strings{"a", "b"}), split_words("a" + gap + "b"));
    EXPECT_EQ((Strings{"a", "b"}), split_words("a," + gap + ":b"));
}

TEST(SplitSentences, LongWhitespaceRun) {
    const std::string gap(200000, ' ');
    EXPECT_EQ((Strings{"a.", "b"}), split_sentences("a." + gap + "b"));
    EXPECT_EQ((Strings{"a!", "b."}), split_sentences("a!\n" + gap + "b." + gap));
}
