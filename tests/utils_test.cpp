#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cmdtree/utils.hpp"

using namespace cmdtree;

TEST(Utils, LevenshteinDistance) {
    EXPECT_EQ(utils::levenshteinDistance("", "abc"), 3u);
    EXPECT_EQ(utils::levenshteinDistance("kitten", "sitting"), 3u);
    EXPECT_EQ(utils::levenshteinDistance("show", "show"), 0u);
}

TEST(Utils, SuggestPrefersPrefixesThenDistance) {
    const std::vector<std::string> words{"status", "show", "shutdown", "stop"};
    const auto out = utils::suggest("sho", words);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front(), "show");
    EXPECT_TRUE(utils::suggest("zzzzzz", words).empty());
}

TEST(Utils, GlobMatch) {
    EXPECT_TRUE(utils::globMatch("*", "anything"));
    EXPECT_TRUE(utils::globMatch("t?st", "test"));
    EXPECT_TRUE(utils::globMatch("te[rs]*", "term"));
    EXPECT_FALSE(utils::globMatch("te[!rs]*", "term"));
    EXPECT_TRUE(utils::globMatch("[a-c]x", "bx"));
    EXPECT_FALSE(utils::globMatch("a*b", "acd"));
    EXPECT_TRUE(utils::globMatch("a*b", "acdb"));
}

TEST(Utils, GlobValidity) {
    EXPECT_TRUE(utils::isValidGlob("a[bc]"));
    EXPECT_FALSE(utils::isValidGlob("a[bc"));
    EXPECT_TRUE(utils::hasGlobChars("a*"));
    EXPECT_FALSE(utils::hasGlobChars("abc"));
}

TEST(Utils, EscapeRegex) {
    EXPECT_EQ(utils::escapeRegex("a.b"), "a\\.b");
    EXPECT_EQ(utils::escapeRegex("show-all"), "show-all");
    EXPECT_EQ(utils::escapeRegex("(x)"), "\\(x\\)");
}

TEST(Utils, LiteralChoices) {
    EXPECT_EQ(*utils::literalChoices("TERM|KILL"), (std::vector<std::string>{"TERM", "KILL"}));
    EXPECT_EQ(*utils::literalChoices("(on|off)"), (std::vector<std::string>{"on", "off"}));
    EXPECT_EQ(*utils::literalChoices("(?:a|b\\.c)"), (std::vector<std::string>{"a", "b.c"}));
    EXPECT_FALSE(utils::literalChoices("\\d+").has_value());
    EXPECT_FALSE(utils::literalChoices("a|b*").has_value());
}

TEST(Utils, TokenizeKeepsOffsets) {
    const std::string input = "  set  name \"a b\" x";
    const auto tokens = utils::tokenize(input);
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].text, "set");
    EXPECT_EQ(tokens[0].begin, 2u);
    EXPECT_EQ(tokens[2].text, "\"a b\"");
    EXPECT_EQ(input.substr(tokens[2].begin, tokens[2].end - tokens[2].begin), "\"a b\"");
    EXPECT_EQ(tokens[3].end, input.size());
}

TEST(Utils, TokenizeBlankInput) {
    EXPECT_TRUE(utils::tokenize("").empty());
    EXPECT_TRUE(utils::tokenize(" \t ").empty());
}
