/**
 * @file test_help.cpp
 * @brief Unit tests for command articles and the pseudo-graphic tree
 */

#include <string>
#include <vector>

#include "thumb/arguments.hpp"
#include "thumb/help.hpp"
#include "thumb/processor.hpp"
#include "gtest/gtest.h"

using namespace thumb;

namespace {

Command reply(std::vector<std::string> aliases, std::string description) {
    Command cmd(std::move(aliases), std::move(description));
    cmd.action([](const Args&) { return std::string(); });
    return cmd;
}

// ============================================================================
// ARTICLE
// ============================================================================

TEST(HelpArticleTest, CommandWithoutArguments) {
    const BoundCommand cmd(reply({"displaysampletext", "dst"}, "display sample text"));
    EXPECT_EQ("Command: displaysampletext|dst\n"
              "Description: display sample text\n"
              "Usage: displaysampletext|dst",
              help::renderCommandArticle(cmd));
}

TEST(HelpArticleTest, OptionalArgumentsAreBracketed) {
    const BoundCommand cmd(reply({"repw"}, "repeat word X number of times")
                               .argument(args::string(0, "word", "word to repeat"))
                               .argument(args::nonNegativeInteger(1, "times", "number of times to repeat").defaultValue("one")));
    EXPECT_EQ("Command: repw\n"
              "Description: repeat word X number of times\n"
              "Usage: repw word [times]\n"
              "   Arguments:\n"
              "      word: word to repeat\n"
              "      times: number of times to repeat (optional, default: \"one\")",
              cmd.helpArticle());
}

TEST(HelpArticleTest, OptionalWithoutDefault) {
    const BoundCommand cmd(reply({"removechar", "rc"}, "remove character in a word")
                               .argument(args::character(1, "char", "character to be removed").optional())
                               .argument(args::string(0, "word", "word to remove character from")));
    EXPECT_EQ("Command: removechar|rc\n"
              "Description: remove character in a word\n"
              "Usage: removechar|rc word [char]\n"
              "   Arguments:\n"
              "      word: word to remove character from\n"
              "      char: character to be removed (optional)",
              cmd.helpArticle());
}

TEST(HelpArticleTest, ArticleIsBuiltOnce) {
    const BoundCommand cmd(reply({"x"}, "x"));
    const std::string& first = cmd.helpArticle();
    EXPECT_EQ(&first, &cmd.helpArticle());
}

// ============================================================================
// TREE
// ============================================================================

/**
 * @brief Two levels of groups plus a command shared between two groups.
 */
class HelpTreeTest : public ::testing::Test {
protected:
    HelpTreeTest() : processor_("Test command set") {
        processor_.addGroup("", {"textutils", "tu"}, "some useful text utils");
        processor_.addGroup("tu", {"metrics", "mt"}, "calculate various string metrics");
        const auto fr = processor_.addGroup("", {"fr"}, "frequently used commands");
        const auto dst = processor_.addCommand("tu", reply({"displaysampletext", "dst"}, "display sample text"));
        processor_.addCommand("tu mt", reply({"countchars", "cc"}, "count characters in a word"));
        processor_.addCommand("tu mt", reply({"countwords", "cw"}, "count words"));
        processor_.attachCommand(fr, dst);
        processor_.addCommand("", reply({"help", "h"}, "show help"));
    }

    Processor processor_;
};

TEST_F(HelpTreeTest, RootTree) {
    const std::string expected = "Test command set\n"
                                 "├──<textutils|tu: some useful text utils>\n"
                                 "│  ├──<metrics|mt: calculate various string metrics>\n"
                                 "│  │  ├──\"countchars|cc\" - count characters in a word\n"
                                 "│  │  └──\"countwords|cw\" - count words\n"
                                 "│  └──\"displaysampletext|dst\" - display sample text\n"
                                 "├──<fr: frequently used commands>\n"
                                 "│  └──\"displaysampletext|dst\" - display sample text\n"
                                 "└──\"help|h\" - show help";
    EXPECT_EQ(expected, processor_.getHelp(""));
}

TEST_F(HelpTreeTest, SubtreeStartsWithGroupHeader) {
    const std::vector<std::string> expected{
        "<metrics|mt: calculate various string metrics>",
        "├──\"countchars|cc\" - count characters in a word",
        "└──\"countwords|cw\" - count words",
    };
    const auto outcome = processor_.registry().search("textutils mt");
    ASSERT_TRUE(std::holds_alternative<GroupFound>(outcome));
    EXPECT_EQ(expected, help::renderTree(processor_.registry(), std::get<GroupFound>(outcome).group));
}

TEST_F(HelpTreeTest, LastGroupUsesBlankContinuation) {
    Processor p("Root");
    p.addGroup("", {"a"}, "group a");
    p.addCommand("a", reply({"b"}, "command b"));
    EXPECT_EQ("Root\n"
              "└──<a: group a>\n"
              "   └──\"b\" - command b",
              p.getHelp(""));
}

TEST_F(HelpTreeTest, ArticleAndUsageAgree) {
    const auto article = processor_.getHelp("tu mt cc");
    ASSERT_TRUE(article.has_value());
    EXPECT_NE(std::string::npos, article->find("Usage: countchars|cc"));
    EXPECT_FALSE(processor_.getHelp("tu mt cc extra").has_value());
    EXPECT_FALSE(processor_.getHelp("tu nope").has_value());
}

TEST(HelpTest, JoinLinesHasNoTrailingNewline) {
    EXPECT_EQ("a\nb", help::joinLines({"a", "b"}));
    EXPECT_EQ("", help::joinLines({}));
}

} // namespace
