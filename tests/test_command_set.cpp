/**
 * @file test_command_set.cpp
 * @brief End-to-end tests against the sample command set used by the console
 */

#include <sstream>
#include <string>

#include "command_set.hpp"
#include "gtest/gtest.h"

namespace {

class CommandSetTest : public ::testing::Test {
protected:
    CommandSetTest() : processor_("Test command set") {
        processor_.setErr(err_);
        demo::registerCommandSet(processor_);
    }

    // The "Usage:" line of a command article with brackets removed and the alias list
    // replaced by its first alias.
    std::string usageAsLine(const std::string& path) const {
        const auto article = processor_.getHelp(path).value_or("");
        const auto begin = article.find("Usage: ");
        const auto end = article.find('\n', begin);
        std::string usage = article.substr(begin + 7, end == std::string::npos ? std::string::npos : end - begin - 7);
        const auto space = usage.find(' ');
        const auto bar = usage.find('|');
        if (bar != std::string::npos && bar < space) usage.erase(bar, space - bar);
        std::string out;
        for (const char ch : usage) {
            if (ch != '[' && ch != ']') out += ch;
        }
        return out;
    }

    std::ostringstream err_;
    thumb::Processor processor_;
};

TEST_F(CommandSetTest, CountWordsInMultisegmentedText) {
    EXPECT_EQ("5", processor_.processLine("tu cw the bird is the word"));
    EXPECT_EQ("5", processor_.processLine("textutils metrics countwords the bird is the word"));
}

TEST_F(CommandSetTest, DivisorValidation) {
    EXPECT_EQ("Error validating argument \"dvs\". Divisor can not be zero.", processor_.processLine("calc div 10 0"));
    EXPECT_EQ("2.5", processor_.processLine("calc div 10 4"));
}

TEST_F(CommandSetTest, OptionalCharacterOmitted) {
    EXPECT_EQ("abracadabra", processor_.processLine("tu rc abracadabra"));
    EXPECT_EQ("brcdbr", processor_.processLine("tu rc abracadabra a"));
    EXPECT_EQ("Error parsing argument \"char\". Single character expected.", processor_.processLine("tu rc abc ab"));
}

TEST_F(CommandSetTest, UnknownFirstToken) {
    EXPECT_EQ("Command not found!", processor_.processLine("xyz"));
}

TEST_F(CommandSetTest, GroupPathWithUnknownTail) {
    EXPECT_FALSE(processor_.getHelp("tu mt nowhere").has_value());
    EXPECT_EQ("Please specify a command within a \"metrics|metr|mt\" group!", processor_.processLine("tu mt"));

    processor_.suggestions();
    EXPECT_EQ("Command not found! Did you mean: cc, countchars, countwords?", processor_.processLine("tu mt c"));
}

TEST_F(CommandSetTest, SharedCommandAnswersFromBothPaths) {
    EXPECT_EQ(processor_.processLine("tu dst"), processor_.processLine("fr dst"));
    EXPECT_EQ("3", processor_.processLine("fr cc abc"));
    EXPECT_EQ("3", processor_.processLine("tu mt cc abc"));
}

TEST_F(CommandSetTest, DefaultsMatchExplicitText) {
    EXPECT_EQ(processor_.processLine("calc add"), processor_.processLine("calc add "));
    EXPECT_EQ("0", processor_.processLine("calc add"));
    EXPECT_EQ("6", processor_.processLine("calc add 1 2 3"));
    EXPECT_EQ("Can not compute, sum is too big.", processor_.processLine("calc add 2147483647 1"));
}

TEST_F(CommandSetTest, BrokenDefaultSurfacesAsParseError) {
    EXPECT_EQ("Error parsing argument \"times\". Numeric value expected.", processor_.processLine("tu repw hi"));
    EXPECT_EQ("hi hi ", processor_.processLine("tu repw hi 2"));
}

TEST_F(CommandSetTest, MultisegmentedAfterPositional) {
    EXPECT_EQ("a b a b ", processor_.processLine("tu repp 2 a b"));
}

TEST_F(CommandSetTest, UsageLineParsesBack) {
    EXPECT_EQ("tu mt countwords text", "tu mt " + usageAsLine("tu mt cw"));
    EXPECT_EQ("1", processor_.processLine("tu mt " + usageAsLine("tu mt cw")));
    EXPECT_EQ("4", processor_.processLine("tu mt " + usageAsLine("tu mt cc")));
}

TEST_F(CommandSetTest, CustomArgumentType) {
    EXPECT_EQ("Error parsing argument \"format\". Only date/time/full or d/t/f values are expected.",
              processor_.processLine("sdt week"));
    EXPECT_EQ(5u, processor_.processLine("sdt t").size());
}

TEST_F(CommandSetTest, NoDiagnosticsForUserErrors) {
    processor_.processLine("calc div 1 0");
    processor_.processLine("nope");
    EXPECT_TRUE(err_.str().empty());
}

} // namespace
