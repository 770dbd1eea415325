/**
 * @file test_registry.cpp
 * @brief Unit tests for group/command registration and path search
 */

#include <string>
#include <variant>

#include "thumb/arguments.hpp"
#include "thumb/error.hpp"
#include "thumb/registry.hpp"
#include "gtest/gtest.h"

using namespace thumb;

namespace {

Command simpleCommand(std::vector<std::string> aliases, std::string reply = "ok") {
    Command cmd(std::move(aliases), "simple command");
    cmd.action([reply](const Args&) { return reply; });
    return cmd;
}

/**
 * @brief Root with "tu|textutils" > "mt|metrics" > "cc" and "dst" directly under "tu".
 */
class RegistryTest : public ::testing::Test {
protected:
    RegistryTest() : registry_("Test command set") {
        tu_ = registry_.addGroup("", {"textutils", "tu"}, "text utils");
        mt_ = registry_.addGroup("tu", {"metrics", "mt"}, "metrics");
        dst_ = registry_.addCommand(tu_, simpleCommand({"displaysampletext", "dst"}));
        cc_ = registry_.addCommand("textutils metrics", simpleCommand({"countchars", "cc"}));
    }

    std::string addError(std::string_view path, std::vector<std::string> aliases) {
        try {
            registry_.addCommand(path, simpleCommand(std::move(aliases)));
        } catch (const ConfigurationError& e) {
            return e.what();
        }
        return {};
    }

    Registry registry_;
    GroupId tu_;
    GroupId mt_;
    CommandId dst_;
    CommandId cc_;
};

// ============================================================================
// SEARCH
// ============================================================================

TEST_F(RegistryTest, EmptyLineFindsRoot) {
    const auto outcome = registry_.search("   ");
    ASSERT_TRUE(std::holds_alternative<GroupFound>(outcome));
    EXPECT_EQ(registry_.root(), std::get<GroupFound>(outcome).group);
}

TEST_F(RegistryTest, AnyAliasLeadsToSameGroup) {
    const auto a = registry_.search("tu mt");
    const auto b = registry_.search("textutils metrics");
    ASSERT_TRUE(std::holds_alternative<GroupFound>(a));
    ASSERT_TRUE(std::holds_alternative<GroupFound>(b));
    EXPECT_EQ(mt_, std::get<GroupFound>(a).group);
    EXPECT_EQ(mt_, std::get<GroupFound>(b).group);
}

TEST_F(RegistryTest, CommandFoundKeepsRemainder) {
    const auto outcome = registry_.search("tu mt cc  abc def");
    ASSERT_TRUE(std::holds_alternative<CommandFound>(outcome));
    const auto& found = std::get<CommandFound>(outcome);
    EXPECT_EQ(cc_, found.command);
    EXPECT_EQ("  abc def", found.remainder);
}

TEST_F(RegistryTest, SearchIsCaseInsensitive) {
    const auto outcome = registry_.search("TU Metrics CC word");
    ASSERT_TRUE(std::holds_alternative<CommandFound>(outcome));
    EXPECT_EQ(cc_, std::get<CommandFound>(outcome).command);
}

TEST_F(RegistryTest, NothingFoundReportsDeepestGroupAndToken) {
    const auto outcome = registry_.search("tu xyz cc");
    ASSERT_TRUE(std::holds_alternative<NothingFound>(outcome));
    const auto& miss = std::get<NothingFound>(outcome);
    EXPECT_EQ(tu_, miss.group);
    EXPECT_EQ("xyz", miss.token);
}

TEST_F(RegistryTest, SearchFromNestedGroup) {
    const auto outcome = registry_.search(tu_, "mt cc");
    ASSERT_TRUE(std::holds_alternative<CommandFound>(outcome));
    EXPECT_EQ(cc_, std::get<CommandFound>(outcome).command);
}

// ============================================================================
// REGISTRATION
// ============================================================================

TEST_F(RegistryTest, AliasCollisionsAreRejected) {
    EXPECT_EQ("Can not add command \"mt\". Child element named \"mt\" already exists in \"textutils|tu\" group.",
              addError("tu", {"mt"}));
    EXPECT_EQ("Can not add command \"x|dst\". Child element named \"dst\" already exists in \"textutils|tu\" group.",
              addError("tu", {"x", "dst"}));
    EXPECT_THROW(registry_.addGroup(tu_, {"dst"}, "clash with a command"), ConfigurationError);
    EXPECT_THROW(registry_.addGroup("", {"tu"}, "clash with a group"), ConfigurationError);

    try {
        registry_.addGroup("", {"new", "textutils"}, "clash");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_STREQ("Can not add group \"new|textutils\". Child element named \"textutils\" already exists in root group.",
                     e.what());
    }
}

TEST_F(RegistryTest, FailedRegistrationLeavesTreeUntouched) {
    const auto before = registry_.childAliases(tu_);
    EXPECT_FALSE(addError("tu", {"fresh", "dst"}).empty());
    EXPECT_EQ(before, registry_.childAliases(tu_));
    EXPECT_TRUE(std::holds_alternative<NothingFound>(registry_.search("tu fresh")));
}

TEST_F(RegistryTest, PathsMustPointToGroups) {
    EXPECT_EQ("Can not add command \"x\" at a given path \"tu dst\". Path points to an existing command, but should "
              "point to an existing group.",
              addError("tu dst", {"x"}));
    EXPECT_EQ("Can not add command \"x\" at a given path \"tu nope\". Path is invalid.", addError("tu nope", {"x"}));
}

TEST_F(RegistryTest, InvalidGroupDeclarations) {
    EXPECT_THROW(registry_.addGroup("", {}, "no names"), ConfigurationError);
    EXPECT_THROW(registry_.addGroup("", {"Bad"}, "bad name"), ConfigurationError);
    EXPECT_THROW(registry_.addGroup("", {"g", "g"}, "repeated"), ConfigurationError);
    EXPECT_THROW(registry_.addGroup("", {"g"}, " "), ConfigurationError);
    EXPECT_THROW(Registry(""), ConfigurationError);
}

TEST_F(RegistryTest, SameCommandAtSeveralPaths) {
    const auto fr = registry_.addGroup(registry_.root(), {"fr"}, "frequent");
    registry_.attachCommand(fr, cc_);
    registry_.attachCommand("", dst_);

    const auto a = registry_.search("fr cc");
    const auto b = registry_.search("dst");
    ASSERT_TRUE(std::holds_alternative<CommandFound>(a));
    ASSERT_TRUE(std::holds_alternative<CommandFound>(b));
    EXPECT_EQ(cc_, std::get<CommandFound>(a).command);
    EXPECT_EQ(dst_, std::get<CommandFound>(b).command);
    EXPECT_EQ(2u, registry_.commandCount());

    EXPECT_THROW(registry_.attachCommand(fr, cc_), ConfigurationError);
}

TEST_F(RegistryTest, ForeignHandlesThrow) {
    EXPECT_THROW((void)registry_.group(GroupId{99}), std::out_of_range);
    EXPECT_THROW((void)registry_.command(CommandId{99}), std::out_of_range);
    EXPECT_THROW(registry_.addCommand(GroupId{99}, simpleCommand({"x"})), std::out_of_range);
}

TEST_F(RegistryTest, ChildAliasesListsGroupsFirst) {
    const std::vector<std::string> expected{"metrics", "mt", "displaysampletext", "dst"};
    EXPECT_EQ(expected, registry_.childAliases(tu_));
    EXPECT_EQ(3u, registry_.groupCount());
}

} // namespace
