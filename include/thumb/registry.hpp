#ifndef THUMB_REGISTRY_HPP
#define THUMB_REGISTRY_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "command.hpp"

namespace thumb {

struct GroupId {
    std::uint32_t value{0};
};

struct CommandId {
    std::uint32_t value{0};
};

inline bool operator==(GroupId a, GroupId b) { return a.value == b.value; }
inline bool operator!=(GroupId a, GroupId b) { return a.value != b.value; }
inline bool operator==(CommandId a, CommandId b) { return a.value == b.value; }
inline bool operator!=(CommandId a, CommandId b) { return a.value != b.value; }

struct GroupNode {
    std::vector<std::string> aliases; // empty for the root
    std::string names;                // aliases joined by '|'
    std::string description;
    // Alias -> child, in insertion order. One child may appear under several aliases.
    std::vector<std::pair<std::string, GroupId>> groups;
    std::vector<std::pair<std::string, CommandId>> commands;

    [[nodiscard]] bool isRoot() const { return aliases.empty(); }
};

struct GroupFound {
    GroupId group;
};

struct CommandFound {
    CommandId command;
    std::string_view remainder; // unconsumed text of the searched line
};

struct NothingFound {
    GroupId group;         // deepest group reached
    std::string_view token; // token that matched nothing there
};

using SearchOutcome = std::variant<GroupFound, CommandFound, NothingFound>;

// The command namespace. Groups and bound commands live in an arena and are addressed by
// handle; alias tables hold handles. Topology is only changed by the add/attach calls,
// all of which either succeed completely or throw ConfigurationError.
class Registry {
public:
    explicit Registry(std::string rootDescription);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    [[nodiscard]] GroupId root() const { return GroupId{0}; }

    GroupId addGroup(GroupId parent, std::vector<std::string> aliases, std::string description);
    GroupId addGroup(std::string_view path, std::vector<std::string> aliases, std::string description);

    CommandId addCommand(GroupId parent, Command cmd);
    CommandId addCommand(std::string_view path, Command cmd);

    // Makes an already bound command reachable from another group as well.
    void attachCommand(GroupId parent, CommandId cmd);
    void attachCommand(std::string_view path, CommandId cmd);

    [[nodiscard]] SearchOutcome search(std::string_view line) const { return search(root(), line); }
    [[nodiscard]] SearchOutcome search(GroupId from, std::string_view line) const;

    // Both throw std::out_of_range for foreign handles.
    [[nodiscard]] const GroupNode& group(GroupId id) const;
    [[nodiscard]] const BoundCommand& command(CommandId id) const;

    [[nodiscard]] std::size_t groupCount() const { return groups_.size(); }
    [[nodiscard]] std::size_t commandCount() const { return commands_.size(); }

    // Every alias directly under `id`, groups first.
    [[nodiscard]] std::vector<std::string> childAliases(GroupId id) const;

private:
    void checkGroup(GroupId id) const;
    GroupId resolveGroup(std::string_view path, const std::string& what) const;
    CommandId insert(GroupId parent, std::unique_ptr<const BoundCommand> bound);
    void ensureFree(const GroupNode& parent, const std::vector<std::string>& aliases, const std::string& what) const;
    GroupNode& groupMutable(GroupId id);

    std::vector<GroupNode> groups_;
    std::vector<std::unique_ptr<const BoundCommand>> commands_;
};

} // namespace thumb

#endif // THUMB_REGISTRY_HPP
