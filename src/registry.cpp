#include "thumb/registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "thumb/error.hpp"
#include "thumb/utils.hpp"

namespace {

template <typename Id>
static std::optional<Id> findChild(const std::vector<std::pair<std::string, Id>>& children, const std::string& alias) {
    const auto it = std::find_if(children.begin(), children.end(), [&](const auto& c) { return c.first == alias; });
    if (it == children.end()) return std::nullopt;
    return it->second;
}

static std::string describeGroup(const thumb::GroupNode& g) {
    return g.isRoot() ? std::string("root group") : "\"" + g.names + "\" group";
}

} // namespace

namespace thumb {

Registry::Registry(std::string rootDescription) {
    if (utils::isBlank(rootDescription)) throw ConfigurationError("Root command group description is invalid (empty).");
    GroupNode root;
    root.description = std::move(rootDescription);
    groups_.push_back(std::move(root));
}

void Registry::checkGroup(GroupId id) const {
    if (id.value >= groups_.size()) throw std::out_of_range("unknown group handle " + std::to_string(id.value));
}

const GroupNode& Registry::group(GroupId id) const {
    checkGroup(id);
    return groups_[id.value];
}

GroupNode& Registry::groupMutable(GroupId id) {
    checkGroup(id);
    return groups_[id.value];
}

const BoundCommand& Registry::command(CommandId id) const {
    if (id.value >= commands_.size()) throw std::out_of_range("unknown command handle " + std::to_string(id.value));
    return *commands_[id.value];
}

void Registry::ensureFree(const GroupNode& parent, const std::vector<std::string>& aliases, const std::string& what) const {
    for (const auto& a : aliases) {
        if (findChild(parent.groups, a) || findChild(parent.commands, a)) {
            throw ConfigurationError(what + ". Child element named \"" + a + "\" already exists in " + describeGroup(parent) +
                                     ".");
        }
    }
}

GroupId Registry::resolveGroup(std::string_view path, const std::string& what) const {
    const auto outcome = search(path);
    if (const auto* found = std::get_if<GroupFound>(&outcome)) return found->group;
    const std::string at = what + " at a given path \"" + std::string(path) + "\". ";
    if (std::holds_alternative<CommandFound>(outcome)) {
        throw ConfigurationError(at + "Path points to an existing command, but should point to an existing group.");
    }
    throw ConfigurationError(at + "Path is invalid.");
}

GroupId Registry::addGroup(GroupId parent, std::vector<std::string> aliases, std::string description) {
    const auto& p = group(parent);
    if (aliases.empty()) throw ConfigurationError("Invalid command group names (empty).");
    std::unordered_set<std::string> seen;
    for (const auto& a : aliases) {
        if (!utils::isValidName(a)) throw ConfigurationError("Invalid command group name: \"" + a + "\".");
        if (!seen.insert(a).second) throw ConfigurationError("Command group repeats name \"" + a + "\".");
    }

    GroupNode node;
    node.names = utils::joinAliases(aliases);
    if (utils::isBlank(description)) {
        throw ConfigurationError("\"" + node.names + "\" command group description is invalid (empty).");
    }
    ensureFree(p, aliases, "Can not add group \"" + node.names + "\"");

    node.aliases = std::move(aliases);
    node.description = std::move(description);

    const GroupId id{static_cast<std::uint32_t>(groups_.size())};
    groups_.push_back(std::move(node));
    auto& target = groupMutable(parent);
    for (const auto& a : groups_[id.value].aliases) target.groups.emplace_back(a, id);
    return id;
}

GroupId Registry::addGroup(std::string_view path, std::vector<std::string> aliases, std::string description) {
    const auto parent = resolveGroup(path, "Can not add group \"" + utils::joinAliases(aliases) + "\"");
    return addGroup(parent, std::move(aliases), std::move(description));
}

CommandId Registry::insert(GroupId parent, std::unique_ptr<const BoundCommand> bound) {
    ensureFree(group(parent), bound->aliases(), "Can not add command \"" + bound->names() + "\"");
    const CommandId id{static_cast<std::uint32_t>(commands_.size())};
    commands_.push_back(std::move(bound));
    auto& target = groupMutable(parent);
    for (const auto& a : commands_[id.value]->aliases()) target.commands.emplace_back(a, id);
    return id;
}

CommandId Registry::addCommand(GroupId parent, Command cmd) {
    checkGroup(parent);
    return insert(parent, std::make_unique<const BoundCommand>(std::move(cmd)));
}

CommandId Registry::addCommand(std::string_view path, Command cmd) {
    auto bound = std::make_unique<const BoundCommand>(std::move(cmd));
    const auto parent = resolveGroup(path, "Can not add command \"" + bound->names() + "\"");
    return insert(parent, std::move(bound));
}

void Registry::attachCommand(GroupId parent, CommandId cmd) {
    const auto& bound = command(cmd);
    ensureFree(group(parent), bound.aliases(), "Can not attach command \"" + bound.names() + "\"");
    auto& target = groupMutable(parent);
    for (const auto& a : bound.aliases()) target.commands.emplace_back(a, cmd);
}

void Registry::attachCommand(std::string_view path, CommandId cmd) {
    const auto parent = resolveGroup(path, "Can not attach command \"" + command(cmd).names() + "\"");
    attachCommand(parent, cmd);
}

SearchOutcome Registry::search(GroupId from, std::string_view line) const {
    GroupId current = from;
    for (;;) {
        const auto [token, rest] = utils::splitToken(line);
        if (token.empty()) return GroupFound{current};

        const auto key = utils::toLower(token);
        const auto& node = group(current);
        if (const auto child = findChild(node.groups, key)) {
            current = *child;
            line = rest;
            continue;
        }
        if (const auto cmd = findChild(node.commands, key)) return CommandFound{*cmd, rest};
        return NothingFound{current, token};
    }
}

std::vector<std::string> Registry::childAliases(GroupId id) const {
    const auto& node = group(id);
    std::vector<std::string> out;
    out.reserve(node.groups.size() + node.commands.size());
    for (const auto& g : node.groups) out.push_back(g.first);
    for (const auto& c : node.commands) out.push_back(c.first);
    return out;
}

} // namespace thumb
