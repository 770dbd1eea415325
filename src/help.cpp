#include "thumb/help.hpp"

#include <algorithm>
#include <sstream>

#include "thumb/arguments.hpp"
#include "thumb/processor.hpp"

namespace {

constexpr const char* kIndent = "   ";

template <typename Id>
static std::vector<Id> uniqueChildren(const std::vector<std::pair<std::string, Id>>& children) {
    std::vector<Id> out;
    for (const auto& c : children) {
        if (std::find(out.begin(), out.end(), c.second) == out.end()) out.push_back(c.second);
    }
    return out;
}

} // namespace

namespace thumb::help {

std::string renderCommandArticle(const BoundCommand& cmd) {
    std::ostringstream oss;
    oss << "Command: " << cmd.names() << "\n";
    oss << "Description: " << cmd.description() << "\n";
    oss << "Usage: " << cmd.names();
    for (const auto& arg : cmd.arguments()) {
        if (arg.spec().optional) {
            oss << " [" << arg.name() << "]";
        } else {
            oss << " " << arg.name();
        }
    }
    if (cmd.arguments().empty()) return oss.str();

    oss << "\n" << kIndent << "Arguments:";
    for (const auto& arg : cmd.arguments()) {
        const auto& spec = arg.spec();
        oss << "\n" << kIndent << kIndent << spec.name << ": " << spec.description;
        if (spec.optional) {
            oss << " (optional";
            if (spec.defaultValue) oss << ", default: \"" << *spec.defaultValue << "\"";
            oss << ")";
        }
    }
    return oss.str();
}

std::vector<std::string> renderTree(const Registry& registry, GroupId id) {
    const auto& node = registry.group(id);
    std::vector<std::string> lines;
    lines.push_back(node.isRoot() ? node.description : "<" + node.names + ": " + node.description + ">");

    const auto groups = uniqueChildren(node.groups);
    const auto commands = uniqueChildren(node.commands);

    for (std::size_t i = 0; i < groups.size(); ++i) {
        const bool last = i + 1 == groups.size() && commands.empty();
        const auto child = renderTree(registry, groups[i]);
        for (std::size_t j = 0; j < child.size(); ++j) {
            const char* prefix = j == 0 ? (last ? "└──" : "├──") : (last ? "   " : "│  ");
            lines.push_back(prefix + child[j]);
        }
    }

    for (std::size_t i = 0; i < commands.size(); ++i) {
        const auto& cmd = registry.command(commands[i]);
        const char* prefix = i + 1 == commands.size() ? "└──" : "├──";
        lines.push_back(std::string(prefix) + "\"" + cmd.names() + "\" - " + cmd.description());
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}

Command makeHelpCommand(const Processor& processor, std::vector<std::string> aliases) {
    const std::string primary = aliases.empty() ? std::string() : aliases.front();
    Command cmd(std::move(aliases), "show help");
    cmd.argument(args::string(0, "path", "path to a command or a command group").multisegmented().defaultValue(""));
    cmd.action([&processor, primary](const Args& a) -> std::string {
        auto article = processor.getHelp(a.get<std::string>("path"));
        if (!article) return "Nothing found. Please type \"" + primary + "\" with no arguments.";
        if (a.omitted("path")) {
            *article += "\nIn order to get help on a particular command please type \"" + primary +
                        " pathToCommand commandName\".";
        }
        return *article;
    });
    return cmd;
}

} // namespace thumb::help
