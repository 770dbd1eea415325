#include "thumb/command.hpp"

#include <algorithm>
#include <unordered_set>

#include "thumb/error.hpp"
#include "thumb/help.hpp"
#include "thumb/utils.hpp"

namespace thumb {

BoundCommand::BoundCommand(Command cmd)
    : aliases_(std::move(cmd.aliases_)),
      names_(utils::joinAliases(aliases_)),
      description_(std::move(cmd.description_)),
      arguments_(std::move(cmd.arguments_)),
      action_(std::move(cmd.action_)) {
    validate();
}

void BoundCommand::validate() {
    if (aliases_.empty()) throw ConfigurationError("Invalid command names (empty).");
    std::unordered_set<std::string> seen;
    for (const auto& a : aliases_) {
        if (!utils::isValidName(a)) throw ConfigurationError("Invalid command name: \"" + a + "\".");
        if (!seen.insert(a).second) {
            throw ConfigurationError("Command \"" + names_ + "\" repeats name \"" + a + "\".");
        }
    }
    if (utils::isBlank(description_)) {
        throw ConfigurationError("\"" + names_ + "\" command description is invalid (empty).");
    }
    if (!action_) throw ConfigurationError("Command \"" + names_ + "\" has no action.");

    const auto where = [this](const Argument& a) { return "Argument \"" + a.name() + "\" in command \"" + names_ + "\""; };

    std::unordered_set<std::string> names;
    const Argument* special = nullptr;
    for (const auto& arg : arguments_) {
        const auto& spec = arg.spec();
        if (!utils::isValidName(spec.name)) {
            throw ConfigurationError("Invalid argument name \"" + spec.name + "\" in command \"" + names_ + "\".");
        }
        if (spec.position < 0) throw ConfigurationError(where(arg) + " has invalid (negative) position.");
        if (utils::isBlank(spec.description)) throw ConfigurationError(where(arg) + " has invalid (empty) description.");
        if (!arg.convertible()) throw ConfigurationError(where(arg) + " has no converter.");
        if (arg.multisegmentedOnly() && !spec.multisegmented) {
            throw ConfigurationError(where(arg) + " should be multisegmented.");
        }
        if (!names.insert(spec.name).second) throw ConfigurationError(where(arg) + " is declared twice.");
        if (arg.special()) {
            if (special) {
                throw ConfigurationError("Command \"" + names_ + "\" has two special arguments: \"" + special->name() +
                                         "\" and \"" + arg.name() + "\".");
            }
            special = &arg;
        }
    }

    std::stable_sort(arguments_.begin(), arguments_.end(),
                     [](const Argument& a, const Argument& b) { return a.position() < b.position(); });

    for (std::size_t i = 1; i < arguments_.size(); ++i) {
        if (arguments_[i].position() == arguments_[i - 1].position()) {
            throw ConfigurationError(where(arguments_[i]) + " has the same position as \"" + arguments_[i - 1].name() +
                                     "\" argument.");
        }
    }

    for (std::size_t i = 0; i + 1 < arguments_.size(); ++i) {
        if (arguments_[i].special()) {
            throw ConfigurationError(where(arguments_[i]) + " is optional or multisegmented and should be the last!");
        }
    }
}

BoundCommand::ParseResult BoundCommand::parse(std::string_view remainder) const {
    Args args;
    for (const auto& arg : arguments_) {
        if (auto err = arg.consume(remainder, args)) return std::move(*err);
    }
    if (!utils::isBlank(remainder)) return std::string("Too many arguments!");
    return args;
}

const std::string& BoundCommand::helpArticle() const {
    std::call_once(helpOnce_, [this] { help_ = help::renderCommandArticle(*this); });
    return help_;
}

} // namespace thumb
