#ifndef THUMB_COMMAND_HPP
#define THUMB_COMMAND_HPP

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "argument.hpp"

namespace thumb {

// Builder for a user operation. Nothing is checked here; BoundCommand validates the whole
// declaration at once when the command is registered.
class Command {
public:
    using Action = std::function<std::string(const Args& args)>;

    Command(std::vector<std::string> aliases, std::string description)
        : aliases_(std::move(aliases)),
          description_(std::move(description)) {}

    Command& alias(std::string a) {
        aliases_.push_back(std::move(a));
        return *this;
    }

    Command& description(std::string d) {
        description_ = std::move(d);
        return *this;
    }

    Command& argument(Argument arg) {
        arguments_.push_back(std::move(arg));
        return *this;
    }

    Command& action(Action a) {
        action_ = std::move(a);
        return *this;
    }

    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::vector<Argument>& arguments() const { return arguments_; }

private:
    friend class BoundCommand;

    std::vector<std::string> aliases_;
    std::string description_;
    std::vector<Argument> arguments_;
    Action action_;
};

// A registration-validated command: arguments sorted by position, at most one special
// (optional or multisegmented) argument and only in the last position. Immutable after
// construction, so one instance may serve any number of aliases, tree locations and
// concurrent invocations.
class BoundCommand {
public:
    // Parsed arguments on success, otherwise the first user-facing error.
    using ParseResult = std::variant<Args, std::string>;

    // Throws ConfigurationError naming the command and the offending argument.
    explicit BoundCommand(Command cmd);

    BoundCommand(const BoundCommand&) = delete;
    BoundCommand& operator=(const BoundCommand&) = delete;

    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
    // Aliases joined by '|'.
    [[nodiscard]] const std::string& names() const { return names_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::vector<Argument>& arguments() const { return arguments_; }

    ParseResult parse(std::string_view remainder) const;

    // Runs the action. Exceptions thrown by the action propagate to the caller.
    std::string invoke(const Args& args) const { return action_(args); }

    // Built on first use, then reused.
    const std::string& helpArticle() const;

private:
    void validate();

    std::vector<std::string> aliases_;
    std::string names_;
    std::string description_;
    std::vector<Argument> arguments_;
    Command::Action action_;

    mutable std::once_flag helpOnce_;
    mutable std::string help_;
};

} // namespace thumb

#endif // THUMB_COMMAND_HPP
