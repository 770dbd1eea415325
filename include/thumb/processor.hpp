#ifndef THUMB_PROCESSOR_HPP
#define THUMB_PROCESSOR_HPP

#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "command.hpp"
#include "registry.hpp"

namespace thumb {

// A distinct command set: the registry plus the line-level entry points.
//
// Registration (addGroup/addCommand/attachCommand) throws ConfigurationError and must be
// finished before lines are processed. Afterwards processLine/getHelp only read shared
// state, so a configured processor may serve several threads.
class Processor {
public:
    explicit Processor(std::string description) : registry_(std::move(description)) {}

    // Commands such as the help command keep a reference to their processor.
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Receives diagnostics about failing actions and converters, one whole line per write.
    // Defaults to std::cerr.
    Processor& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    // Appends "Did you mean: ...?" to "Command not found!".
    Processor& suggestions(bool v = true) {
        suggestions_ = v;
        return *this;
    }

    Processor& suggestionsMinimumDistance(std::size_t d) {
        suggestionsMinimumDistance_ = d;
        return *this;
    }

    GroupId addGroup(std::string_view path, std::vector<std::string> aliases, std::string description) {
        return registry_.addGroup(path, std::move(aliases), std::move(description));
    }

    GroupId addGroup(GroupId parent, std::vector<std::string> aliases, std::string description) {
        return registry_.addGroup(parent, std::move(aliases), std::move(description));
    }

    CommandId addCommand(std::string_view path, Command cmd) { return registry_.addCommand(path, std::move(cmd)); }
    CommandId addCommand(GroupId parent, Command cmd) { return registry_.addCommand(parent, std::move(cmd)); }

    void attachCommand(std::string_view path, CommandId cmd) { registry_.attachCommand(path, cmd); }
    void attachCommand(GroupId parent, CommandId cmd) { registry_.attachCommand(parent, cmd); }

    // Never throws for user input: every failure comes back as the returned text. Exceptions
    // from actions and argument converters are reported as "Internal error!".
    std::string processLine(std::string_view line) const;

    // Tree for a group path, article for a fully consumed command path, nullopt otherwise.
    // An empty path denotes the root group.
    std::optional<std::string> getHelp(std::string_view path) const;

    [[nodiscard]] const Registry& registry() const { return registry_; }
    [[nodiscard]] const std::string& description() const { return registry_.group(registry_.root()).description; }

private:
    std::string execute(const BoundCommand& cmd, std::string_view remainder) const;
    std::string notFound(const NothingFound& miss) const;

    void report(const std::string& line) const;
    std::ostream& err() const { return err_ ? *err_ : std::cerr; }

    Registry registry_;
    std::ostream* err_{nullptr};
    mutable std::mutex errMutex_;
    bool suggestions_{false};
    std::size_t suggestionsMinimumDistance_{2};
};

} // namespace thumb

#endif // THUMB_PROCESSOR_HPP
