#include "thumb/processor.hpp"

#include <exception>
#include <variant>

#include "thumb/help.hpp"
#include "thumb/utils.hpp"

namespace thumb {

std::string Processor::processLine(std::string_view line) const {
    if (utils::isBlank(line)) return "Please enter a command!";

    const auto outcome = registry_.search(line);
    if (const auto* found = std::get_if<CommandFound>(&outcome)) {
        return execute(registry_.command(found->command), found->remainder);
    }
    if (const auto* found = std::get_if<GroupFound>(&outcome)) {
        return "Please specify a command within a \"" + registry_.group(found->group).names + "\" group!";
    }
    return notFound(std::get<NothingFound>(outcome));
}

std::optional<std::string> Processor::getHelp(std::string_view path) const {
    const auto outcome = registry_.search(path);
    if (const auto* found = std::get_if<GroupFound>(&outcome)) {
        return help::joinLines(help::renderTree(registry_, found->group));
    }
    if (const auto* found = std::get_if<CommandFound>(&outcome)) {
        if (utils::isBlank(found->remainder)) return registry_.command(found->command).helpArticle();
    }
    return std::nullopt;
}

std::string Processor::execute(const BoundCommand& cmd, std::string_view remainder) const {
    try {
        auto parsed = cmd.parse(remainder);
        if (auto* error = std::get_if<std::string>(&parsed)) return std::move(*error);
        return cmd.invoke(std::get<Args>(parsed));
    } catch (const std::exception& e) {
        report("Error: command \"" + cmd.names() + "\" failed: " + e.what() + "\n");
    } catch (...) {
        report("Error: command \"" + cmd.names() + "\" failed with a non-standard exception\n");
    }
    return "Internal error!";
}

void Processor::report(const std::string& line) const {
    std::lock_guard<std::mutex> lock(errMutex_);
    err() << line;
}

std::string Processor::notFound(const NothingFound& miss) const {
    std::string msg = "Command not found!";
    if (!suggestions_) return msg;

    const auto sugg =
        utils::suggest(utils::toLower(miss.token), registry_.childAliases(miss.group), suggestionsMinimumDistance_);
    if (sugg.empty()) return msg;
    return msg + " Did you mean: " + utils::join(sugg, ", ") + "?";
}

} // namespace thumb
