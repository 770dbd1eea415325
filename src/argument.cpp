#include "thumb/argument.hpp"

#include "thumb/utils.hpp"

namespace thumb {

std::optional<std::string> Argument::convert(std::string_view token, std::any& out) const {
    if (!parse_) return "Error parsing argument \"" + spec_.name + "\".";
    auto outcome = parse_(token, out);
    if (!outcome.detail) return std::nullopt;
    if (outcome.stage == Stage::Validate) {
        return "Error validating argument \"" + spec_.name + "\". " + *outcome.detail + ".";
    }
    return "Error parsing argument \"" + spec_.name + "\". " + *outcome.detail + ".";
}

std::optional<std::string> Argument::consume(std::string_view& remainder, Args& out) const {
    remainder = utils::skipSpaces(remainder);

    if (remainder.empty()) {
        if (!spec_.optional) return "Argument \"" + spec_.name + "\" is missing!";
        std::any value;
        // A broken default surfaces exactly like broken user input.
        if (spec_.defaultValue) {
            if (auto err = convert(*spec_.defaultValue, value)) return err;
        }
        out.record(spec_.name, std::move(value), /*omitted=*/true);
        return std::nullopt;
    }

    std::string_view token;
    if (spec_.multisegmented) {
        token = remainder;
        remainder = {};
    } else {
        const auto [head, rest] = utils::splitToken(remainder);
        token = head;
        remainder = rest;
    }

    std::any value;
    if (auto err = convert(token, value)) return err;
    out.record(spec_.name, std::move(value), /*omitted=*/false);
    return std::nullopt;
}

} // namespace thumb
