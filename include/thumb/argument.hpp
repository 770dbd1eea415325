#ifndef THUMB_ARGUMENT_HPP
#define THUMB_ARGUMENT_HPP

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace thumb {

struct ArgumentSpec {
    int position{0};
    std::string name;        // shown in help, key in Args
    std::string description;
    bool multisegmented{false};
    bool optional{false};
    std::optional<std::string> defaultValue;
};

// Conversion and validation for one value type, in the spirit of a pflag Value:
// both functions return an error detail on failure; an empty optional indicates success.
// The detail is wrapped into `Error parsing argument "<name>". <detail>.` (or
// `Error validating ...`) by the pipeline.
template <typename T>
struct ArgumentType {
    using Convert = std::function<std::optional<std::string>(std::string_view token, T& out)>;
    using Validate = std::function<std::optional<std::string>(const T& value)>;

    Convert convert;
    Validate validate;
    // Types that can only consume the rest of the line (e.g. integer arrays).
    bool multisegmentedOnly{false};
};

// Returns `type` with `extra` run after its own validation.
template <typename T>
ArgumentType<T> withValidation(ArgumentType<T> type, typename ArgumentType<T>::Validate extra) {
    if (!extra) return type;
    type.validate = [base = std::move(type.validate), extra = std::move(extra)](const T& value) -> std::optional<std::string> {
        if (base) {
            if (auto err = base(value)) return err;
        }
        return extra(value);
    };
    return type;
}

// Parsed values of one invocation. Built fresh by the pipeline and handed to the action;
// nothing here outlives the call.
class Args {
public:
    struct State {
        std::any value;
        bool omitted{false};
    };

    void record(std::string name, std::any value, bool omitted) {
        states_[std::move(name)] = State{std::move(value), omitted};
    }

    [[nodiscard]] bool contains(const std::string& name) const { return states_.count(name) != 0; }

    // True when the argument produced a value (given by the user or by its default).
    [[nodiscard]] bool has(const std::string& name) const {
        const auto it = states_.find(name);
        return it != states_.end() && it->second.value.has_value();
    }

    [[nodiscard]] bool omitted(const std::string& name) const {
        const auto it = states_.find(name);
        return it == states_.end() || it->second.omitted;
    }

    template <typename T>
    const T* getIf(const std::string& name) const {
        const auto it = states_.find(name);
        if (it == states_.end()) return nullptr;
        return std::any_cast<T>(&it->second.value);
    }

    // Throws std::out_of_range for unknown or unset arguments and std::bad_any_cast on a
    // type mismatch.
    template <typename T>
    const T& get(const std::string& name) const {
        const auto it = states_.find(name);
        if (it == states_.end() || !it->second.value.has_value()) {
            throw std::out_of_range("argument \"" + name + "\" has no value");
        }
        const auto* v = std::any_cast<T>(&it->second.value);
        if (!v) throw std::bad_any_cast();
        return *v;
    }

    template <typename T>
    T valueOr(const std::string& name, T fallback) const {
        const auto* v = getIf<T>(name);
        return v ? *v : std::move(fallback);
    }

    [[nodiscard]] std::size_t size() const { return states_.size(); }

private:
    std::map<std::string, State> states_;
};

// An argument declaration: spec plus a type-erased converter. Immutable once a command is
// bound; parsing writes only into the Args passed in.
class Argument {
public:
    template <typename T>
    static Argument make(ArgumentSpec spec, ArgumentType<T> type) {
        Argument a(std::move(spec));
        a.multisegmentedOnly_ = type.multisegmentedOnly;
        if (type.convert) {
            a.parse_ = [type = std::move(type)](std::string_view token, std::any& out) -> Outcome {
                T value{};
                if (auto detail = type.convert(token, value)) return {Stage::Convert, std::move(detail)};
                if (type.validate) {
                    if (auto detail = type.validate(value)) return {Stage::Validate, std::move(detail)};
                }
                out = std::move(value);
                return {};
            };
        }
        return a;
    }

    Argument& optional(bool v = true) {
        spec_.optional = v;
        return *this;
    }

    Argument& multisegmented(bool v = true) {
        spec_.multisegmented = v;
        return *this;
    }

    // Implies optional.
    Argument& defaultValue(std::string value) {
        spec_.optional = true;
        spec_.defaultValue = std::move(value);
        return *this;
    }

    [[nodiscard]] const ArgumentSpec& spec() const { return spec_; }
    [[nodiscard]] const std::string& name() const { return spec_.name; }
    [[nodiscard]] int position() const { return spec_.position; }
    [[nodiscard]] bool special() const { return spec_.optional || spec_.multisegmented; }
    [[nodiscard]] bool multisegmentedOnly() const { return multisegmentedOnly_; }
    [[nodiscard]] bool convertible() const { return static_cast<bool>(parse_); }

    // Consumes this argument from the front of `remainder` and records it into `out`.
    // Returns the user-facing error message on failure.
    std::optional<std::string> consume(std::string_view& remainder, Args& out) const;

    // Converts and validates a single token (or a default value).
    std::optional<std::string> convert(std::string_view token, std::any& out) const;

private:
    enum class Stage { Convert, Validate };

    struct Outcome {
        Stage stage{Stage::Convert};
        std::optional<std::string> detail;
    };

    explicit Argument(ArgumentSpec spec) : spec_(std::move(spec)) {}

    ArgumentSpec spec_;
    bool multisegmentedOnly_{false};
    std::function<Outcome(std::string_view, std::any&)> parse_;
};

} // namespace thumb

#endif // THUMB_ARGUMENT_HPP
