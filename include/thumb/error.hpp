#ifndef THUMB_ERROR_HPP
#define THUMB_ERROR_HPP

#include <stdexcept>
#include <string>

namespace thumb {

// Thrown while a command set is being registered: malformed names or descriptions,
// argument layout violations, paths that do not lead to a group. It signals a bug in the
// command set, never bad user input, so the library does not catch it.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace thumb

#endif // THUMB_ERROR_HPP
