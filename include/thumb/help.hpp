#ifndef THUMB_HELP_HPP
#define THUMB_HELP_HPP

#include <string>
#include <vector>

#include "command.hpp"
#include "registry.hpp"

namespace thumb {

class Processor;

namespace help {

// Command: names
// Description: ...
// Usage: names arg1 [arg2]
//    Arguments:
//       arg1: ...
//       arg2: ... (optional, default: "x")
std::string renderCommandArticle(const BoundCommand& cmd);

// Pseudo-graphic tree rooted at `id`, one line per node. Children are listed groups first,
// each in insertion order; a child reachable by several aliases is listed once.
std::vector<std::string> renderTree(const Registry& registry, GroupId id);

std::string joinLines(const std::vector<std::string>& lines);

// A ready-made help command: one optional multisegmented "path" argument, answering with
// Processor::getHelp. `processor` must outlive every registration of the returned command.
Command makeHelpCommand(const Processor& processor, std::vector<std::string> aliases = {"help", "h"});

} // namespace help
} // namespace thumb

#endif // THUMB_HELP_HPP
