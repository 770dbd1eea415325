#ifndef THUMB_THUMB_HPP
#define THUMB_THUMB_HPP

#include "argument.hpp"
#include "arguments.hpp"
#include "command.hpp"
#include "error.hpp"
#include "help.hpp"
#include "processor.hpp"
#include "registry.hpp"
#include "utils.hpp"

#endif // THUMB_THUMB_HPP
