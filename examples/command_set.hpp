#ifndef THUMB_EXAMPLES_COMMAND_SET_HPP
#define THUMB_EXAMPLES_COMMAND_SET_HPP

#include "thumb/thumb.hpp"

namespace demo {

// Sample command set shared by the examples:
//
//   textutils|tu
//     metrics|metr|mt: countchars|cc, countwords|cw
//     displaysampletext|dst, removechar|rc, repw, repp, countwords|cw
//   fr: displaysampletext|dst, countchars|cc  (the same bound commands as above)
//   calc: add, divide|div
//   showdatetime|sdt, help|h
void registerCommandSet(thumb::Processor& processor);

} // namespace demo

#endif // THUMB_EXAMPLES_COMMAND_SET_HPP
