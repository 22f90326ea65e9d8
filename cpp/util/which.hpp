#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. A command containing a path
// separator is only checked for being an executable file (and made
// absolute), otherwise the directories listed in $PATH are searched in order.
// Returns an empty string if no executable is found.
std::string which(const std::string& cmd);

}  // namespace util

#endif
