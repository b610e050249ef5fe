#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Successful lookups are
// cached. Returns an empty string if cmd cannot be found.
std::string which(const std::string& cmd);

}  // namespace util

#endif
