#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// named cmd in the directories listed in $PATH, or an empty string. Throws if
// $PATH is not set. Uses caching to speed up lookups, unless explicitly
// disabled; only successful lookups are cached.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
