#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd found in PATH, or an empty string. Commands that
// already contain a slash are returned unchanged if they are executable.
// Uses caching to speed up lookups, unless explicitly disabled. Only successful
// lookups are cached, and a cached entry is returned even if the file is no
// longer there. Throws if PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
