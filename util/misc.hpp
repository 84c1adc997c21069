#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP

#include <cstdint>
#include <string>

namespace util {

// Parses a memory size such as "100m", "1g", "512k" or a plain byte count.
// Suffixes are case insensitive and use powers of 1024. Returns -1 if the
// value cannot be parsed.
int64_t ParseMemoryLimit(const std::string& limit);

// Returns at most max_bytes of s, followed by a marker if something was cut.
std::string Truncate(const std::string& s, size_t max_bytes);

}  // namespace util
#endif
