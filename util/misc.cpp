#include "util/misc.hpp"

#include <cctype>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"

namespace util {

int64_t ParseMemoryLimit(const std::string& limit) {
  std::string value = absl::AsciiStrToLower(
      absl::StripAsciiWhitespace(limit));
  if (value.empty()) return -1;
  if (value.back() == 'b') value.pop_back();
  int64_t multiplier = 1;
  if (!value.empty() && !isdigit(value.back())) {
    switch (value.back()) {
      case 'k':
        multiplier = 1024LL;
        break;
      case 'm':
        multiplier = 1024LL * 1024;
        break;
      case 'g':
        multiplier = 1024LL * 1024 * 1024;
        break;
      default:
        return -1;
    }
    value.pop_back();
  }
  int64_t amount = 0;
  if (!absl::SimpleAtoi(value, &amount) || amount < 0) return -1;
  return amount * multiplier;
}

std::string Truncate(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  return s.substr(0, max_bytes) + "\n[... output truncated]";
}

}  // namespace util
