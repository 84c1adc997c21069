#ifndef SECURITY_SECURITY_GATE_HPP
#define SECURITY_SECURITY_GATE_HPP

#include <cstdint>
#include <string>

#include "language/language_registry.hpp"
#include "proto/security.pb.h"

namespace security {

struct SecurityOptions {
  // Sources longer than this many characters are rejected.
  int64_t max_source_length = 10000;
};

// Best-effort pre-execution policy check. The gate never modifies the source
// it is given, and can be shared between threads.
class SecurityGate {
 public:
  // registry is used to resolve language aliases and may be null, in which
  // case the language must be given by its canonical id. It must outlive the
  // gate.
  explicit SecurityGate(const language::LanguageRegistry* registry,
                        SecurityOptions options = SecurityOptions());

  // Checks a source written in the given language. Unknown languages only go
  // through the language-independent checks.
  proto::SecurityVerdict Check(const std::string& source,
                               const std::string& language) const;

  // Human readable description of the active policy.
  std::string Summary() const;

 private:
  const language::LanguageRegistry* registry_;
  SecurityOptions options_;
};

}  // namespace security

#endif
