#ifndef REPAIR_CODE_PRODUCER_HPP
#define REPAIR_CODE_PRODUCER_HPP

#include <stdexcept>
#include <string>

namespace repair {

class producer_error : public std::runtime_error {
 public:
  explicit producer_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Something that writes programs, typically a language model.
class CodeProducer {
 public:
  // Returns the source of a program that does what prompt describes. Throws
  // producer_error on failure.
  virtual std::string Generate(const std::string& prompt) = 0;

  // Returns a version of source that should not fail with error. Throws
  // producer_error on failure.
  virtual std::string Repair(const std::string& source,
                             const std::string& error,
                             const std::string& language) = 0;

  CodeProducer() = default;
  virtual ~CodeProducer() = default;
  CodeProducer(const CodeProducer&) = delete;
  CodeProducer& operator=(const CodeProducer&) = delete;
  CodeProducer(CodeProducer&&) = delete;
  CodeProducer& operator=(CodeProducer&&) = delete;
};

}  // namespace repair

#endif
