#ifndef REPAIR_COMMAND_CODE_PRODUCER_HPP
#define REPAIR_COMMAND_CODE_PRODUCER_HPP

#include <string>
#include <vector>

#include "repair/code_producer.hpp"

namespace repair {

// Returns the content of the first fenced code block (```lang ... ```) of a
// reply. Without a complete block, fence markers are removed and the rest of
// the reply is returned. The result is stripped of surrounding whitespace.
std::string ExtractCodeBlock(const std::string& reply);

// CodeProducer backed by an external command, e.g. a script calling a
// language model. Each request is given to a new process as a JSON object on
// stdin:
//   {"action": "generate", "prompt": ...}
//   {"action": "repair", "source": ..., "error": ..., "language": ...}
// and the code is extracted from its stdout with ExtractCodeBlock.
class CommandCodeProducer : public CodeProducer {
 public:
  // command[0] is looked up in PATH.
  CommandCodeProducer(std::vector<std::string> command,
                      std::string temp_directory, int32_t timeout_seconds);

  std::string Generate(const std::string& prompt) override;
  std::string Repair(const std::string& source, const std::string& error,
                     const std::string& language) override;

 private:
  std::string Ask(const std::string& request);

  std::vector<std::string> command_;
  std::string temp_directory_;
  int32_t timeout_seconds_;
};

}  // namespace repair

#endif
