#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <string>
#include <vector>

#include "executor/executor.hpp"

namespace executor {

// Runs programs as plain child processes of this one. Only the wall time and
// the output size are limited: memory and CPU limits are ignored. The
// environment variables named in hidden_variables are not visible to the
// programs.
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "local"; }
  proto::ExecutionResult Run(const proto::LanguageDescriptor& language,
                             const std::string& source,
                             const std::string& stdin_data,
                             const proto::ResourceLimits& limits) override;

  LocalExecutor(const LocalExecutor&) = delete;
  LocalExecutor& operator=(const LocalExecutor&) = delete;
  LocalExecutor(LocalExecutor&&) = delete;
  LocalExecutor& operator=(LocalExecutor&&) = delete;
  ~LocalExecutor() override = default;
  LocalExecutor(std::string temp_directory, int64_t max_output_kb,
                std::vector<std::string> hidden_variables = {});

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kBinaryName = "app";

  proto::ExecutionResult DoRun(const proto::LanguageDescriptor& language,
                               const std::string& source,
                               const std::string& stdin_data,
                               const proto::ResourceLimits& limits);

  // Expands the placeholders of an argv template and looks up its first
  // element in PATH. Returns false and sets error if the program cannot be
  // found.
  bool PrepareCommand(
      const google::protobuf::RepeatedPtrField<std::string>& args,
      const std::string& box, const std::string& source_path,
      std::vector<std::string>* argv, std::string* error);

  std::string temp_directory_;
  int64_t max_output_kb_;
  std::vector<std::string> hidden_variables_;
};

}  // namespace executor

#endif
