#ifndef EXECUTOR_SUBPROCESS_HPP
#define EXECUTOR_SUBPROCESS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace executor {

struct Subprocess {
  // argv[0] must be the full path of the executable.
  std::vector<std::string> argv;
  std::string workdir;
  // Empty for /dev/null.
  std::string stdin_file;
  int64_t wall_limit_millis = 0;
  int64_t max_output_kb = 0;
  // Environment variables the process must not see.
  std::vector<std::string> hidden_variables;
};

struct SubprocessOutput {
  sandbox::ExecutionInfo info;
  std::string stdout_data;
  std::string stderr_data;

  // The process terminated on its own with exit status 0.
  bool Ok() const {
    return !info.timed_out && info.signal == 0 && info.status_code == 0;
  }
  // Exit status in shell convention: 128 + signal for killed processes.
  int32_t ExitCode() const {
    return info.signal != 0 ? 128 + info.signal : info.status_code;
  }
};

// Runs a process in the sandbox, capturing its output into files created in
// scratch_dir. Output beyond max_output_kb is dropped. Returns false and sets
// error if the process could not be started. Throws std::system_error if the
// captured output cannot be read.
bool RunSubprocess(const Subprocess& command, const std::string& scratch_dir,
                   SubprocessOutput* output, std::string* error);

}  // namespace executor

#endif
