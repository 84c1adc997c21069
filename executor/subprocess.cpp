#include "executor/subprocess.hpp"

#include <atomic>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace executor {

bool RunSubprocess(const Subprocess& command, const std::string& scratch_dir,
                   SubprocessOutput* output, std::string* error) {
  if (command.argv.empty()) {
    *error = "empty command line";
    return false;
  }
  // Several commands may share a scratch directory.
  static std::atomic<uint64_t> counter{0};
  std::string prefix =
      util::File::JoinPath(scratch_dir, absl::StrCat("proc", counter++));

  sandbox::ExecutionOptions options(command.workdir, command.argv[0]);
  options.args.assign(command.argv.begin() + 1, command.argv.end());
  options.stdin_file = command.stdin_file;
  options.stdout_file = prefix + ".stdout";
  options.stderr_file = prefix + ".stderr";
  options.wall_limit_millis = command.wall_limit_millis;
  options.max_file_size_kb = command.max_output_kb;
  options.hidden_variables = command.hidden_variables;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    *error = "no sandbox available";
    return false;
  }
  VLOG(2) << "Running " << absl::StrJoin(command.argv, " ");
  *output = SubprocessOutput();
  if (!sb->Execute(options, &output->info, error)) return false;

  size_t max_bytes = command.max_output_kb * 1024;
  output->stdout_data = util::File::Read(options.stdout_file, max_bytes);
  output->stderr_data = util::File::Read(options.stderr_file, max_bytes);
  if (max_bytes) {
    // Files at the limit were most likely cut by the size limit.
    if (output->stdout_data.size() == max_bytes) {
      output->stdout_data = util::Truncate(output->stdout_data, max_bytes - 1);
    }
    if (output->stderr_data.size() == max_bytes) {
      output->stderr_data = util::Truncate(output->stderr_data, max_bytes - 1);
    }
  }
  util::File::Remove(options.stdout_file);
  util::File::Remove(options.stderr_file);
  VLOG(2) << "Process finished: status " << output->info.status_code
          << " signal " << output->info.signal << " wall "
          << output->info.wall_time_millis << "ms";
  return true;
}

}  // namespace executor
