#include "executor/local_executor.hpp"

#include <chrono>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "executor/result.hpp"
#include "executor/subprocess.hpp"
#include "glog/logging.h"
#include "language/language_registry.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace executor {

LocalExecutor::LocalExecutor(std::string temp_directory, int64_t max_output_kb,
                             std::vector<std::string> hidden_variables)
    : temp_directory_(std::move(temp_directory)),
      max_output_kb_(max_output_kb),
      hidden_variables_(std::move(hidden_variables)) {}

proto::ExecutionResult LocalExecutor::Run(
    const proto::LanguageDescriptor& language, const std::string& source,
    const std::string& stdin_data, const proto::ResourceLimits& limits) {
  auto start = std::chrono::steady_clock::now();
  proto::ExecutionResult result;
  try {
    result = DoRun(language, source, stdin_data, limits);
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Local execution failed: " << exc.what();
    result = ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                         absl::StrCat("Local backend failure: ", exc.what()));
  } catch (const std::runtime_error& exc) {
    LOG(ERROR) << "Local execution failed: " << exc.what();
    result = ErrorResult(proto::CONFIGURATION_ERROR, exc.what());
  }
  result.set_backend_used(Id());
  result.set_language(language.id());
  result.set_duration_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count());
  return result;
}

proto::ExecutionResult LocalExecutor::DoRun(
    const proto::LanguageDescriptor& language, const std::string& source,
    const std::string& stdin_data, const proto::ResourceLimits& limits) {
  util::TempDir tmp(temp_directory_);
  std::string box = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(box);
  std::string source_path =
      util::File::JoinPath(box, language::SourceFileName(language));
  std::string stdin_path = util::File::JoinPath(box, "input.txt");
  util::File::Write(source_path, source);
  util::File::Write(stdin_path, stdin_data);

  int64_t wall_limit_millis = limits.timeout_seconds() * 1000LL;
  Subprocess command;
  command.workdir = box;
  command.wall_limit_millis = wall_limit_millis;
  command.max_output_kb = max_output_kb_;
  command.hidden_variables = hidden_variables_;
  SubprocessOutput output;
  std::string error;

  if (language.requires_compile()) {
    if (!PrepareCommand(language.local_compile_args(), box, source_path,
                        &command.argv, &error)) {
      return ErrorResult(proto::CONFIGURATION_ERROR,
                         absl::StrCat("Compiler ", error));
    }
    if (!RunSubprocess(command, tmp.Path(), &output, &error)) {
      return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                         absl::StrCat("Cannot start the compiler: ", error));
    }
    if (output.info.timed_out) {
      return ErrorResult(proto::TIMEOUT_ERROR,
                         absl::StrCat("Compilation timed out after ",
                                      limits.timeout_seconds(), " seconds"));
    }
    if (!output.Ok()) {
      proto::ExecutionResult result =
          ErrorResult(proto::COMPILE_ERROR, "Compilation failed");
      result.set_exit_code(output.ExitCode());
      result.set_stdout_data(output.stdout_data);
      result.set_stderr_data(output.stderr_data);
      return result;
    }
  }

  if (!PrepareCommand(language.local_run_args(), box, source_path,
                      &command.argv, &error)) {
    return ErrorResult(proto::CONFIGURATION_ERROR,
                       absl::StrCat("Interpreter ", error));
  }
  command.stdin_file = stdin_path;
  if (!RunSubprocess(command, tmp.Path(), &output, &error)) {
    return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                       absl::StrCat("Cannot start the program: ", error));
  }

  proto::ExecutionResult result;
  result.set_stdout_data(output.stdout_data);
  result.set_stderr_data(output.stderr_data);
  if (output.info.timed_out) {
    result.set_exit_code(kNoExitCode);
    result.set_error_kind(proto::TIMEOUT_ERROR);
    result.set_error_message(absl::StrCat("Execution timed out after ",
                                          limits.timeout_seconds(),
                                          " seconds"));
  } else if (!output.Ok()) {
    result.set_exit_code(output.ExitCode());
    result.set_error_kind(proto::RUNTIME_ERROR);
    result.set_error_message(
        output.info.signal != 0
            ? absl::StrCat("Killed by signal ", output.info.signal)
            : absl::StrCat("Exited with code ", output.info.status_code));
  } else {
    result.set_success(true);
    result.set_exit_code(0);
  }
  return result;
}

bool LocalExecutor::PrepareCommand(
    const google::protobuf::RepeatedPtrField<std::string>& args,
    const std::string& box, const std::string& source_path,
    std::vector<std::string>* argv, std::string* error) {
  argv->clear();
  std::string binary = util::File::JoinPath(box, kBinaryName);
  for (const std::string& arg : args) {
    argv->push_back(absl::StrReplaceAll(
        arg,
        {{"{source}", source_path}, {"{binary}", binary}, {"{dir}", box}}));
  }
  if (argv->empty()) {
    *error = "command line is empty";
    return false;
  }
  std::string program = util::which(argv->front());
  if (program.empty()) {
    *error = absl::StrCat("'", argv->front(), "' not found in PATH");
    return false;
  }
  argv->front() = program;
  return true;
}

}  // namespace executor
