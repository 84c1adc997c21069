#include "executor/container_executor.hpp"

#include <chrono>
#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "executor/result.hpp"
#include "glog/logging.h"
#include "language/language_registry.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace executor {

ContainerExecutor::ContainerGuard::ContainerGuard(std::string docker,
                                                  std::string name,
                                                  std::string scratch_dir)
    : docker_(std::move(docker)),
      name_(std::move(name)),
      scratch_dir_(std::move(scratch_dir)) {}

ContainerExecutor::ContainerGuard::~ContainerGuard() {
  Subprocess command;
  command.argv = {docker_, "rm", "-f", name_};
  command.workdir = scratch_dir_;
  command.wall_limit_millis = 30 * 1000;
  SubprocessOutput output;
  std::string error;
  try {
    if (!RunSubprocess(command, scratch_dir_, &output, &error)) {
      LOG(WARNING) << "Cannot remove container " << name_ << ": " << error;
    } else if (!output.Ok()) {
      // Containers started with --rm are usually gone already.
      VLOG(1) << "docker rm -f " << name_ << ": " << output.stderr_data;
    }
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Cannot remove container " << name_ << ": " << exc.what();
  }
}

ContainerExecutor::ContainerExecutor(ContainerOptions options)
    : options_(std::move(options)) {}

bool ContainerExecutor::RuntimeAvailable(const std::string& docker_binary,
                                         const std::string& temp_directory) {
  try {
    std::string docker = util::which(docker_binary);
    if (docker.empty()) {
      LOG(INFO) << "Container runtime " << docker_binary << " not found";
      return false;
    }
    util::TempDir tmp(temp_directory);
    Subprocess command;
    command.argv = {docker, "version"};
    command.workdir = tmp.Path();
    command.wall_limit_millis = 10 * 1000;
    SubprocessOutput output;
    std::string error;
    if (!RunSubprocess(command, tmp.Path(), &output, &error)) {
      LOG(WARNING) << "Cannot run " << docker << ": " << error;
      return false;
    }
    if (!output.Ok()) {
      LOG(INFO) << "Container runtime not reachable: " << output.stderr_data;
      return false;
    }
  } catch (const std::runtime_error& exc) {
    LOG(WARNING) << "Cannot check the container runtime: " << exc.what();
    return false;
  }
  return true;
}

proto::ExecutionResult ContainerExecutor::Run(
    const proto::LanguageDescriptor& language, const std::string& source,
    const std::string& stdin_data, const proto::ResourceLimits& limits) {
  auto start = std::chrono::steady_clock::now();
  proto::ExecutionResult result;
  try {
    result = DoRun(language, source, stdin_data, limits);
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Container execution failed: " << exc.what();
    result =
        ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                    absl::StrCat("Container backend failure: ", exc.what()));
  } catch (const std::runtime_error& exc) {
    LOG(ERROR) << "Container execution failed: " << exc.what();
    result = ErrorResult(proto::CONFIGURATION_ERROR, exc.what());
  }
  result.set_backend_used(Id());
  result.set_language(language.id());
  result.set_duration_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count());
  return result;
}

proto::ExecutionResult ContainerExecutor::DoRun(
    const proto::LanguageDescriptor& language, const std::string& source,
    const std::string& stdin_data, const proto::ResourceLimits& limits) {
  std::string docker = util::which(options_.docker_binary);
  if (docker.empty()) {
    return ErrorResult(proto::CONFIGURATION_ERROR,
                       absl::StrCat("Container runtime '",
                                    options_.docker_binary,
                                    "' not found in PATH"));
  }
  if (!limits.memory_limit().empty() &&
      util::ParseMemoryLimit(limits.memory_limit()) < 0) {
    return ErrorResult(
        proto::CONFIGURATION_ERROR,
        absl::StrCat("Invalid memory limit: ", limits.memory_limit()));
  }

  util::TempDir tmp(options_.temp_directory);
  std::string box = util::File::JoinPath(tmp.Path(), kBoxDir);
  util::File::MakeDirs(box);
  util::File::Write(
      util::File::JoinPath(box, language::SourceFileName(language)), source);
  util::File::Write(util::File::JoinPath(box, "input.txt"), stdin_data);
  std::string name_prefix =
      absl::StrCat("codemend-", util::File::BaseName(tmp.Path()));

  SubprocessOutput output;
  std::string error;
  auto timed_out = [&output]() {
    return output.info.timed_out ||
           (output.info.signal == 0 &&
            output.info.status_code == kTimeoutExitCode);
  };
  auto runtime_failed = [&output]() {
    return !output.info.timed_out && output.info.signal == 0 &&
           output.info.status_code == kRuntimeExitCode;
  };

  if (language.requires_compile()) {
    std::string name = name_prefix + "-compile";
    ContainerGuard guard(docker, name, tmp.Path());
    if (!RunContainer(docker, name, language.isolation_image(),
                      language.compile_command(), box, tmp.Path(), limits,
                      &output, &error)) {
      return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                         absl::StrCat("Cannot start the container: ", error));
    }
    if (timed_out()) {
      return ErrorResult(proto::TIMEOUT_ERROR,
                         absl::StrCat("Compilation timed out after ",
                                      limits.timeout_seconds(), " seconds"));
    }
    if (runtime_failed()) {
      return ErrorResult(
          proto::BACKEND_PROTOCOL_ERROR,
          absl::StrCat("Container runtime failed: ", output.stderr_data));
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

  std::string name = name_prefix + "-run";
  ContainerGuard guard(docker, name, tmp.Path());
  if (!RunContainer(docker, name, language.isolation_image(),
                    language.run_command(), box, tmp.Path(), limits, &output,
                    &error)) {
    return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                       absl::StrCat("Cannot start the container: ", error));
  }
  if (runtime_failed()) {
    return ErrorResult(
        proto::BACKEND_PROTOCOL_ERROR,
        absl::StrCat("Container runtime failed: ", output.stderr_data));
  }
  proto::ExecutionResult result;
  result.set_stdout_data(output.stdout_data);
  result.set_stderr_data(output.stderr_data);
  if (timed_out()) {
    result.set_exit_code(kNoExitCode);
    result.set_error_kind(proto::TIMEOUT_ERROR);
    result.set_error_message(absl::StrCat("Execution timed out after ",
                                          limits.timeout_seconds(),
                                          " seconds"));
  } else if (!output.Ok()) {
    result.set_exit_code(output.ExitCode());
    result.set_error_kind(proto::RUNTIME_ERROR);
    result.set_error_message(
        absl::StrCat("Exited with code ", output.ExitCode()));
  } else {
    result.set_success(true);
    result.set_exit_code(0);
  }
  return result;
}

bool ContainerExecutor::RunContainer(
    const std::string& docker, const std::string& name,
    const std::string& image, const std::string& command,
    const std::string& box, const std::string& scratch_dir,
    const proto::ResourceLimits& limits, SubprocessOutput* output,
    std::string* error) {
  Subprocess process;
  process.argv = {docker, "run", "--rm", "--name", name, "--network", "none"};
  if (!limits.memory_limit().empty()) {
    process.argv.push_back("--memory");
    process.argv.push_back(
        absl::StrCat(util::ParseMemoryLimit(limits.memory_limit())));
  }
  if (limits.cpu_share() > 0) {
    process.argv.push_back("--cpus");
    process.argv.push_back(absl::StrCat(limits.cpu_share()));
  }
  std::vector<std::string> tail = {"-v",
                                   absl::StrCat(box, ":", kWorkspace),
                                   "-w",
                                   kWorkspace,
                                   image,
                                   "timeout",
                                   absl::StrCat(limits.timeout_seconds()),
                                   "sh",
                                   "-c",
                                   command};
  process.argv.insert(process.argv.end(), tail.begin(), tail.end());
  process.workdir = scratch_dir;
  process.max_output_kb = options_.max_output_kb;
  if (limits.timeout_seconds() > 0) {
    process.wall_limit_millis =
        (limits.timeout_seconds() + options_.startup_grace_seconds) * 1000LL;
  }
  LOG(INFO) << "Starting container " << name << " from " << image;
  return RunSubprocess(process, scratch_dir, output, error);
}

}  // namespace executor
