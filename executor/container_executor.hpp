#ifndef EXECUTOR_CONTAINER_EXECUTOR_HPP
#define EXECUTOR_CONTAINER_EXECUTOR_HPP

#include <string>

#include "executor/executor.hpp"
#include "executor/subprocess.hpp"

namespace executor {

struct ContainerOptions {
  std::string docker_binary = "docker";
  std::string temp_directory = "/tmp/codemend";
  int64_t max_output_kb = 0;
  // Time given to the runtime to start and stop a container, on top of the
  // timeout of the program.
  int32_t startup_grace_seconds = 10;
};

// Runs each program in throwaway containers with no network, with the
// program's directory mounted as /workspace. Compiled languages use one
// container to compile and a second one to run.
class ContainerExecutor : public Executor {
 public:
  std::string Id() const override { return "container"; }
  proto::ExecutionResult Run(const proto::LanguageDescriptor& language,
                             const std::string& source,
                             const std::string& stdin_data,
                             const proto::ResourceLimits& limits) override;

  // Whether the container runtime is installed and its daemon answers.
  static bool RuntimeAvailable(const std::string& docker_binary,
                               const std::string& temp_directory);

  explicit ContainerExecutor(ContainerOptions options);
  ContainerExecutor(const ContainerExecutor&) = delete;
  ContainerExecutor& operator=(const ContainerExecutor&) = delete;
  ContainerExecutor(ContainerExecutor&&) = delete;
  ContainerExecutor& operator=(ContainerExecutor&&) = delete;
  ~ContainerExecutor() override = default;

 private:
  // Force-removes a container when going out of scope, whether it is still
  // running, already gone or was never created.
  class ContainerGuard {
   public:
    ContainerGuard(std::string docker, std::string name,
                   std::string scratch_dir);
    ~ContainerGuard();
    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;
    ContainerGuard(ContainerGuard&&) = delete;
    ContainerGuard& operator=(ContainerGuard&&) = delete;

   private:
    std::string docker_;
    std::string name_;
    std::string scratch_dir_;
  };

  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kWorkspace = "/workspace";
  static const constexpr int32_t kTimeoutExitCode = 124;
  static const constexpr int32_t kRuntimeExitCode = 125;

  proto::ExecutionResult DoRun(const proto::LanguageDescriptor& language,
                               const std::string& source,
                               const std::string& stdin_data,
                               const proto::ResourceLimits& limits);

  // Runs command in a new container named name. Returns false and sets error
  // if the runtime could not be started at all.
  bool RunContainer(const std::string& docker, const std::string& name,
                    const std::string& image, const std::string& command,
                    const std::string& box, const std::string& scratch_dir,
                    const proto::ResourceLimits& limits,
                    SubprocessOutput* output, std::string* error);

  ContainerOptions options_;
};

}  // namespace executor

#endif
