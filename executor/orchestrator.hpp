#ifndef EXECUTOR_ORCHESTRATOR_HPP
#define EXECUTOR_ORCHESTRATOR_HPP

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "language/language_registry.hpp"
#include "proto/execution.pb.h"

namespace executor {

struct Backends {
  std::unique_ptr<Executor> container;
  std::unique_ptr<Executor> local;
  std::unique_ptr<Executor> remote;
};

struct OrchestratorOptions {
  // Used for the fields a request leaves unset.
  proto::ResourceLimits default_limits;
  // Availability of the backends, decided once when the orchestrator is
  // built. The local backend is always available.
  bool container_available = false;
  bool remote_available = false;
};

// Chooses the backend that runs each request. In AUTO mode the container
// backend is used if its runtime was reachable when the orchestrator was
// created, and the local backend otherwise; the remote backend is used only
// when explicitly requested. Execute can be called from several threads.
class Orchestrator {
 public:
  // Builds the backends and the default limits from the command line flags,
  // probing the container runtime. Throws std::invalid_argument if the flags
  // are invalid. registry must outlive the orchestrator.
  static std::unique_ptr<Orchestrator> Create(
      const language::LanguageRegistry* registry);

  Orchestrator(const language::LanguageRegistry* registry,
               OrchestratorOptions options, Backends backends);

  proto::ExecutionResult Execute(const proto::ExecutionRequest& request);

  // Runs Execute on a new thread. The orchestrator must outlive the future.
  std::future<proto::ExecutionResult> ExecuteAsync(
      proto::ExecutionRequest request);

  // Ids of the backends that can be used, in preference order.
  std::vector<std::string> AvailableBackends() const;

  // One-line description of the configuration.
  std::string Describe() const;

  // Releases the resources the backends keep between executions.
  void TearDown();

  const language::LanguageRegistry& registry() const { return *registry_; }

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;
  Orchestrator(Orchestrator&&) = delete;
  Orchestrator& operator=(Orchestrator&&) = delete;
  ~Orchestrator() = default;

 private:
  // Returns the backend for mode, or nullptr and sets error if it cannot be
  // used.
  Executor* SelectBackend(proto::ExecutionMode mode, std::string* error);

  const language::LanguageRegistry* registry_;
  OrchestratorOptions options_;
  Backends backends_;
};

}  // namespace executor

#endif
