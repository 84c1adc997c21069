#include "executor/orchestrator.hpp"

#include <cstdlib>
#include <stdexcept>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "executor/container_executor.hpp"
#include "executor/curl_http_client.hpp"
#include "executor/local_executor.hpp"
#include "executor/remote_executor.hpp"
#include "executor/result.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace executor {

std::unique_ptr<Orchestrator> Orchestrator::Create(
    const language::LanguageRegistry* registry) {
  if (FLAGS_timeout_seconds <= 0) {
    throw std::invalid_argument("--timeout_seconds must be positive");
  }
  if (util::ParseMemoryLimit(FLAGS_memory_limit) < 0) {
    throw std::invalid_argument("Invalid --memory_limit: " +
                                FLAGS_memory_limit);
  }
  if (FLAGS_cpu_share < 0) {
    throw std::invalid_argument("--cpu_share must not be negative");
  }

  OrchestratorOptions options;
  options.default_limits.set_timeout_seconds(FLAGS_timeout_seconds);
  options.default_limits.set_memory_limit(FLAGS_memory_limit);
  options.default_limits.set_cpu_share(FLAGS_cpu_share);
  options.container_available = ContainerExecutor::RuntimeAvailable(
      FLAGS_docker_binary, FLAGS_temp_directory);

  Backends backends;
  ContainerOptions container;
  container.docker_binary = FLAGS_docker_binary;
  container.temp_directory = FLAGS_temp_directory;
  container.max_output_kb = FLAGS_max_output_kb;
  container.startup_grace_seconds = FLAGS_container_startup_grace_seconds;
  backends.container = absl::make_unique<ContainerExecutor>(container);
  // Untrusted programs must not read the remote sandbox credentials.
  backends.local = absl::make_unique<LocalExecutor>(
      FLAGS_temp_directory, FLAGS_max_output_kb,
      std::vector<std::string>{FLAGS_remote_api_key_env});

  RemoteOptions remote;
  remote.api_base = FLAGS_remote_api_base;
  const char* api_key = std::getenv(FLAGS_remote_api_key_env.c_str());
  if (api_key != nullptr) remote.api_key = api_key;
  remote.call_timeout_seconds = FLAGS_remote_call_timeout_seconds;
  remote.ephemeral_workspaces = FLAGS_remote_ephemeral_workspaces;
  options.remote_available = !remote.api_key.empty();
  backends.remote = absl::make_unique<RemoteExecutor>(
      remote, absl::make_unique<CurlHttpClient>(FLAGS_curl_binary,
                                                FLAGS_temp_directory));

  auto orchestrator = absl::make_unique<Orchestrator>(
      registry, std::move(options), std::move(backends));
  LOG(INFO) << orchestrator->Describe();
  return orchestrator;
}

Orchestrator::Orchestrator(const language::LanguageRegistry* registry,
                           OrchestratorOptions options, Backends backends)
    : registry_(registry),
      options_(std::move(options)),
      backends_(std::move(backends)) {
  CHECK(registry_ != nullptr);
  CHECK(backends_.local != nullptr) << "The local backend is required";
  if (!backends_.container) options_.container_available = false;
  if (!backends_.remote) options_.remote_available = false;
}

Executor* Orchestrator::SelectBackend(proto::ExecutionMode mode,
                                      std::string* error) {
  switch (mode) {
    case proto::AUTO:
      return options_.container_available ? backends_.container.get()
                                          : backends_.local.get();
    case proto::CONTAINER:
      if (!options_.container_available) {
        *error = "The container runtime is not available";
        return nullptr;
      }
      return backends_.container.get();
    case proto::LOCAL:
      return backends_.local.get();
    case proto::REMOTE:
      if (!options_.remote_available) {
        *error = "The remote sandbox is not configured";
        return nullptr;
      }
      return backends_.remote.get();
    default:
      *error = absl::StrCat("Unknown execution mode ", mode);
      return nullptr;
  }
}

proto::ExecutionResult Orchestrator::Execute(
    const proto::ExecutionRequest& request) {
  const proto::LanguageDescriptor* language =
      registry_->Describe(request.language());
  if (language == nullptr) {
    proto::ExecutionResult result =
        ErrorResult(proto::CONFIGURATION_ERROR,
                    absl::StrCat("Unsupported language: ", request.language(),
                                 " (supported: ",
                                 absl::StrJoin(registry_->SupportedLanguages(),
                                               ", "),
                                 ")"));
    result.set_language(request.language());
    return result;
  }

  std::string error;
  Executor* backend = SelectBackend(request.mode(), &error);
  if (backend == nullptr) {
    proto::ExecutionResult result =
        ErrorResult(proto::CONFIGURATION_ERROR, error);
    result.set_language(language->id());
    return result;
  }

  proto::ResourceLimits limits = options_.default_limits;
  if (request.limits().timeout_seconds() > 0) {
    limits.set_timeout_seconds(request.limits().timeout_seconds());
  }
  if (!request.limits().memory_limit().empty()) {
    limits.set_memory_limit(request.limits().memory_limit());
  }
  if (request.limits().cpu_share() > 0) {
    limits.set_cpu_share(request.limits().cpu_share());
  }

  VLOG(1) << "Running " << language->id() << " program on "
          << backend->Id();
  proto::ExecutionResult result =
      backend->Run(*language, request.source(), request.stdin_data(), limits);
  LOG(INFO) << language->id() << " program on " << backend->Id() << ": "
            << (result.success()
                    ? "success"
                    : proto::ErrorKind_Name(result.error_kind()))
            << " in " << result.duration_ms() << "ms";
  return result;
}

std::future<proto::ExecutionResult> Orchestrator::ExecuteAsync(
    proto::ExecutionRequest request) {
  return std::async(std::launch::async, [this, request]() {
    return Execute(request);
  });
}

std::vector<std::string> Orchestrator::AvailableBackends() const {
  std::vector<std::string> ids;
  if (options_.container_available) ids.push_back(backends_.container->Id());
  ids.push_back(backends_.local->Id());
  if (options_.remote_available) ids.push_back(backends_.remote->Id());
  return ids;
}

std::string Orchestrator::Describe() const {
  return absl::StrCat(
      "backends: ", absl::StrJoin(AvailableBackends(), ", "),
      "; default: ",
      options_.container_available ? "container" : "local",
      "; timeout ", options_.default_limits.timeout_seconds(),
      "s, memory ", options_.default_limits.memory_limit(), ", cpu share ",
      options_.default_limits.cpu_share());
}

void Orchestrator::TearDown() {
  for (Executor* backend : {backends_.container.get(), backends_.local.get(),
                            backends_.remote.get()}) {
    if (backend != nullptr) backend->TearDown();
  }
}

}  // namespace executor
