#ifndef EXECUTOR_REMOTE_EXECUTOR_HPP
#define EXECUTOR_REMOTE_EXECUTOR_HPP

#include <memory>
#include <string>

#include "absl/synchronization/mutex.h"
#include "executor/executor.hpp"
#include "executor/http_client.hpp"

namespace executor {

struct RemoteOptions {
  std::string api_base = "https://api.daytona.dev";
  std::string api_key;
  // Bound on each API call, independent of the program's own timeout.
  int32_t call_timeout_seconds = 120;
  // Delete the workspace after every execution instead of reusing it.
  bool ephemeral_workspaces = false;
};

// Runs programs in workspaces of a remote sandbox service. A workspace is
// created on first use and shared by all the following executions, until
// TearDown is called or a call on it fails with a protocol error. The
// service does not accept stdin.
class RemoteExecutor : public Executor {
 public:
  std::string Id() const override { return "remote"; }
  proto::ExecutionResult Run(const proto::LanguageDescriptor& language,
                             const std::string& source,
                             const std::string& stdin_data,
                             const proto::ResourceLimits& limits) override;

  // Whether credentials were configured.
  bool Available() const { return !options_.api_key.empty(); }

  // Deletes the shared workspace, if one was created. The workspace is
  // forgotten only if the service confirms the deletion.
  void TearDown() override;

  RemoteExecutor(RemoteOptions options, std::unique_ptr<HttpClient> client);
  RemoteExecutor(const RemoteExecutor&) = delete;
  RemoteExecutor& operator=(const RemoteExecutor&) = delete;
  RemoteExecutor(RemoteExecutor&&) = delete;
  RemoteExecutor& operator=(RemoteExecutor&&) = delete;
  ~RemoteExecutor() override = default;

 private:
  // Returns false and sets error if no workspace could be created.
  bool CreateWorkspace(const std::string& template_name, std::string* id,
                       std::string* error);
  bool DeleteWorkspace(const std::string& id);
  proto::ExecutionResult Execute(const std::string& workspace,
                                 const proto::LanguageDescriptor& language,
                                 const std::string& source);

  RemoteOptions options_;
  std::unique_ptr<HttpClient> client_;
  absl::Mutex workspace_mutex_;
  std::string workspace_id_ GUARDED_BY(workspace_mutex_);
};

}  // namespace executor

#endif
