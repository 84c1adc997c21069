#include "executor/remote_executor.hpp"

#include <chrono>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "executor/result.hpp"
#include "glog/logging.h"
#include "nlohmann/json.hpp"
#include "util/misc.hpp"

namespace {

std::string Dump(const nlohmann::json& json) {
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool IsSuccess(int32_t status) { return status >= 200 && status < 300; }

// Error description found in a response body, if any.
std::string ApiError(const nlohmann::json& body) {
  if (!body.is_object() || !body.count("error")) return "";
  const nlohmann::json& error = body["error"];
  if (error.is_object() && error.count("message") &&
      error["message"].is_string()) {
    return error["message"].get<std::string>();
  }
  return Dump(error);
}

}  // namespace

namespace executor {

RemoteExecutor::RemoteExecutor(RemoteOptions options,
                               std::unique_ptr<HttpClient> client)
    : options_(std::move(options)), client_(std::move(client)) {
  while (!options_.api_base.empty() && options_.api_base.back() == '/') {
    options_.api_base.pop_back();
  }
}

proto::ExecutionResult RemoteExecutor::Run(
    const proto::LanguageDescriptor& language, const std::string& source,
    const std::string& stdin_data, const proto::ResourceLimits& limits) {
  auto start = std::chrono::steady_clock::now();
  proto::ExecutionResult result;
  if (!Available()) {
    result = ErrorResult(proto::CONFIGURATION_ERROR,
                         "Remote sandbox credentials are not configured");
  } else {
    if (!stdin_data.empty()) {
      LOG(WARNING) << "The remote sandbox does not support stdin, ignoring "
                   << stdin_data.size() << " bytes";
    }
    std::string error;
    if (options_.ephemeral_workspaces) {
      std::string workspace;
      if (CreateWorkspace(language.id(), &workspace, &error)) {
        result = Execute(workspace, language, source);
        if (!DeleteWorkspace(workspace)) {
          LOG(WARNING) << "Remote workspace " << workspace
                       << " was not deleted";
        }
      } else {
        result = ErrorResult(
            proto::BACKEND_PROTOCOL_ERROR,
            absl::StrCat("Cannot create a remote workspace: ", error));
      }
    } else {
      std::string workspace;
      {
        absl::MutexLock lock(&workspace_mutex_);
        if (workspace_id_.empty() &&
            !CreateWorkspace(language.id(), &workspace_id_, &error)) {
          workspace_id_.clear();
        }
        workspace = workspace_id_;
      }
      if (workspace.empty()) {
        result = ErrorResult(
            proto::BACKEND_PROTOCOL_ERROR,
            absl::StrCat("Cannot create a remote workspace: ", error));
      } else {
        result = Execute(workspace, language, source);
        if (result.error_kind() == proto::BACKEND_PROTOCOL_ERROR) {
          // The workspace may be gone; the next call starts a new one.
          absl::MutexLock lock(&workspace_mutex_);
          if (workspace_id_ == workspace) {
            LOG(WARNING) << "Dropping remote workspace " << workspace;
            workspace_id_.clear();
          }
        }
      }
    }
  }
  result.set_backend_used(Id());
  result.set_language(language.id());
  result.set_duration_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - start)
                             .count());
  return result;
}

void RemoteExecutor::TearDown() {
  absl::MutexLock lock(&workspace_mutex_);
  if (workspace_id_.empty()) return;
  if (DeleteWorkspace(workspace_id_)) workspace_id_.clear();
}

bool RemoteExecutor::CreateWorkspace(const std::string& template_name,
                                     std::string* id, std::string* error) {
  nlohmann::json body = {
      {"template", template_name},
      {"name", absl::StrCat("codemend-", absl::ToUnixMillis(absl::Now()))}};
  HttpRequest request;
  request.method = "POST";
  request.url = absl::StrCat(options_.api_base, "/workspaces");
  request.body = Dump(body);
  request.bearer_token = options_.api_key;
  request.timeout_seconds = options_.call_timeout_seconds;
  HttpResponse response;
  if (!client_->Send(request, &response, error)) return false;
  nlohmann::json reply = nlohmann::json::parse(response.body, nullptr, false);
  if (!IsSuccess(response.status)) {
    std::string message = reply.is_discarded() ? "" : ApiError(reply);
    *error = absl::StrCat("HTTP ", response.status,
                          message.empty() ? "" : ": ", message);
    return false;
  }
  if (reply.is_discarded() || !reply.is_object() || !reply.count("id") ||
      !reply["id"].is_string() || reply["id"].get<std::string>().empty()) {
    *error = "response does not contain a workspace id";
    return false;
  }
  *id = reply["id"].get<std::string>();
  LOG(INFO) << "Created remote workspace " << *id;
  return true;
}

bool RemoteExecutor::DeleteWorkspace(const std::string& id) {
  HttpRequest request;
  request.method = "DELETE";
  request.url = absl::StrCat(options_.api_base, "/workspaces/", id);
  request.bearer_token = options_.api_key;
  request.timeout_seconds = options_.call_timeout_seconds;
  HttpResponse response;
  std::string error;
  if (!client_->Send(request, &response, &error)) {
    LOG(WARNING) << "Cannot delete remote workspace " << id << ": " << error;
    return false;
  }
  if (!IsSuccess(response.status)) {
    LOG(WARNING) << "Cannot delete remote workspace " << id << ": HTTP "
                 << response.status;
    return false;
  }
  LOG(INFO) << "Deleted remote workspace " << id;
  return true;
}

proto::ExecutionResult RemoteExecutor::Execute(
    const std::string& workspace, const proto::LanguageDescriptor& language,
    const std::string& source) {
  HttpRequest request;
  request.method = "POST";
  request.url =
      absl::StrCat(options_.api_base, "/workspaces/", workspace, "/execute");
  request.body =
      Dump(nlohmann::json({{"language", language.id()}, {"code", source}}));
  request.bearer_token = options_.api_key;
  request.timeout_seconds = options_.call_timeout_seconds;
  HttpResponse response;
  std::string error;
  if (!client_->Send(request, &response, &error)) {
    return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                       absl::StrCat("Remote sandbox unreachable: ", error));
  }
  nlohmann::json reply = nlohmann::json::parse(response.body, nullptr, false);
  if (!reply.is_discarded()) {
    std::string api_error = ApiError(reply);
    if (!api_error.empty() && reply["error"].is_object()) {
      return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                         absl::StrCat("Remote sandbox error: ", api_error));
    }
  }
  if (!IsSuccess(response.status)) {
    return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                       absl::StrCat("Remote sandbox returned HTTP ",
                                    response.status, ": ",
                                    util::Truncate(response.body, 512)));
  }
  if (reply.is_discarded() || !reply.is_object()) {
    return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                       "Malformed response from the remote sandbox");
  }
  if (!reply.count("output") || !reply["output"].is_string()) {
    return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                       "Remote sandbox response has no 'output' field");
  }
  if (!reply.count("exit_code") || !reply["exit_code"].is_number_integer()) {
    return ErrorResult(proto::BACKEND_PROTOCOL_ERROR,
                       "Remote sandbox response has no 'exit_code' field");
  }

  proto::ExecutionResult result;
  int32_t exit_code = reply["exit_code"].get<int32_t>();
  bool success = exit_code == 0;
  if (reply.count("success") && reply["success"].is_boolean()) {
    success = reply["success"].get<bool>();
  }
  result.set_stdout_data(reply["output"].get<std::string>());
  if (reply.count("error") && reply["error"].is_string()) {
    result.set_stderr_data(reply["error"].get<std::string>());
  }
  result.set_exit_code(exit_code);
  result.set_success(success);
  if (!success) {
    result.set_error_kind(proto::RUNTIME_ERROR);
    result.set_error_message(absl::StrCat("Exited with code ", exit_code));
  }
  return result;
}

}  // namespace executor
