#include "executor/result.hpp"

#include "executor/executor.hpp"

namespace executor {

proto::ExecutionResult ErrorResult(proto::ErrorKind kind,
                                   const std::string& message) {
  proto::ExecutionResult result;
  result.set_success(false);
  result.set_exit_code(kNoExitCode);
  result.set_error_kind(kind);
  result.set_error_message(message);
  return result;
}

std::string ErrorText(const proto::ExecutionResult& result) {
  if (result.success()) return "";
  std::string text = result.error_message();
  if (!result.stderr_data().empty()) {
    if (!text.empty()) text += "\n";
    text += result.stderr_data();
  }
  if (text.empty()) {
    text = "Program exited with code " + std::to_string(result.exit_code());
  }
  return text;
}

bool IsRepairable(const proto::ExecutionResult& result) {
  if (result.success()) return false;
  switch (result.error_kind()) {
    case proto::CONFIGURATION_ERROR:
    case proto::SECURITY_POLICY_VIOLATION:
    case proto::BACKEND_PROTOCOL_ERROR:
      return false;
    default:
      return true;
  }
}

}  // namespace executor
