#include "manager/workflow.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "executor/result.hpp"
#include "glog/logging.h"
#include "repair/debug_loop.hpp"

namespace manager {

Workflow::Workflow(const security::SecurityGate* gate,
                   executor::Orchestrator* orchestrator,
                   repair::CodeProducer* producer, int32_t max_attempts)
    : gate_(gate),
      orchestrator_(orchestrator),
      producer_(producer),
      max_attempts_(max_attempts) {
  CHECK(gate_) << "A security gate is required";
  CHECK(orchestrator_) << "An orchestrator is required";
}

proto::ExecutionResult Workflow::Execute(
    const proto::ExecutionRequest& request) {
  proto::SecurityVerdict verdict =
      gate_->Check(request.source(), request.language());
  if (!verdict.safe()) {
    proto::ExecutionResult result = executor::ErrorResult(
        proto::SECURITY_POLICY_VIOLATION,
        absl::StrCat("Security check failed: ",
                     absl::StrJoin(verdict.violations(), "; ")));
    result.set_language(request.language());
    return result;
  }
  for (const std::string& warning : verdict.warnings()) {
    LOG(WARNING) << warning;
  }
  return orchestrator_->Execute(request);
}

proto::SecurityVerdict Workflow::CheckSecurity(
    const std::string& source, const std::string& language) const {
  return gate_->Check(source, language);
}

proto::RepairOutcome Workflow::DebugAndFix(const std::string& source,
                                           const std::string& error,
                                           const std::string& language) {
  if (producer_ == nullptr) return NoProducer(source);
  repair::DebugLoopOptions options;
  options.max_attempts = max_attempts_;
  repair::DebugLoop loop(producer_, gate_, orchestrator_, options);
  return loop.DebugAndFix(source, error, language);
}

proto::RepairOutcome Workflow::ExecuteWithRepair(
    const proto::ExecutionRequest& request) {
  if (producer_ == nullptr) {
    proto::ExecutionResult result = Execute(request);
    proto::RepairOutcome outcome = NoProducer(request.source());
    if (result.success()) {
      outcome.set_success(true);
      outcome.set_state(proto::RepairState::SUCCEEDED);
      outcome.clear_last_error();
    }
    *outcome.mutable_final_result() = result;
    return outcome;
  }
  repair::DebugLoopOptions options;
  options.max_attempts = max_attempts_;
  options.mode = request.mode();
  options.limits = request.limits();
  repair::DebugLoop loop(producer_, gate_, orchestrator_, options);
  return loop.RunAndRepair(request.source(), request.language(),
                           request.stdin_data());
}

proto::RepairOutcome Workflow::NoProducer(const std::string& source) const {
  proto::RepairOutcome outcome;
  outcome.set_state(proto::RepairState::ABORTED);
  outcome.set_original_source(source);
  outcome.set_final_source(source);
  outcome.set_last_error("No code producer is configured (--producer_command)");
  return outcome;
}

nlohmann::json ResultToJson(const proto::ExecutionResult& result) {
  nlohmann::json json = {
      {"success", result.success()},
      {"output", result.stdout_data()},
      {"error", executor::ErrorText(result)},
      {"exitCode", result.exit_code()},
      {"language", result.language()},
      {"backend", result.backend_used()},
      {"executed", !result.backend_used().empty()},
      {"durationMs", result.duration_ms()}};
  if (!result.success()) {
    json["errorKind"] = proto::ErrorKind_Name(result.error_kind());
  }
  return json;
}

nlohmann::json OutcomeToJson(const proto::RepairOutcome& outcome) {
  nlohmann::json history = nlohmann::json::array();
  for (const proto::RepairAttempt& attempt : outcome.history()) {
    history.push_back({{"source", attempt.source()},
                       {"error", attempt.error()}});
  }
  nlohmann::json json = {
      {"success", outcome.success()},
      {"fixedSource", outcome.final_source()},
      {"attempts", outcome.attempts()},
      {"history", history},
      {"state", proto::RepairState_Name(outcome.state())}};
  if (!outcome.success()) {
    json["originalSource"] = outcome.original_source();
    json["lastError"] = outcome.last_error();
  }
  if (outcome.violations_size() > 0) {
    json["violations"] = std::vector<std::string>(
        outcome.violations().begin(), outcome.violations().end());
  }
  if (outcome.has_final_result()) {
    json["result"] = ResultToJson(outcome.final_result());
  }
  return json;
}

nlohmann::json VerdictToJson(const proto::SecurityVerdict& verdict) {
  nlohmann::json json = {
      {"safe", verdict.safe()},
      {"violations", std::vector<std::string>(verdict.violations().begin(),
                                              verdict.violations().end())},
      {"warnings", std::vector<std::string>(verdict.warnings().begin(),
                                            verdict.warnings().end())}};
  if (!verdict.safe()) json["sanitizedSource"] = verdict.sanitized_source();
  return json;
}

std::string FormatJson(const nlohmann::json& json) {
  return json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace manager
