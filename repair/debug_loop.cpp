#include "repair/debug_loop.hpp"

#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "executor/result.hpp"
#include "glog/logging.h"
#include "repair/retry_session.hpp"

namespace repair {

namespace {

void Finish(const RetrySession& session, proto::RepairState state,
            proto::RepairOutcome* outcome) {
  outcome->set_state(state);
  outcome->set_success(state == proto::RepairState::SUCCEEDED);
  outcome->set_original_source(session.original_source());
  session.FillHistory(outcome);
}

}  // namespace

DebugLoop::DebugLoop(CodeProducer* producer,
                     const security::SecurityGate* gate,
                     executor::Orchestrator* orchestrator,
                     DebugLoopOptions options)
    : producer_(producer),
      gate_(gate),
      orchestrator_(orchestrator),
      options_(std::move(options)) {
  CHECK(producer_) << "A code producer is required";
  CHECK(gate_) << "A security gate is required";
  CHECK(orchestrator_) << "An orchestrator is required";
  CHECK_GE(options_.max_attempts, 0);
}

proto::RepairOutcome DebugLoop::DebugAndFix(const std::string& source,
                                            const std::string& error,
                                            const std::string& language) {
  return Repair(source, error, language, "");
}

proto::RepairOutcome DebugLoop::RunAndRepair(const std::string& source,
                                             const std::string& language,
                                             const std::string& stdin_data) {
  proto::RepairOutcome outcome;
  outcome.set_original_source(source);
  outcome.set_final_source(source);
  proto::SecurityVerdict verdict = gate_->Check(source, language);
  if (!verdict.safe()) {
    outcome.set_state(proto::RepairState::POLICY_BLOCKED);
    *outcome.mutable_violations() = verdict.violations();
    outcome.set_last_error(absl::StrJoin(verdict.violations(), "\n"));
    return outcome;
  }
  proto::ExecutionResult result = Run(source, language, stdin_data);
  if (result.success()) {
    outcome.set_success(true);
    outcome.set_state(proto::RepairState::SUCCEEDED);
    *outcome.mutable_final_result() = result;
    return outcome;
  }
  if (!executor::IsRepairable(result)) {
    outcome.set_state(proto::RepairState::ABORTED);
    outcome.set_last_error(executor::ErrorText(result));
    *outcome.mutable_final_result() = result;
    return outcome;
  }
  outcome = Repair(source, executor::ErrorText(result), language, stdin_data);
  if (!outcome.has_final_result()) *outcome.mutable_final_result() = result;
  return outcome;
}

proto::RepairOutcome DebugLoop::Repair(const std::string& source,
                                       const std::string& error,
                                       const std::string& language,
                                       const std::string& stdin_data) {
  RetrySession session(source, error, options_.max_attempts);
  proto::RepairOutcome outcome;
  proto::ExecutionResult last_result;
  bool executed = false;

  while (session.CanRetry()) {
    VLOG(1) << "Repair attempt " << session.attempt() + 1 << "/"
            << session.max_attempts() << " for " << language;
    std::string candidate;
    try {
      candidate = producer_->Repair(session.current_source(),
                                    session.current_error(), language);
    } catch (const std::runtime_error& e) {
      LOG(WARNING) << "Code producer failed: " << e.what();
      session.RecordProducerFailure(
          absl::StrCat("Code producer failed: ", e.what()));
      continue;
    }

    proto::SecurityVerdict verdict = gate_->Check(candidate, language);
    if (!verdict.safe()) {
      LOG(WARNING) << "Repaired source rejected by the security gate";
      std::string violations = absl::StrJoin(verdict.violations(), "\n");
      Finish(session, proto::RepairState::POLICY_BLOCKED, &outcome);
      proto::RepairAttempt* entry = outcome.add_history();
      entry->set_source(candidate);
      entry->set_error(violations);
      *outcome.mutable_violations() = verdict.violations();
      outcome.set_final_source(session.current_source());
      outcome.set_attempts(session.attempt() + 1);
      outcome.set_last_error(violations);
      if (executed) *outcome.mutable_final_result() = last_result;
      return outcome;
    }

    last_result = Run(candidate, language, stdin_data);
    executed = true;
    if (last_result.success()) {
      Finish(session, proto::RepairState::SUCCEEDED, &outcome);
      outcome.set_final_source(candidate);
      outcome.set_attempts(session.attempt() + 1);
      *outcome.mutable_final_result() = last_result;
      LOG(INFO) << "Source repaired after " << outcome.attempts()
                << " attempt(s)";
      return outcome;
    }
    if (last_result.error_kind() ==
        proto::ErrorKind::CONFIGURATION_ERROR) {
      LOG(WARNING) << "Repair aborted: " << last_result.error_message();
      Finish(session, proto::RepairState::ABORTED, &outcome);
      outcome.set_final_source(session.current_source());
      outcome.set_attempts(session.attempt() + 1);
      outcome.set_last_error(executor::ErrorText(last_result));
      *outcome.mutable_final_result() = last_result;
      return outcome;
    }
    session.RecordFailure(candidate, executor::ErrorText(last_result));
  }

  LOG(INFO) << "Repair gave up after " << session.attempt() << " attempt(s)";
  Finish(session, proto::RepairState::EXHAUSTED_RETRIES, &outcome);
  outcome.set_final_source(session.current_source());
  outcome.set_attempts(session.attempt());
  outcome.set_last_error(session.current_error());
  if (executed) *outcome.mutable_final_result() = last_result;
  return outcome;
}

proto::ExecutionResult DebugLoop::Run(const std::string& source,
                                      const std::string& language,
                                      const std::string& stdin_data) {
  proto::ExecutionRequest request;
  request.set_language(language);
  request.set_source(source);
  request.set_stdin_data(stdin_data);
  *request.mutable_limits() = options_.limits;
  request.set_mode(options_.mode);
  return orchestrator_->Execute(request);
}

}  // namespace repair
