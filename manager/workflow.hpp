#ifndef MANAGER_WORKFLOW_HPP
#define MANAGER_WORKFLOW_HPP

#include <cstdint>
#include <string>

#include "executor/orchestrator.hpp"
#include "nlohmann/json.hpp"
#include "proto/execution.pb.h"
#include "proto/repair.pb.h"
#include "proto/security.pb.h"
#include "repair/code_producer.hpp"
#include "security/security_gate.hpp"

namespace manager {

// The operations offered to callers: every source is checked by the security
// gate before it reaches a backend.
class Workflow {
 public:
  // producer may be null, in which case no repair is possible. The other
  // collaborators are required. All of them must outlive the workflow.
  Workflow(const security::SecurityGate* gate,
           executor::Orchestrator* orchestrator,
           repair::CodeProducer* producer, int32_t max_attempts);

  // Runs a request. Unsafe sources are rejected with a
  // SECURITY_POLICY_VIOLATION result and never reach the orchestrator.
  proto::ExecutionResult Execute(const proto::ExecutionRequest& request);

  proto::SecurityVerdict CheckSecurity(const std::string& source,
                                       const std::string& language) const;

  // Repairs a source that failed with error.
  proto::RepairOutcome DebugAndFix(const std::string& source,
                                   const std::string& error,
                                   const std::string& language);

  // Runs a request and, if it fails in a way a repair can fix, repairs it
  // using the same mode, limits and stdin.
  proto::RepairOutcome ExecuteWithRepair(
      const proto::ExecutionRequest& request);

  Workflow(const Workflow&) = delete;
  Workflow& operator=(const Workflow&) = delete;
  Workflow(Workflow&&) = delete;
  Workflow& operator=(Workflow&&) = delete;
  ~Workflow() = default;

 private:
  proto::RepairOutcome NoProducer(const std::string& source) const;

  const security::SecurityGate* gate_;
  executor::Orchestrator* orchestrator_;
  repair::CodeProducer* producer_;
  int32_t max_attempts_;
};

// JSON documents printed by the command line tool.
nlohmann::json ResultToJson(const proto::ExecutionResult& result);
nlohmann::json OutcomeToJson(const proto::RepairOutcome& outcome);
nlohmann::json VerdictToJson(const proto::SecurityVerdict& verdict);

// Indented text of a document. Bytes that are not valid UTF-8, as programs
// may print, become U+FFFD.
std::string FormatJson(const nlohmann::json& json);

}  // namespace manager

#endif
