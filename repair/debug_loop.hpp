#ifndef REPAIR_DEBUG_LOOP_HPP
#define REPAIR_DEBUG_LOOP_HPP

#include <cstdint>
#include <string>

#include "executor/orchestrator.hpp"
#include "proto/execution.pb.h"
#include "proto/repair.pb.h"
#include "repair/code_producer.hpp"
#include "security/security_gate.hpp"

namespace repair {

struct DebugLoopOptions {
  // Maximum number of repaired sources that are executed.
  int32_t max_attempts = 3;
  proto::ExecutionMode mode = proto::ExecutionMode::AUTO;
  // Limits of every execution; unset fields take the orchestrator defaults.
  proto::ResourceLimits limits;
};

// Bounded repair cycle: asks the producer for a fix, checks it with the
// security gate and runs it, until a fix succeeds or the attempts run out.
// Every repaired source goes through the gate before it is executed.
class DebugLoop {
 public:
  // All the collaborators must outlive the loop.
  DebugLoop(CodeProducer* producer, const security::SecurityGate* gate,
            executor::Orchestrator* orchestrator,
            DebugLoopOptions options = DebugLoopOptions());

  // Repairs source, which failed with error. The repaired versions run with
  // empty stdin.
  proto::RepairOutcome DebugAndFix(const std::string& source,
                                   const std::string& error,
                                   const std::string& language);

  // Checks and runs source, and repairs it if it fails in a way a change of
  // source can fix. The repaired versions run with the same stdin. If the
  // first run succeeds the outcome is SUCCEEDED with zero attempts.
  proto::RepairOutcome RunAndRepair(const std::string& source,
                                    const std::string& language,
                                    const std::string& stdin_data);

  DebugLoop(const DebugLoop&) = delete;
  DebugLoop& operator=(const DebugLoop&) = delete;
  DebugLoop(DebugLoop&&) = delete;
  DebugLoop& operator=(DebugLoop&&) = delete;
  ~DebugLoop() = default;

 private:
  proto::RepairOutcome Repair(const std::string& source,
                              const std::string& error,
                              const std::string& language,
                              const std::string& stdin_data);
  proto::ExecutionResult Run(const std::string& source,
                             const std::string& language,
                             const std::string& stdin_data);

  CodeProducer* producer_;
  const security::SecurityGate* gate_;
  executor::Orchestrator* orchestrator_;
  DebugLoopOptions options_;
};

}  // namespace repair

#endif
