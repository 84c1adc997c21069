#ifndef REPAIR_RETRY_SESSION_HPP
#define REPAIR_RETRY_SESSION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "proto/repair.pb.h"

namespace repair {

// State of one repair cycle. Owned by a single DebugAndFix call.
class RetrySession {
 public:
  RetrySession(std::string original_source, std::string initial_error,
               int32_t max_attempts);

  bool CanRetry() const { return attempt_ < max_attempts_; }

  // Records a repaired source that failed with error and makes it the
  // current one.
  void RecordFailure(const std::string& source, const std::string& error);

  // Records an attempt where no source could be produced. The current source
  // and error are kept.
  void RecordProducerFailure(const std::string& message);

  // Copies the history into outcome.
  void FillHistory(proto::RepairOutcome* outcome) const;

  const std::string& original_source() const { return original_source_; }
  const std::string& current_source() const { return current_source_; }
  const std::string& current_error() const { return current_error_; }
  int32_t attempt() const { return attempt_; }
  int32_t max_attempts() const { return max_attempts_; }
  const std::vector<proto::RepairAttempt>& history() const { return history_; }

 private:
  std::string original_source_;
  std::string current_source_;
  std::string current_error_;
  int32_t attempt_ = 0;
  int32_t max_attempts_;
  std::vector<proto::RepairAttempt> history_;
};

}  // namespace repair

#endif
