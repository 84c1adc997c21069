#include "repair/retry_session.hpp"

namespace repair {

RetrySession::RetrySession(std::string original_source,
                           std::string initial_error, int32_t max_attempts)
    : original_source_(std::move(original_source)),
      current_source_(original_source_),
      current_error_(std::move(initial_error)),
      max_attempts_(max_attempts) {}

void RetrySession::RecordFailure(const std::string& source,
                                 const std::string& error) {
  proto::RepairAttempt entry;
  entry.set_source(source);
  entry.set_error(error);
  history_.push_back(std::move(entry));
  current_source_ = source;
  current_error_ = error;
  attempt_++;
}

void RetrySession::RecordProducerFailure(const std::string& message) {
  proto::RepairAttempt entry;
  entry.set_source(current_source_);
  entry.set_error(message);
  history_.push_back(std::move(entry));
  attempt_++;
}

void RetrySession::FillHistory(proto::RepairOutcome* outcome) const {
  for (const proto::RepairAttempt& entry : history_) {
    *outcome->add_history() = entry;
  }
}

}  // namespace repair
