#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <string>

#include "proto/execution.pb.h"
#include "proto/language.pb.h"

namespace executor {

// Exit code reported when no process exit status is available, e.g. on
// timeouts or infrastructure failures.
static const constexpr int32_t kNoExitCode = -1;

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs a program written in the given language, feeding it stdin_data.
  // Every outcome, including problems of the backend itself, is reported in
  // the returned result: implementations do not throw. Temporary files and
  // isolation units are destroyed before returning.
  virtual proto::ExecutionResult Run(const proto::LanguageDescriptor& language,
                                     const std::string& source,
                                     const std::string& stdin_data,
                                     const proto::ResourceLimits& limits) = 0;

  // Releases resources kept between executions, if any.
  virtual void TearDown() {}

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
