#ifndef EXECUTOR_RESULT_HPP
#define EXECUTOR_RESULT_HPP

#include <string>

#include "proto/execution.pb.h"

namespace executor {

// A failed result of the given kind. The exit code is kNoExitCode.
proto::ExecutionResult ErrorResult(proto::ErrorKind kind,
                                   const std::string& message);

// Text describing why a result failed, as shown to a code producer: the error
// message followed by the program's stderr. Empty for successful results.
std::string ErrorText(const proto::ExecutionResult& result);

// Whether a failed result may be fixed by changing the source. Configuration
// problems, policy violations and backend failures are not.
bool IsRepairable(const proto::ExecutionResult& result);

}  // namespace executor

#endif
