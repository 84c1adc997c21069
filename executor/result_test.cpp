#include "executor/result.hpp"

#include "executor/executor.hpp"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(ResultTest, ErrorResult) {
  proto::ExecutionResult result =
      executor::ErrorResult(proto::TIMEOUT_ERROR, "too slow");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.exit_code(), executor::kNoExitCode);
  EXPECT_EQ(result.error_kind(), proto::TIMEOUT_ERROR);
  EXPECT_EQ(result.error_message(), "too slow");
}

// NOLINTNEXTLINE
TEST(ResultTest, ErrorText) {
  proto::ExecutionResult result;
  result.set_success(true);
  result.set_stderr_data("ignored");
  EXPECT_EQ(executor::ErrorText(result), "");

  result = executor::ErrorResult(proto::RUNTIME_ERROR, "Exited with code 1");
  result.set_stderr_data("NameError: name 'x' is not defined\n");
  EXPECT_EQ(executor::ErrorText(result),
            "Exited with code 1\nNameError: name 'x' is not defined\n");

  result.Clear();
  result.set_exit_code(2);
  EXPECT_EQ(executor::ErrorText(result), "Program exited with code 2");
}

// NOLINTNEXTLINE
TEST(ResultTest, IsRepairable) {
  EXPECT_TRUE(executor::IsRepairable(
      executor::ErrorResult(proto::COMPILE_ERROR, "")));
  EXPECT_TRUE(executor::IsRepairable(
      executor::ErrorResult(proto::TIMEOUT_ERROR, "")));
  EXPECT_FALSE(executor::IsRepairable(
      executor::ErrorResult(proto::CONFIGURATION_ERROR, "")));
  EXPECT_FALSE(executor::IsRepairable(
      executor::ErrorResult(proto::SECURITY_POLICY_VIOLATION, "")));
  EXPECT_FALSE(executor::IsRepairable(
      executor::ErrorResult(proto::BACKEND_PROTOCOL_ERROR, "")));
  proto::ExecutionResult ok;
  ok.set_success(true);
  EXPECT_FALSE(executor::IsRepairable(ok));
}

}  // namespace
