#include "manager/workflow.hpp"

#include "absl/memory/memory.h"
#include "absl/strings/match.h"
#include "executor/result.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

// Echoes the source; sources containing "BROKEN" fail.
class EchoExecutor : public executor::Executor {
 public:
  std::string Id() const override { return "local"; }

  proto::ExecutionResult Run(const proto::LanguageDescriptor& language,
                             const std::string& source,
                             const std::string& stdin_data,
                             const proto::ResourceLimits& limits) override {
    runs++;
    last_stdin = stdin_data;
    last_limits = limits;
    proto::ExecutionResult result;
    result.set_backend_used("local");
    result.set_language(language.id());
    if (absl::StrContains(source, "BROKEN")) {
      result.set_exit_code(2);
      result.set_error_kind(proto::RUNTIME_ERROR);
      result.set_error_message("Exited with code 2");
      result.set_stderr_data("Traceback");
    } else {
      result.set_success(true);
      result.set_stdout_data(source);
    }
    return result;
  }

  int runs = 0;
  std::string last_stdin;
  proto::ResourceLimits last_limits;
};

class FixedProducer : public repair::CodeProducer {
 public:
  std::string Generate(const std::string& prompt) override {
    return "print('" + prompt + "')";
  }
  std::string Repair(const std::string& source, const std::string& error,
                     const std::string& language) override {
    calls++;
    return "print('fixed')";
  }
  int calls = 0;
};

class WorkflowTest : public ::testing::Test {
 protected:
  WorkflowTest()
      : registry_(language::LanguageRegistry::Default()),
        gate_(registry_.get()) {
    auto executor = absl::make_unique<EchoExecutor>();
    executor_ = executor.get();
    executor::Backends backends;
    backends.local = std::move(executor);
    executor::OrchestratorOptions options;
    options.default_limits.set_timeout_seconds(30);
    options.default_limits.set_memory_limit("100m");
    orchestrator_ = absl::make_unique<executor::Orchestrator>(
        registry_.get(), options, std::move(backends));
  }

  proto::ExecutionRequest Request(const std::string& source) {
    proto::ExecutionRequest request;
    request.set_language("python");
    request.set_source(source);
    return request;
  }

  std::unique_ptr<language::LanguageRegistry> registry_;
  security::SecurityGate gate_;
  EchoExecutor* executor_;
  std::unique_ptr<executor::Orchestrator> orchestrator_;
  FixedProducer producer_;
};

// NOLINTNEXTLINE
TEST_F(WorkflowTest, UnsafeSourceIsNeverExecuted) {
  manager::Workflow workflow(&gate_, orchestrator_.get(), &producer_, 3);
  proto::ExecutionResult result =
      workflow.Execute(Request("import os\nos.system('rm -rf /')"));
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error_kind(), proto::SECURITY_POLICY_VIOLATION);
  EXPECT_THAT(result.error_message(), HasSubstr("rm -rf /"));
  EXPECT_EQ(result.backend_used(), "");
  EXPECT_EQ(executor_->runs, 0);

  proto::RepairOutcome outcome =
      workflow.ExecuteWithRepair(Request("import subprocess"));
  EXPECT_EQ(outcome.state(), proto::RepairState::POLICY_BLOCKED);
  EXPECT_EQ(executor_->runs, 0);
  EXPECT_EQ(producer_.calls, 0);
}

// NOLINTNEXTLINE
TEST_F(WorkflowTest, SafeSourceIsExecuted) {
  manager::Workflow workflow(&gate_, orchestrator_.get(), nullptr, 3);
  proto::ExecutionRequest request = Request("print(1)");
  request.set_stdin_data("42\n");
  proto::ExecutionResult result = workflow.Execute(request);
  EXPECT_TRUE(result.success());
  EXPECT_EQ(result.stdout_data(), "print(1)");
  EXPECT_EQ(executor_->last_stdin, "42\n");
}

// NOLINTNEXTLINE
TEST_F(WorkflowTest, CheckSecurity) {
  manager::Workflow workflow(&gate_, orchestrator_.get(), nullptr, 3);
  EXPECT_TRUE(workflow.CheckSecurity("print(1)", "python").safe());
  EXPECT_FALSE(workflow.CheckSecurity("import socket", "py").safe());
  EXPECT_EQ(executor_->runs, 0);
}

// NOLINTNEXTLINE
TEST_F(WorkflowTest, RepairNeedsAProducer) {
  manager::Workflow workflow(&gate_, orchestrator_.get(), nullptr, 3);
  proto::RepairOutcome outcome =
      workflow.DebugAndFix("print(x) # BROKEN", "NameError", "python");
  EXPECT_EQ(outcome.state(), proto::RepairState::ABORTED);
  EXPECT_THAT(outcome.last_error(), HasSubstr("--producer_command"));

  proto::RepairOutcome run =
      workflow.ExecuteWithRepair(Request("print(x) # BROKEN"));
  EXPECT_EQ(run.state(), proto::RepairState::ABORTED);
  EXPECT_EQ(run.final_result().error_kind(), proto::RUNTIME_ERROR);

  proto::RepairOutcome ok = workflow.ExecuteWithRepair(Request("print(1)"));
  EXPECT_TRUE(ok.success());
  EXPECT_EQ(ok.state(), proto::RepairState::SUCCEEDED);
  EXPECT_EQ(ok.last_error(), "");
}

// NOLINTNEXTLINE
TEST_F(WorkflowTest, ExecuteWithRepairKeepsTheRequest) {
  manager::Workflow workflow(&gate_, orchestrator_.get(), &producer_, 3);
  proto::ExecutionRequest request = Request("print(x) # BROKEN");
  request.set_stdin_data("in");
  request.set_mode(proto::LOCAL);
  request.mutable_limits()->set_timeout_seconds(7);
  proto::RepairOutcome outcome = workflow.ExecuteWithRepair(request);
  EXPECT_TRUE(outcome.success());
  EXPECT_EQ(outcome.attempts(), 1);
  EXPECT_EQ(outcome.final_source(), "print('fixed')");
  EXPECT_EQ(executor_->runs, 2);
  EXPECT_EQ(executor_->last_stdin, "in");
  EXPECT_EQ(executor_->last_limits.timeout_seconds(), 7);
  EXPECT_EQ(executor_->last_limits.memory_limit(), "100m");
}

// NOLINTNEXTLINE
TEST_F(WorkflowTest, DebugAndFixUsesTheAttemptLimit) {
  manager::Workflow workflow(&gate_, orchestrator_.get(), &producer_, 0);
  proto::RepairOutcome outcome =
      workflow.DebugAndFix("print(x) # BROKEN", "NameError", "python");
  EXPECT_EQ(outcome.state(), proto::RepairState::EXHAUSTED_RETRIES);
  EXPECT_EQ(producer_.calls, 0);
}

// NOLINTNEXTLINE
TEST(JsonTest, Result) {
  proto::ExecutionResult result;
  result.set_success(true);
  result.set_stdout_data("hi\n");
  result.set_language("python");
  result.set_backend_used("local");
  result.set_duration_ms(12);
  nlohmann::json json = manager::ResultToJson(result);
  EXPECT_EQ(json["success"], true);
  EXPECT_EQ(json["output"], "hi\n");
  EXPECT_EQ(json["error"], "");
  EXPECT_EQ(json["exitCode"], 0);
  EXPECT_EQ(json["language"], "python");
  EXPECT_EQ(json["backend"], "local");
  EXPECT_EQ(json["executed"], true);
  EXPECT_EQ(json["durationMs"], 12);
  EXPECT_FALSE(json.count("errorKind"));

  nlohmann::json rejected = manager::ResultToJson(executor::ErrorResult(
      proto::SECURITY_POLICY_VIOLATION, "Security check failed"));
  EXPECT_EQ(rejected["executed"], false);
  EXPECT_EQ(rejected["exitCode"], -1);
  EXPECT_EQ(rejected["errorKind"], "SECURITY_POLICY_VIOLATION");
  EXPECT_EQ(rejected["error"], "Security check failed");
}

// NOLINTNEXTLINE
TEST(JsonTest, Outcome) {
  proto::RepairOutcome outcome;
  outcome.set_state(proto::RepairState::EXHAUSTED_RETRIES);
  outcome.set_final_source("b");
  outcome.set_original_source("a");
  outcome.set_attempts(1);
  outcome.set_last_error("boom");
  proto::RepairAttempt* attempt = outcome.add_history();
  attempt->set_source("b");
  attempt->set_error("boom");
  nlohmann::json json = manager::OutcomeToJson(outcome);
  EXPECT_EQ(json["success"], false);
  EXPECT_EQ(json["fixedSource"], "b");
  EXPECT_EQ(json["attempts"], 1);
  EXPECT_EQ(json["state"], "EXHAUSTED_RETRIES");
  EXPECT_EQ(json["lastError"], "boom");
  ASSERT_EQ(json["history"].size(), 1u);
  EXPECT_EQ(json["history"][0]["source"], "b");
  EXPECT_EQ(json["history"][0]["error"], "boom");
  EXPECT_FALSE(json.count("result"));
}

// NOLINTNEXTLINE
TEST(JsonTest, Verdict) {
  proto::SecurityVerdict verdict;
  verdict.set_safe(false);
  verdict.add_violations("Import of restricted module: os");
  verdict.add_warnings("Hard-coded IP address: 10.0.0.1");
  verdict.set_sanitized_source("# REMOVED: import os");
  nlohmann::json json = manager::VerdictToJson(verdict);
  EXPECT_EQ(json["safe"], false);
  EXPECT_EQ(json["violations"],
            nlohmann::json::array({"Import of restricted module: os"}));
  EXPECT_EQ(json["warnings"].size(), 1u);
  EXPECT_EQ(json["sanitizedSource"], "# REMOVED: import os");
}

// NOLINTNEXTLINE
TEST(JsonTest, FormatInvalidUtf8) {
  proto::ExecutionResult result;
  result.set_exit_code(1);
  result.set_error_kind(proto::RUNTIME_ERROR);
  result.set_stdout_data("partial \xe2\x82");
  result.set_stderr_data("raw \xff byte");
  std::string text = manager::FormatJson(manager::ResultToJson(result));
  nlohmann::json parsed = nlohmann::json::parse(text);
  EXPECT_EQ(parsed["error"], "raw \xef\xbf\xbd byte");
  EXPECT_THAT(parsed["output"].get<std::string>(), HasSubstr("partial "));
  EXPECT_EQ(parsed["exitCode"], 1);
}

}  // namespace
