#include "executor/orchestrator.hpp"

#include <mutex>

#include "absl/memory/memory.h"
#include "executor/result.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class FakeExecutor : public executor::Executor {
 public:
  explicit FakeExecutor(std::string id) : id_(std::move(id)) {}
  std::string Id() const override { return id_; }

  proto::ExecutionResult Run(const proto::LanguageDescriptor& language,
                             const std::string& source,
                             const std::string& stdin_data,
                             const proto::ResourceLimits& limits) override {
    std::lock_guard<std::mutex> lock(mutex_);
    runs_++;
    last_language_ = language.id();
    last_limits_ = limits;
    proto::ExecutionResult result;
    result.set_success(true);
    result.set_stdout_data(source + "|" + stdin_data);
    result.set_backend_used(id_);
    result.set_language(language.id());
    return result;
  }

  void TearDown() override {
    std::lock_guard<std::mutex> lock(mutex_);
    teardowns_++;
  }

  int runs() {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_;
  }
  int teardowns() {
    std::lock_guard<std::mutex> lock(mutex_);
    return teardowns_;
  }
  std::string last_language() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_language_;
  }
  proto::ResourceLimits last_limits() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_limits_;
  }

 private:
  std::string id_;
  std::mutex mutex_;
  int runs_ = 0;
  int teardowns_ = 0;
  std::string last_language_;
  proto::ResourceLimits last_limits_;
};

class OrchestratorTest : public ::testing::Test {
 protected:
  OrchestratorTest() : registry_(language::LanguageRegistry::Default()) {
    options_.default_limits.set_timeout_seconds(30);
    options_.default_limits.set_memory_limit("100m");
  }

  std::unique_ptr<executor::Orchestrator> Build(bool container_available,
                                                bool remote_available) {
    options_.container_available = container_available;
    options_.remote_available = remote_available;
    auto container = absl::make_unique<FakeExecutor>("container");
    auto local = absl::make_unique<FakeExecutor>("local");
    auto remote = absl::make_unique<FakeExecutor>("remote");
    container_ = container.get();
    local_ = local.get();
    remote_ = remote.get();
    executor::Backends backends;
    backends.container = std::move(container);
    backends.local = std::move(local);
    backends.remote = std::move(remote);
    return absl::make_unique<executor::Orchestrator>(
        registry_.get(), options_, std::move(backends));
  }

  proto::ExecutionRequest Request(const std::string& language,
                                  proto::ExecutionMode mode = proto::AUTO) {
    proto::ExecutionRequest request;
    request.set_language(language);
    request.set_source("print(1)");
    request.set_mode(mode);
    return request;
  }

  std::unique_ptr<language::LanguageRegistry> registry_;
  executor::OrchestratorOptions options_;
  FakeExecutor* container_ = nullptr;
  FakeExecutor* local_ = nullptr;
  FakeExecutor* remote_ = nullptr;
};

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, UnsupportedLanguage) {
  auto orchestrator = Build(true, true);
  proto::ExecutionResult result =
      orchestrator->Execute(Request("brainfuck"));
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error_kind(), proto::CONFIGURATION_ERROR);
  EXPECT_THAT(result.error_message(), HasSubstr("brainfuck"));
  EXPECT_EQ(result.backend_used(), "");
  EXPECT_EQ(container_->runs() + local_->runs() + remote_->runs(), 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, AutoPrefersContainer) {
  auto orchestrator = Build(true, true);
  proto::ExecutionResult result = orchestrator->Execute(Request("py"));
  EXPECT_TRUE(result.success());
  EXPECT_EQ(result.backend_used(), "container");
  EXPECT_EQ(container_->last_language(), "python");
  EXPECT_EQ(remote_->runs(), 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, AutoFallsBackToLocal) {
  auto orchestrator = Build(false, true);
  proto::ExecutionResult result = orchestrator->Execute(Request("python"));
  EXPECT_EQ(result.backend_used(), "local");
  EXPECT_EQ(container_->runs(), 0);
  EXPECT_EQ(remote_->runs(), 0);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, ExplicitModes) {
  auto orchestrator = Build(false, false);
  proto::ExecutionResult result =
      orchestrator->Execute(Request("python", proto::CONTAINER));
  EXPECT_EQ(result.error_kind(), proto::CONFIGURATION_ERROR);
  result = orchestrator->Execute(Request("python", proto::REMOTE));
  EXPECT_EQ(result.error_kind(), proto::CONFIGURATION_ERROR);
  EXPECT_EQ(container_->runs() + remote_->runs(), 0);

  orchestrator = Build(true, true);
  EXPECT_EQ(orchestrator->Execute(Request("python", proto::LOCAL))
                .backend_used(),
            "local");
  EXPECT_EQ(orchestrator->Execute(Request("python", proto::REMOTE))
                .backend_used(),
            "remote");
  EXPECT_EQ(orchestrator->Execute(Request("python", proto::CONTAINER))
                .backend_used(),
            "container");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, DefaultLimits) {
  auto orchestrator = Build(false, false);
  proto::ExecutionRequest request = Request("python");
  orchestrator->Execute(request);
  EXPECT_EQ(local_->last_limits().timeout_seconds(), 30);
  EXPECT_EQ(local_->last_limits().memory_limit(), "100m");

  request.mutable_limits()->set_timeout_seconds(5);
  request.mutable_limits()->set_cpu_share(0.25);
  orchestrator->Execute(request);
  EXPECT_EQ(local_->last_limits().timeout_seconds(), 5);
  EXPECT_EQ(local_->last_limits().memory_limit(), "100m");
  EXPECT_DOUBLE_EQ(local_->last_limits().cpu_share(), 0.25);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, ExecuteAsync) {
  auto orchestrator = Build(false, false);
  std::vector<std::future<proto::ExecutionResult>> futures;
  for (int i = 0; i < 8; i++) {
    proto::ExecutionRequest request = Request("python");
    request.set_stdin_data(std::to_string(i));
    futures.push_back(orchestrator->ExecuteAsync(request));
  }
  for (int i = 0; i < 8; i++) {
    EXPECT_EQ(futures[i].get().stdout_data(),
              "print(1)|" + std::to_string(i));
  }
  EXPECT_EQ(local_->runs(), 8);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorTest, AvailableBackendsAndTearDown) {
  auto orchestrator = Build(true, false);
  EXPECT_THAT(orchestrator->AvailableBackends(),
              ElementsAre("container", "local"));
  EXPECT_THAT(orchestrator->Describe(), HasSubstr("default: container"));
  orchestrator->TearDown();
  EXPECT_EQ(remote_->teardowns(), 1);
  EXPECT_EQ(local_->teardowns(), 1);
}

}  // namespace
