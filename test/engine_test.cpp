#include <thread>
#include <chrono>

#include <dynexec/engine.h>
#include <dynexec/paths.h>
#include "utils.h"

namespace {

class EngineTest : public ::testing::Test {
 protected:
  std::shared_ptr<FakeRuntime> runtime = std::make_shared<FakeRuntime>();
  std::string python_path;
  bool allow_local_fallback;
  Backend forced_backend;

  void SetUp() override {
    python_path = kPythonPath;
    allow_local_fallback = kAllowLocalFallback;
    forced_backend = kForcedBackend;
  }
  void TearDown() override {
    kPythonPath = python_path;
    kAllowLocalFallback = allow_local_fallback;
    kForcedBackend = forced_backend;
  }
};

} // namespace

TEST_F(EngineTest, Hello) {
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("print(\"hello\")\n", 30);
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS);
  ASSERT_TRUE(res.exit_code);
  EXPECT_EQ(*res.exit_code, 0);
  EXPECT_EQ(res.stdout_data, "hello\n");
  EXPECT_EQ(res.backend_used, Backend::CONTAINER);
  EXPECT_EQ(res.isolation, Isolation::FULL);
  EXPECT_EQ(res.timeout, 30);
  EXPECT_EQ(res.memory, kDefaultMemory);
}

TEST_F(EngineTest, RejectedBeforeAnyBackend) {
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("import subprocess\nsubprocess.run(['ls'])\n");
  EXPECT_EQ(res.status, ExecutionStatus::SECURITY_REJECTED);
  ASSERT_FALSE(res.violations.empty());
  EXPECT_EQ(res.violations[0].rule_id, "denied-import");
  EXPECT_EQ(res.violations[0].fragment, "subprocess");
  EXPECT_FALSE(res.exit_code);
  EXPECT_EQ(res.backend_used, Backend::NONE);
  EXPECT_EQ(runtime->ping_count.load(), 0);
  EXPECT_EQ(runtime->build_count.load(), 0);
}

TEST_F(EngineTest, EmptySourceRejected) {
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("   \n");
  EXPECT_EQ(res.status, ExecutionStatus::SECURITY_REJECTED);
  ASSERT_FALSE(res.violations.empty());
  EXPECT_EQ(res.violations[0].rule_id, "empty-source");
}

TEST_F(EngineTest, LimitsClamped) {
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("print(\"x\")\n", 5, 1000);
  EXPECT_EQ(res.timeout, kMinTimeout);
  EXPECT_EQ(res.memory, kMaxMemory);
  auto created = runtime->Created();
  ASSERT_EQ(created.size(), 1u);
  EXPECT_EQ(created[0].memory, kMaxMemory);

  res = engine.ExecuteDynamicCode("print(\"x\")\n", 1000, 1);
  EXPECT_EQ(res.timeout, kMaxTimeout);
  EXPECT_EQ(res.memory, kMinMemory);
}

TEST_F(EngineTest, NonZeroExit) {
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("print(\"a\")\nraise SystemExit(4)\n");
  EXPECT_EQ(res.status, ExecutionStatus::COMPLETED_WITH_ERROR);
  ASSERT_TRUE(res.exit_code);
  EXPECT_EQ(*res.exit_code, 4);
}

TEST_F(EngineTest, Timeout) {
  runtime->hang = true;
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("while True:\n    pass\n", 10);
  EXPECT_EQ(res.status, ExecutionStatus::TIMEOUT);
  EXPECT_FALSE(res.exit_code);
  EXPECT_TRUE(runtime->Units().empty());
}

TEST_F(EngineTest, IndependentSandboxes) {
  Engine engine(runtime);
  engine.ExecuteDynamicCode("print(\"same\")\n");
  engine.ExecuteDynamicCode("print(\"same\")\n");
  auto created = runtime->Created();
  ASSERT_EQ(created.size(), 2u);
  EXPECT_NE(created[0].name, created[1].name);
  EXPECT_TRUE(runtime->Units().empty());
  EXPECT_TRUE(runtime->JobImages().empty());
  EXPECT_EQ(SandboxDirCount(), 0);
}

TEST_F(EngineTest, Concurrent) {
  Engine engine(runtime);
  constexpr int kCalls = 5;
  std::vector<std::thread> threads;
  std::vector<ExecutionResult> results(kCalls);
  for (int i = 0; i < kCalls; i++) {
    threads.emplace_back([&, i]() {
      results[i] = engine.ExecuteDynamicCode("print(\"token" + std::to_string(i) + "\")\n");
    });
  }
  for (auto& i : threads) i.join();
  for (int i = 0; i < kCalls; i++) {
    EXPECT_EQ(results[i].status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(results[i].stdout_data, "token" + std::to_string(i) + "\n");
  }
  EXPECT_EQ(runtime->Created().size(), (size_t)kCalls);
  EXPECT_TRUE(runtime->Units().empty());
  EXPECT_TRUE(runtime->JobImages().empty());
  EXPECT_EQ(SandboxDirCount(), 0);
}

TEST_F(EngineTest, LaunchFailureInvalidatesSelection) {
  Engine engine(runtime);
  EXPECT_EQ(engine.ExecuteDynamicCode("print(\"a\")\n").status, ExecutionStatus::SUCCESS);
  EXPECT_EQ(runtime->ping_count.load(), 1);

  runtime->fail_at = FakeRuntime::FailAt::CREATE;
  ExecutionResult res = engine.ExecuteDynamicCode("print(\"a\")\n");
  EXPECT_EQ(res.status, ExecutionStatus::INFRASTRUCTURE_ERROR);
  EXPECT_FALSE(res.error.empty());
  // host paths never leak
  EXPECT_EQ(res.error.find(kWorkRoot.string()), std::string::npos);
  EXPECT_EQ(SandboxDirCount(), 0);

  runtime->fail_at = FakeRuntime::FailAt::NONE;
  EXPECT_EQ(engine.ExecuteDynamicCode("print(\"a\")\n").status, ExecutionStatus::SUCCESS);
  EXPECT_EQ(runtime->ping_count.load(), 2);
}

TEST_F(EngineTest, BuildFailureMessageSanitized) {
  runtime->fail_at = FakeRuntime::FailAt::BUILD;
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("print(\"a\")\n");
  EXPECT_EQ(res.status, ExecutionStatus::INFRASTRUCTURE_ERROR);
  EXPECT_EQ(res.error.find(kWorkRoot.string()), std::string::npos);
  EXPECT_NE(res.error.find("/sandbox"), std::string::npos);
}

TEST_F(EngineTest, BackendUnavailable) {
  runtime->reachable = false;
  kAllowLocalFallback = false;
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("print(\"a\")\n");
  EXPECT_EQ(res.status, ExecutionStatus::BACKEND_UNAVAILABLE);
  EXPECT_EQ(res.backend_used, Backend::NONE);
  EXPECT_FALSE(res.exit_code);
}

TEST_F(EngineTest, NoInterpreterNoFallback) {
  runtime->reachable = false;
  kPythonPath = "/nonexistent/python3";
  Engine engine(runtime);
  EXPECT_EQ(engine.ExecuteDynamicCode("print(\"a\")\n").status, ExecutionStatus::BACKEND_UNAVAILABLE);
}

TEST_F(EngineTest, DegradedFallback) {
  if (HostPython().empty()) GTEST_SKIP() << "python3 not found";
  runtime->reachable = false;
  kPythonPath = HostPython();
  Engine engine(runtime);
  ExecutionResult res = engine.ExecuteDynamicCode("print(2 + 2)\n", 30);
  EXPECT_EQ(res.status, ExecutionStatus::SUCCESS);
  EXPECT_EQ(res.stdout_data, "4\n");
  ASSERT_TRUE(res.exit_code);
  EXPECT_EQ(*res.exit_code, 0);
  EXPECT_EQ(res.backend_used, Backend::LOCAL_RESTRICTED);
  EXPECT_EQ(res.isolation, Isolation::DEGRADED);
  EXPECT_EQ(SandboxDirCount(), 0);
}

TEST_F(EngineTest, DegradedTimeout) {
  if (HostPython().empty()) GTEST_SKIP() << "python3 not found";
  kPythonPath = HostPython();
  kForcedBackend = Backend::LOCAL_RESTRICTED;
  Engine engine(runtime);
  auto start = std::chrono::steady_clock::now();
  ExecutionResult res = engine.ExecuteDynamicCode("while True:\n    pass\n", 10);
  double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  EXPECT_EQ(res.status, ExecutionStatus::TIMEOUT);
  EXPECT_FALSE(res.exit_code);
  EXPECT_LT(elapsed, 12.5);
  EXPECT_EQ(runtime->ping_count.load(), 0);
}

TEST_F(EngineTest, CheckSyntax) {
  kPythonPath = "/nonexistent/python3";
  EXPECT_FALSE(CheckSyntax("x = 1\n"));
  if (HostPython().empty()) GTEST_SKIP() << "python3 not found";
  kPythonPath = HostPython();
  auto check = CheckSyntax("if True\n    pass\n");
  ASSERT_TRUE(check);
  EXPECT_FALSE(check->valid);
  EXPECT_EQ(check->line, 1);
}

TEST(CheckCodeSecurity, DoesNotExecute) {
  SecurityVerdict verdict = CheckCodeSecurity("import os\n");
  EXPECT_FALSE(verdict.safe);
  verdict = CheckCodeSecurity("print(1)\n");
  EXPECT_TRUE(verdict.safe);
}
