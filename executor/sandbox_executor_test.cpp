#include "executor/sandbox_executor.hpp"

#include <string>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#ifndef GRADEBOX_RUNTIME_PATH
#error "GRADEBOX_RUNTIME_PATH must point to the gradebox_runtime binary"
#endif

namespace {

using executor::ExecutionLimits;
using executor::ExecutionResult;
using executor::SandboxExecutor;
using ::testing::ElementsAre;

ExecutionLimits TestLimits() {
  ExecutionLimits limits;
  limits.memory_kb = 256 * 1024;
  limits.max_files = 16;
  limits.stack_kb = 64 * 1024;
  return limits;
}

class SandboxExecutorTest : public ::testing::Test {
 protected:
  SandboxExecutorTest()
      : executor_("test", GRADEBOX_RUNTIME_PATH, "/tmp", TestLimits()) {}

  void AddTest(const std::string& name, const std::string& assertion) {
    proto::TestCase* test = battery_.add_tests();
    test->set_name(name);
    test->set_assertion(assertion);
  }

  ExecutionResult Execute(absl::Duration budget = absl::Seconds(5)) {
    return executor_.Execute(submission_, battery_, budget);
  }

  SandboxExecutor executor_;
  proto::Submission submission_;
  proto::TestBattery battery_;
};

TEST_F(SandboxExecutorTest, PassingAndFailingTests) {
  submission_.set_markup("<p id=x>1</p>");
  submission_.set_script(
      "const p = document.getElementById('x')\n"
      "p.textContent = '2'\n"
      "console.log('updated to', p.textContent)\n");
  AddTest("updated", "document.getElementById('x').textContent == '2'");
  AddTest("original", "document.getElementById('x').textContent == '1'");

  ExecutionResult result = Execute();
  EXPECT_EQ(result.termination_reason, proto::TerminationReason::NORMAL);
  ASSERT_EQ(result.outcomes.size(), 2u);
  EXPECT_EQ(result.outcomes[0].name(), "updated");
  EXPECT_TRUE(result.outcomes[0].passed());
  EXPECT_EQ(result.outcomes[1].name(), "original");
  EXPECT_FALSE(result.outcomes[1].passed());
  ASSERT_EQ(result.logs.size(), 1u);
  EXPECT_EQ(result.logs[0].text(), "updated to 2");
  EXPECT_TRUE(result.fault_message.empty());
}

TEST_F(SandboxExecutorTest, ScriptFaultFailsEveryTest) {
  submission_.set_script("throw Error('bad')");
  AddTest("a", "true");
  AddTest("b", "true");

  ExecutionResult result = Execute();
  EXPECT_EQ(result.termination_reason, proto::TerminationReason::FAULT);
  EXPECT_EQ(result.fault_message, "Error: bad");
  ASSERT_EQ(result.outcomes.size(), 2u);
  for (const proto::TestOutcome& outcome : result.outcomes) {
    EXPECT_FALSE(outcome.passed());
    EXPECT_EQ(outcome.message(), "Error: bad");
  }
}

TEST_F(SandboxExecutorTest, InfiniteLoopTimesOut) {
  submission_.set_script("while (true) {}");
  AddTest("never", "true");

  ExecutionResult result = Execute(absl::Milliseconds(500));
  EXPECT_EQ(result.termination_reason, proto::TerminationReason::TIMEOUT);
  ASSERT_EQ(result.outcomes.size(), 1u);
  EXPECT_FALSE(result.outcomes[0].passed());
  EXPECT_EQ(result.outcomes[0].message(), "timeout");
  EXPECT_GE(result.duration_ms, 500);
  EXPECT_LT(result.duration_ms, 5000);
}

TEST_F(SandboxExecutorTest, ResultsBeforeTimeoutAreKept) {
  AddTest("quick", "1 + 1 == 2");
  AddTest("slow", "while (true) {}");

  ExecutionResult result = Execute(absl::Milliseconds(500));
  EXPECT_EQ(result.termination_reason, proto::TerminationReason::TIMEOUT);
  ASSERT_EQ(result.outcomes.size(), 2u);
  EXPECT_TRUE(result.outcomes[0].passed());
  EXPECT_EQ(result.outcomes[1].message(), "timeout");
}

TEST_F(SandboxExecutorTest, ConsoleOrderIsPreserved) {
  submission_.set_script(
      "for (let i = 0; i < 50; i++) console.log('line', i)\n"
      "console.warn('done')\n");
  AddTest("ok", "true");

  ExecutionResult result = Execute();
  EXPECT_EQ(result.termination_reason, proto::TerminationReason::NORMAL);
  ASSERT_EQ(result.logs.size(), 51u);
  for (int i = 0; i < 50; i++) {
    EXPECT_EQ(result.logs[i].level(), "log");
    EXPECT_EQ(result.logs[i].text(), "line " + std::to_string(i));
  }
  EXPECT_EQ(result.logs[50].level(), "warn");
}

TEST_F(SandboxExecutorTest, EmptyBatteryFinalizesOnExit) {
  submission_.set_script("console.log('alone')");
  ExecutionResult result = Execute();
  EXPECT_EQ(result.termination_reason, proto::TerminationReason::NORMAL);
  EXPECT_TRUE(result.outcomes.empty());
  ASSERT_EQ(result.logs.size(), 1u);
}

TEST_F(SandboxExecutorTest, MemoryExhaustionIsNotAPass) {
  submission_.set_script("let s = 'x'\nwhile (true) s += s\n");
  AddTest("never", "true");

  ExecutionResult result = Execute();
  EXPECT_NE(result.termination_reason, proto::TerminationReason::NORMAL);
  ASSERT_EQ(result.outcomes.size(), 1u);
  EXPECT_FALSE(result.outcomes[0].passed());
}

TEST_F(SandboxExecutorTest, MissingRuntimeIsAnInfrastructureError) {
  SandboxExecutor broken("broken", "/nonexistent/gradebox_runtime", "/tmp",
                         TestLimits());
  EXPECT_THROW(broken.Execute(submission_, battery_, absl::Seconds(1)),
               executor::ExecutionError);
  SandboxExecutor unknown("unknown", "no-such-gradebox-runtime", "/tmp",
                          TestLimits());
  EXPECT_THROW(unknown.Execute(submission_, battery_, absl::Seconds(1)),
               executor::ExecutionError);
}

TEST_F(SandboxExecutorTest, ConcurrentExecutionsAreIndependent) {
  const int kThreads = 8;
  std::vector<ExecutionResult> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([this, i, &results]() {
      proto::Submission submission;
      submission.set_script("var mine = " + std::to_string(i) +
                            "\nconsole.log(mine)");
      proto::TestBattery battery;
      proto::TestCase* test = battery.add_tests();
      test->set_name("mine");
      test->set_assertion("mine === " + std::to_string(i));
      results[i] = executor_.Execute(submission, battery, absl::Seconds(10));
    });
  }
  for (std::thread& thread : threads) thread.join();
  for (int i = 0; i < kThreads; i++) {
    EXPECT_EQ(results[i].termination_reason,
              proto::TerminationReason::NORMAL);
    ASSERT_EQ(results[i].outcomes.size(), 1u);
    EXPECT_TRUE(results[i].outcomes[0].passed()) << i;
    ASSERT_EQ(results[i].logs.size(), 1u);
    EXPECT_EQ(results[i].logs[0].text(), std::to_string(i));
  }
}

}  // namespace
