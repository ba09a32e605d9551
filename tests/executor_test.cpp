// File: tests/executor_test.cpp
#include <gtest/gtest.h>

#include "runbox/core/exec/executor.hpp"
#include "test_util.hpp"

namespace runbox {
namespace {

using test::FakeProcessRunner;

class ExecutorTest : public ::testing::Test {
 protected:
  ExecutionOutcome run_once() {
    const Executor exec(limits_, runner_);
    return exec.run("python3", "/work/run1/main.py", "/work/run1", &warnings_);
  }

  LimitsConfig limits_;
  FakeProcessRunner runner_;
  std::vector<std::string> warnings_;
};

TEST_F(ExecutorTest, BuildsTheChildRequestFromLimits) {
  limits_.max_run_seconds = 9;
  limits_.cpu_grace_seconds = 3;
  limits_.max_output_bytes = 1234;
  (void)run_once();

  ASSERT_EQ(runner_.requests.size(), 1u);
  const SpawnRequest& req = runner_.requests.front();
  EXPECT_EQ(req.executable, "python3");
  ASSERT_EQ(req.args.size(), 1u);
  EXPECT_EQ(req.args.front(), "./main.py");
  EXPECT_EQ(req.working_dir, std::filesystem::path("/work/run1"));
  EXPECT_EQ(req.timeout, std::chrono::seconds(9));
  EXPECT_EQ(req.limits.cpu_seconds, 9);
  EXPECT_EQ(req.limits.cpu_grace_seconds, 3);
  EXPECT_EQ(req.limits.memory_bytes, kMemoryCeilingBytes);
  EXPECT_EQ(req.max_capture_bytes, 1234u);
}

TEST_F(ExecutorTest, ZeroExitIsSuccessWithStdoutOnly) {
  runner_.scripted.push_back(FakeProcessRunner::exited(0, "hello\n", "noise"));
  const auto o = run_once();
  EXPECT_EQ(o.kind, ExecutionOutcome::Kind::kSuccess);
  EXPECT_EQ(o.stdout_text, "hello\n");
  EXPECT_TRUE(o.stderr_text.empty());
}

TEST_F(ExecutorTest, NonZeroExitIsFailure) {
  runner_.scripted.push_back(FakeProcessRunner::exited(2, "o", "Traceback"));
  const auto o = run_once();
  EXPECT_EQ(o.kind, ExecutionOutcome::Kind::kFailure);
  EXPECT_EQ(o.exit_code, 2);
  EXPECT_EQ(o.stderr_text, "Traceback");
  EXPECT_EQ(runner_.requests.size(), 1u);  // never retried
}

TEST_F(ExecutorTest, TimeoutKeepsPartialOutput) {
  runner_.scripted.push_back(FakeProcessRunner::timed_out("part", "ial"));
  const auto o = run_once();
  EXPECT_EQ(o.kind, ExecutionOutcome::Kind::kTimedOut);
  EXPECT_EQ(o.stdout_text, "part");
  EXPECT_EQ(o.stderr_text, "ial");
}

TEST_F(ExecutorTest, LaunchErrorCarriesCause) {
  runner_.scripted.push_back(FakeProcessRunner::launch_error("exec: No such file or directory"));
  const auto o = run_once();
  EXPECT_EQ(o.kind, ExecutionOutcome::Kind::kLaunchError);
  EXPECT_EQ(o.cause, "exec: No such file or directory");
}

TEST_F(ExecutorTest, LimitWarningsAreForwarded) {
  SpawnResult r = FakeProcessRunner::exited(0);
  r.warnings.push_back("failed to apply RLIMIT_AS: Operation not permitted");
  runner_.scripted.push_back(r);
  (void)run_once();
  ASSERT_EQ(warnings_.size(), 1u);
  EXPECT_NE(warnings_.front().find("RLIMIT_AS"), std::string::npos);
}

}  // namespace
}  // namespace runbox
