// File: tests/status_test.cpp
#include <gtest/gtest.h>

#include "runbox/core/status.hpp"
#include "runbox/core/types.hpp"

namespace runbox {
namespace {

Status fail_if(bool fail) {
  if (fail) return Status::no_entrypoint("nothing to run");
  return Status::ok_status();
}

Status chained(bool fail) {
  RUNBOX_RETURN_IF_ERROR(fail_if(fail));
  return Status::internal("reached the end");
}

Result<int> chained_result(bool fail) {
  RUNBOX_RESULT_RETURN_IF_ERROR(int, fail_if(fail));
  return Result<int>::ok(7);
}

TEST(StatusTest, DefaultIsOk) {
  const Status s;
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(s.code(), Status::Code::kOk);
  EXPECT_TRUE(s.message().empty());
}

TEST(StatusTest, CodeNamesAreStable) {
  EXPECT_STREQ(code_name(Status::Code::kUnauthorized), "Unauthorized");
  EXPECT_STREQ(code_name(Status::Code::kNoEntrypoint), "NoEntrypoint");
  EXPECT_STREQ(code_name(Status::Code::kWorkspaceCollision), "WorkspaceCollision");
  EXPECT_STREQ(code_name(Status::Code::kDependencyInstallFailed), "DependencyInstallFailed");
  EXPECT_STREQ(code_name(Status::Code::kPublishFailed), "PublishFailed");
  EXPECT_STREQ(code_name(Status::Code::kInternal), "UnexpectedInternal");
}

TEST(StatusTest, ReturnIfErrorShortCircuits) {
  EXPECT_EQ(chained(true).code(), Status::Code::kNoEntrypoint);
  EXPECT_EQ(chained(false).code(), Status::Code::kInternal);
}

TEST(StatusTest, ResultCarriesValueOrStatus) {
  auto good = chained_result(false);
  ASSERT_TRUE(good.ok());
  EXPECT_EQ(*good, 7);
  ASSERT_NE(good.value_if_ok(), nullptr);

  auto bad = chained_result(true);
  EXPECT_FALSE(bad.ok());
  EXPECT_EQ(bad.status().code(), Status::Code::kNoEntrypoint);
  EXPECT_EQ(bad.value_if_ok(), nullptr);
}

TEST(OutcomeTest, FactoriesSetKindAndFields) {
  const auto s = ExecutionOutcome::success("hi\n");
  EXPECT_EQ(s.kind, ExecutionOutcome::Kind::kSuccess);
  EXPECT_EQ(s.stdout_text, "hi\n");

  const auto f = ExecutionOutcome::failure("o", "e", 3);
  EXPECT_EQ(f.kind, ExecutionOutcome::Kind::kFailure);
  EXPECT_EQ(f.exit_code, 3);

  const auto l = ExecutionOutcome::launch_error("no such file");
  EXPECT_EQ(l.kind, ExecutionOutcome::Kind::kLaunchError);
  EXPECT_EQ(l.cause, "no such file");

  EXPECT_STREQ(outcome_kind_name(ExecutionOutcome::Kind::kTimedOut), "TimedOut");
}

}  // namespace
}  // namespace runbox
