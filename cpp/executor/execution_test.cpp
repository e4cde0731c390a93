#include "executor/execution.hpp"
#include "gtest/gtest.h"

namespace {

using executor::ExecutionResult;

// NOLINTNEXTLINE
TEST(Execution, RequestDefaults) {
  executor::ExecutionRequest request(executor::Language::PYTHON, "print(1)");
  EXPECT_EQ(request.timeout.count(), 0);
  EXPECT_TRUE(request.working_dir == nullptr);
  EXPECT_TRUE(request.stdin_data == nullptr);
  EXPECT_TRUE(request.env.empty());
  EXPECT_TRUE(request.args.empty());
}

// NOLINTNEXTLINE
TEST(Execution, CombinedOutput) {
  ExecutionResult result;
  EXPECT_EQ(result.CombinedOutput(), "");
  result.stdout_text = "out";
  EXPECT_EQ(result.CombinedOutput(), "out");
  result.stderr_text = "err";
  EXPECT_EQ(result.CombinedOutput(), "out\nerr");
  result.stdout_text = "";
  EXPECT_EQ(result.CombinedOutput(), "err");
}

// NOLINTNEXTLINE
TEST(Execution, Completed) {
  auto ok = ExecutionResult::Completed(0, "a", "", std::chrono::milliseconds(5));
  EXPECT_TRUE(ok.success);
  EXPECT_EQ(ok.exit_code.orDefault(-1), 0);
  EXPECT_FALSE(ok.timed_out);
  EXPECT_EQ(ok.duration.count(), 5);

  auto failed = ExecutionResult::Completed(3, "", "boom", {});
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.exit_code.orDefault(-1), 3);
}

// NOLINTNEXTLINE
TEST(Execution, TimedOut) {
  auto result =
      ExecutionResult::TimedOut("partial", "", std::chrono::milliseconds(100));
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.timed_out);
  EXPECT_TRUE(result.exit_code == nullptr);
  EXPECT_EQ(result.stdout_text, "partial");
}

}  // namespace
