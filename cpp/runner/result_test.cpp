#include "runner/result.hpp"

#include <capnp/message.h>

#include "gtest/gtest.h"

namespace {

using runner::ExecutionResult;

// NOLINTNEXTLINE
TEST(ResultTest, Success) {
  auto result = ExecutionResult::Completed(0, "hello\n\n", "warning\n");
  EXPECT_EQ(result.GetClassification(), runner::SUCCESS);
  EXPECT_EQ(result.Output(), "hello");
  EXPECT_EQ(result.Error(), "");
  EXPECT_TRUE(result.ExitCode() == nullptr);
}

// NOLINTNEXTLINE
TEST(ResultTest, OutputKeepsLeadingWhitespace) {
  auto result = ExecutionResult::Completed(0, "  a\n b \n", "");
  EXPECT_EQ(result.Output(), "  a\n b ");
}

// NOLINTNEXTLINE
TEST(ResultTest, MemoryLimitExceeded) {
  auto result = ExecutionResult::Completed(137, "partial\n", "whatever\n");
  EXPECT_EQ(result.GetClassification(), runner::MEMORY_LIMIT_EXCEEDED);
  EXPECT_EQ(result.Output(), "partial");
  EXPECT_EQ(result.Error(), "Memory limit exceeded (container killed)");
  EXPECT_TRUE(result.ExitCode() == nullptr);

  auto by_marker = ExecutionResult::Completed(1, "", "Traceback\nMemoryError\n");
  EXPECT_EQ(by_marker.GetClassification(), runner::MEMORY_LIMIT_EXCEEDED);
  EXPECT_EQ(by_marker.Error(), "Memory limit exceeded (container killed)");
}

// NOLINTNEXTLINE
TEST(ResultTest, RuntimeError) {
  auto result = ExecutionResult::Completed(
      1, "before\n", "\nTraceback (most recent call last):\nValueError\n\n");
  EXPECT_EQ(result.GetClassification(), runner::RUNTIME_ERROR);
  EXPECT_EQ(result.Output(), "before");
  EXPECT_EQ(result.Error(), "Traceback (most recent call last):\nValueError");
  KJ_IF_MAYBE(code, result.ExitCode()) { EXPECT_EQ(*code, 1); }
  else {
    ADD_FAILURE() << "exit code missing";
  }
}

// NOLINTNEXTLINE
TEST(ResultTest, TimedOut) {
  auto result = ExecutionResult::TimedOut(10 * kj::SECONDS);
  EXPECT_EQ(result.GetClassification(), runner::TIMEOUT);
  EXPECT_EQ(result.Output(), "");
  EXPECT_EQ(result.Error(), "Execution timed out after 10 seconds");
  EXPECT_TRUE(result.ExitCode() == nullptr);

  EXPECT_EQ(ExecutionResult::TimedOut(2500 * kj::MILLISECONDS).Error(),
            "Execution timed out after 2.5 seconds");
  EXPECT_EQ(ExecutionResult::TimedOut(100 * kj::MILLISECONDS).Error(),
            "Execution timed out after 0.1 seconds");
  EXPECT_EQ(ExecutionResult::TimedOut(1250 * kj::MILLISECONDS).Error(),
            "Execution timed out after 1.25 seconds");
}

// NOLINTNEXTLINE
TEST(ResultTest, ToCapnp) {
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::RunResult>();
  ExecutionResult::Completed(3, "out\n", "err\n").ToCapnp(builder);
  auto reader = builder.asReader();
  EXPECT_EQ(std::string(reader.getOutput().cStr()), "out");
  EXPECT_EQ(std::string(reader.getError().cStr()), "err");
  EXPECT_EQ(reader.getClassification(),
            capnproto::Classification::RUNTIME_ERROR);
  ASSERT_TRUE(reader.getExitCode().isCode());
  EXPECT_EQ(reader.getExitCode().getCode(), 3);

  ExecutionResult::TimedOut(kj::SECONDS).ToCapnp(builder);
  EXPECT_EQ(builder.asReader().getClassification(),
            capnproto::Classification::TIMEOUT);
  EXPECT_TRUE(builder.asReader().getExitCode().isNone());
}

}  // namespace
