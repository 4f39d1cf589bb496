#include "runner/classification.hpp"

#include "gtest/gtest.h"

namespace {

using runner::Classification;
using runner::Classify;

// NOLINTNEXTLINE
TEST(ClassificationTest, ZeroIsSuccess) {
  EXPECT_EQ(Classify(0, ""), Classification::SUCCESS);
  EXPECT_EQ(Classify(0, "DeprecationWarning: something\n"),
            Classification::SUCCESS);
}

// NOLINTNEXTLINE
TEST(ClassificationTest, KilledExitCode) {
  EXPECT_EQ(Classify(137, ""), Classification::MEMORY_LIMIT_EXCEEDED);
  EXPECT_EQ(Classify(137, "Traceback ...\nValueError\n"),
            Classification::MEMORY_LIMIT_EXCEEDED);
}

// NOLINTNEXTLINE
TEST(ClassificationTest, StderrMarkers) {
  EXPECT_EQ(Classify(1, "Traceback (most recent call last):\nMemoryError\n"),
            Classification::MEMORY_LIMIT_EXCEEDED);
  EXPECT_EQ(Classify(1, "Out of memory\n"),
            Classification::MEMORY_LIMIT_EXCEEDED);
  EXPECT_EQ(Classify(2, "sh: line 1: 7 Killed python x.py\n"),
            Classification::MEMORY_LIMIT_EXCEEDED);
}

// NOLINTNEXTLINE
TEST(ClassificationTest, MarkersAreCaseSensitive) {
  EXPECT_EQ(Classify(1, "killed\n"), Classification::RUNTIME_ERROR);
  EXPECT_EQ(Classify(1, "memoryerror"), Classification::RUNTIME_ERROR);
}

// NOLINTNEXTLINE
TEST(ClassificationTest, RuntimeError) {
  EXPECT_EQ(Classify(1, "Traceback (most recent call last):\nValueError\n"),
            Classification::RUNTIME_ERROR);
  EXPECT_EQ(Classify(125, "docker: Error response from daemon\n"),
            Classification::RUNTIME_ERROR);
  EXPECT_EQ(Classify(136, ""), Classification::RUNTIME_ERROR);
  EXPECT_EQ(Classify(-1, ""), Classification::RUNTIME_ERROR);
}

}  // namespace
