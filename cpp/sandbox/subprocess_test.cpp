#include "sandbox/subprocess.hpp"

#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <string>

#include <kj/async-io.h>
#include <kj/debug.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const char* test_tmpdir = "/tmp/runbox_testdir";

using namespace sandbox;  // NOLINT

ExecutionInfo RunShell(kj::AsyncIoContext* io, const std::string& script,
                       size_t limit = 0) {
  return RunProcess({"/bin/sh", "-c", script}, io->lowLevelProvider.get(),
                    &io->provider->getTimer(), limit)
      .wait(io->waitScope);
}

// NOLINTNEXTLINE
TEST(SubprocessTest, CapturesStreamsAndStatus) {
  auto io = kj::setupAsyncIo();
  ExecutionInfo info = RunShell(&io, "echo out; echo err >&2; exit 3");
  EXPECT_EQ(info.status_code, 3);
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.stdout_data, "out\n");
  EXPECT_EQ(info.stderr_data, "err\n");
  EXPECT_FALSE(info.stdout_truncated);
  EXPECT_FALSE(info.stderr_truncated);
}

// NOLINTNEXTLINE
TEST(SubprocessTest, StdinIsEmpty) {
  auto io = kj::setupAsyncIo();
  ExecutionInfo info = RunShell(&io, "cat; echo done");
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(info.stdout_data, "done\n");
}

// NOLINTNEXTLINE
TEST(SubprocessTest, ReportsSignal) {
  auto io = kj::setupAsyncIo();
  ExecutionInfo info = RunShell(&io, "kill -9 $$");
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_EQ(info.status_code, 0);
}

// NOLINTNEXTLINE
TEST(SubprocessTest, TruncatesOutput) {
  auto io = kj::setupAsyncIo();
  ExecutionInfo info = RunShell(&io, "printf 0123456789; printf ab >&2", 4);
  EXPECT_EQ(info.stdout_data, "0123");
  EXPECT_TRUE(info.stdout_truncated);
  EXPECT_EQ(info.stderr_data, "ab");
  EXPECT_FALSE(info.stderr_truncated);
}

// NOLINTNEXTLINE
TEST(SubprocessTest, DrainsLargeOutput) {
  auto io = kj::setupAsyncIo();
  ExecutionInfo info =
      RunShell(&io, "head -c 1000000 /dev/zero; echo finished >&2", 16);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(info.stdout_data.size(), 16u);
  EXPECT_TRUE(info.stdout_truncated);
  EXPECT_EQ(info.stderr_data, "finished\n");
}

// NOLINTNEXTLINE
TEST(SubprocessTest, RelativePathIsRejected) {
  auto io = kj::setupAsyncIo();
  auto promise = RunProcess({"sh", "-c", "true"}, io.lowLevelProvider.get(),
                            &io.provider->getTimer());
  EXPECT_ANY_THROW(promise.wait(io.waitScope));
}

// NOLINTNEXTLINE
TEST(SubprocessTest, MissingExecutable) {
  auto io = kj::setupAsyncIo();
  auto promise =
      RunProcess({"/this/does/not/exist"}, io.lowLevelProvider.get(),
                 &io.provider->getTimer());
  EXPECT_ANY_THROW(promise.wait(io.waitScope));
}

// NOLINTNEXTLINE
TEST(SubprocessTest, CancellationKillsTheProcess) {
  util::TempDir tmp(test_tmpdir);
  std::string pid_file = util::File::JoinPath(tmp.Path(), "pid");
  auto io = kj::setupAsyncIo();
  kj::Timer& timer = io.provider->getTimer();

  bool timed_out = false;
  {
    auto wait_for_pid = [&]() -> kj::Promise<void> {
      return timer.afterDelay(10 * kj::MILLISECONDS);
    };
    auto running = RunProcess(
        {"/bin/sh", "-c", "echo $$ > " + pid_file + "; exec sleep 30"},
        io.lowLevelProvider.get(), &timer);
    // Wait until the shell has written its pid, then drop the promise.
    while (util::File::Size(pid_file) <= 0) wait_for_pid().wait(io.waitScope);
    running
        .then([](ExecutionInfo) { return false; })
        .exclusiveJoin(
            timer.afterDelay(200 * kj::MILLISECONDS).then([]() {
              return true;
            }))
        .then([&](bool expired) { timed_out = expired; })
        .wait(io.waitScope);
  }
  EXPECT_TRUE(timed_out);
  pid_t pid = std::stoi(util::File::ReadContents(pid_file));
  EXPECT_EQ(kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

}  // namespace
