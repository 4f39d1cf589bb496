#include "server/server.hpp"

#include <utime.h>
#include <ctime>
#include <string>

#include <kj/async-io.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runner/fake_sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

const char* test_tmpdir = "/tmp/runbox_testdir";

using runner::testing::FakeSandbox;

class RegisteredFake : public FakeSandbox {
 public:
  static const constexpr char* kName = "server-test";
  static sandbox::Sandbox* Create(kj::LowLevelAsyncIoProvider* /*io*/,
                                  kj::Timer* /*timer*/) {
    return new RegisteredFake();
  }
  static int Score() { return 1; }
};

sandbox::Sandbox::Register<RegisteredFake> r_fake;  // NOLINT

runner::ExecutorSettings TestSettings() {
  runner::ExecutorSettings settings;
  settings.image = "python:3.11-slim";
  settings.interpreter = "python";
  settings.mount_point = "/scripts";
  settings.name_prefix = "runbox-";
  settings.memory_mb = 128;
  settings.max_procs = 64;
  settings.cpus = "1";
  settings.timeout = 100 * kj::MILLISECONDS;
  return settings;
}

runner::RunnerSettings TestRunnerSettings() {
  runner::RunnerSettings settings;
  settings.max_code_length = 10;
  return settings;
}

class ServerTest : public ::testing::Test {
 protected:
  capnp::Response<capnproto::Runner::RunResults> Call(
      capnproto::Runner::Client client, const std::string& code) {
    auto request = client.runRequest();
    request.setCode(code.c_str());
    return request.send().wait(io_.waitScope);
  }

  util::TempDir tmp_{test_tmpdir};
  staging::Stager stager_{tmp_.Path(), ".py"};
  kj::AsyncIoContext io_ = kj::setupAsyncIo();
  FakeSandbox sandbox_;
  runner::Admission admission_{1, 1};
  runner::Executor executor_{&sandbox_, &io_.provider->getTimer(),
                             TestSettings()};
  runner::Runner runner_{&stager_, &admission_, &executor_,
                         TestRunnerSettings()};
};

// NOLINTNEXTLINE
TEST_F(ServerTest, Result) {
  sandbox_.info.stdout_data = "hello\n";
  capnproto::Runner::Client client = kj::heap<server::Server>(&runner_);
  auto call = Call(client, "print(1)");
  auto response = call.getResponse();
  ASSERT_TRUE(response.isResult());
  EXPECT_EQ(std::string(response.getResult().getOutput().cStr()), "hello");
  EXPECT_EQ(response.getResult().getClassification(),
            capnproto::Classification::SUCCESS);
  EXPECT_TRUE(response.getResult().getExitCode().isNone());
}

// NOLINTNEXTLINE
TEST_F(ServerTest, InvalidRequest) {
  capnproto::Runner::Client client = kj::heap<server::Server>(&runner_);
  auto call = Call(client, "print(12345)");
  auto response = call.getResponse();
  ASSERT_TRUE(response.isInvalidRequest());
  EXPECT_EQ(std::string(response.getInvalidRequest().cStr()),
            "Code too long (max 10 chars)");
  EXPECT_TRUE(sandbox_.launched.empty());
}

// NOLINTNEXTLINE
TEST_F(ServerTest, InternalError) {
  sandbox_.fail_launch = true;
  capnproto::Runner::Client client = kj::heap<server::Server>(&runner_);
  auto call = Call(client, "print(1)");
  auto response = call.getResponse();
  ASSERT_TRUE(response.isInternalError());
}

// NOLINTNEXTLINE
TEST_F(ServerTest, NotReady) {
  capnproto::Runner::Client client = kj::heap<server::Server>();
  auto call = Call(client, "print(1)");
  auto response = call.getResponse();
  ASSERT_TRUE(response.isInternalError());
}

// NOLINTNEXTLINE
TEST_F(ServerTest, SweepsAtStartup) {
  staging::Artifact old = stager_.Stage("old");
  staging::Artifact fresh = stager_.Stage("fresh");
  struct utimbuf times {};
  times.actime = time(nullptr) - 100;
  times.modtime = times.actime;
  ASSERT_EQ(utime(old.path.c_str(), &times), 0);
  {
    auto sweeping =
        server::SweepPeriodically(&stager_, &io_.provider->getTimer(), 50);
    EXPECT_FALSE(util::File::Exists(old.path));
    EXPECT_TRUE(util::File::Exists(fresh.path));
  }
}

// NOLINTNEXTLINE
TEST_F(ServerTest, SweepFailureKeepsSweeping) {
  std::string parent = util::File::JoinPath(tmp_.Path(), "parent");
  staging::Stager stager(util::File::JoinPath(parent, "staging"), ".py");
  util::File::RemoveTree(parent);
  util::File::WriteContents(parent, "not a directory");
  kj::Promise<void> sweeping = nullptr;
  EXPECT_NO_THROW(sweeping = server::SweepPeriodically(
                      &stager, &io_.provider->getTimer(), 1));
  // The next sweep fails the same way and is only logged.
  EXPECT_NO_THROW(sweeping.exclusiveJoin(
                              io_.provider->getTimer().afterDelay(
                                  1500 * kj::MILLISECONDS))
                      .wait(io_.waitScope));
}

// NOLINTNEXTLINE
TEST_F(ServerTest, OwnsPipeline) {
  Flags::staging_directory = util::File::JoinPath(tmp_.Path(), "owned");
  Flags::runtime = RegisteredFake::kName;
  auto impl = kj::heap<server::Server>();
  impl->SetPipeline(kj::heap<runner::Pipeline>(io_.lowLevelProvider.get(),
                                               &io_.provider->getTimer()));
  Flags::staging_directory = "staging";
  Flags::runtime = "";
  capnproto::Runner::Client client = kj::mv(impl);
  auto call = Call(client, "print(1)");
  auto response = call.getResponse();
  ASSERT_TRUE(response.isResult());
  EXPECT_EQ(response.getResult().getClassification(),
            capnproto::Classification::SUCCESS);
}

}  // namespace
