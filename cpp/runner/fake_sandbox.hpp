#ifndef RUNNER_FAKE_SANDBOX_HPP
#define RUNNER_FAKE_SANDBOX_HPP

#include <string>
#include <vector>

#include <kj/async.h>
#include <kj/debug.h>

#include "sandbox/sandbox.hpp"

namespace runner {
namespace testing {

// In-memory sandbox for tests. Executions complete with the configured info,
// or never if hang is set; runtime_down makes them fail as if the container
// runtime could not be reached. Removals fail if fail_removal is set.
class FakeSandbox : public sandbox::Sandbox {
 public:
  sandbox::ExecutionInfo info;
  bool hang = false;
  bool fail_launch = false;
  bool runtime_down = false;
  bool fail_removal = false;

  std::vector<sandbox::ExecutionOptions> launched;
  std::vector<std::string> removed;
  // Number of executions that are still pending.
  int running = 0;

  kj::Promise<void> Remove(const std::string& name) override {
    removed.push_back(name);
    if (fail_removal) {
      return KJ_EXCEPTION(FAILED, "No such container", name);
    }
    return kj::READY_NOW;
  }

 protected:
  kj::Promise<sandbox::ExecutionInfo> ExecuteInternal(
      const sandbox::ExecutionOptions& options) override {
    launched.push_back(options);
    KJ_REQUIRE(!fail_launch, "Cannot start the container runtime");
    if (runtime_down) {
      return KJ_EXCEPTION(DISCONNECTED, "Container runtime failed",
                          "docker: Cannot connect to the Docker daemon");
    }
    running++;
    auto done = kj::defer([this]() { running--; });
    if (hang) {
      return kj::Promise<sandbox::ExecutionInfo>(kj::NEVER_DONE)
          .attach(kj::mv(done));
    }
    return kj::Promise<sandbox::ExecutionInfo>(info).attach(kj::mv(done));
  }
};

}  // namespace testing
}  // namespace runner

#endif
