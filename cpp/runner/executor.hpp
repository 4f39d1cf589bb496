#ifndef RUNNER_EXECUTOR_HPP
#define RUNNER_EXECUTOR_HPP

#include <cstdint>
#include <string>

#include <kj/async.h>
#include <kj/timer.h>

#include "runner/result.hpp"
#include "sandbox/sandbox.hpp"
#include "staging/stager.hpp"

namespace runner {

// How sandbox instances are launched.
struct ExecutorSettings {
  std::string image;
  std::string interpreter;
  // Where the staging root is visible inside the sandbox.
  std::string mount_point;
  std::string name_prefix;
  int64_t memory_mb = 0;
  int32_t max_procs = 0;
  std::string cpus;
  size_t max_output_bytes = 0;
  // Host-side deadline for an execution.
  kj::Duration timeout = 0 * kj::SECONDS;

  static ExecutorSettings FromFlags();
};

// Runs artifacts in sandbox instances, and stops the instances that are
// still running when the deadline expires.
class Executor : public kj::TaskSet::ErrorHandler {
 public:
  Executor(sandbox::Sandbox* sandbox, kj::Timer* timer,
           ExecutorSettings settings);
  KJ_DISALLOW_COPY(Executor);

  // Runs artifact, stored in staging_root, in a new sandbox instance. The
  // promise is rejected only if the instance could not be launched.
  kj::Promise<ExecutionResult> Execute(const staging::Artifact& artifact,
                                       const std::string& staging_root);

  // Name of the instance that runs the artifact with the given id.
  std::string SandboxName(const std::string& id) const {
    return settings_.name_prefix + id;
  }

  // Resolves when no forced removal is pending.
  kj::Promise<void> OnRemovalsDone() { return removals_.onEmpty(); }

  void taskFailed(kj::Exception&& exception) override;

 private:
  sandbox::Sandbox* sandbox_;
  kj::Timer* timer_;
  ExecutorSettings settings_;
  kj::TaskSet removals_;
};

}  // namespace runner

#endif
