#include "runner/executor.hpp"

#include <kj/debug.h>

#include "util/flags.hpp"

namespace runner {

ExecutorSettings ExecutorSettings::FromFlags() {
  ExecutorSettings settings;
  settings.image = Flags::image;
  settings.interpreter = Flags::interpreter;
  settings.mount_point = Flags::mount_point;
  settings.name_prefix = Flags::name_prefix;
  settings.memory_mb = Flags::memory_mb;
  settings.max_procs = Flags::max_procs;
  settings.cpus = Flags::cpus;
  settings.max_output_bytes = static_cast<size_t>(Flags::max_output_kb) * 1024;
  settings.timeout = Flags::timeout_millis * kj::MILLISECONDS;
  return settings;
}

Executor::Executor(sandbox::Sandbox* sandbox, kj::Timer* timer,
                   ExecutorSettings settings)
    : sandbox_(sandbox),
      timer_(timer),
      settings_(std::move(settings)),
      removals_(*this) {}

kj::Promise<ExecutionResult> Executor::Execute(
    const staging::Artifact& artifact, const std::string& staging_root) {
  sandbox::ExecutionOptions options;
  options.name = SandboxName(artifact.id);
  options.image = settings_.image;
  options.interpreter = settings_.interpreter;
  options.script = artifact.file_name;
  options.mount_source = staging_root;
  options.mount_target = settings_.mount_point;
  options.memory_limit_mb = settings_.memory_mb;
  options.max_procs = settings_.max_procs;
  options.cpus = settings_.cpus;
  options.max_output_bytes = settings_.max_output_bytes;

  std::string name = options.name;
  kj::Duration timeout = settings_.timeout;
  auto completed = sandbox_->Execute(options).then(
      [name](sandbox::ExecutionInfo info) {
        if (info.stdout_truncated || info.stderr_truncated) {
          KJ_LOG(WARNING, "Output truncated", name, info.stdout_truncated,
                 info.stderr_truncated);
        }
        // A client killed by a signal reports it like a shell would.
        int32_t exit_code =
            info.signal != 0 ? 128 + info.signal : info.status_code;
        ExecutionResult result = ExecutionResult::Completed(
            exit_code, info.stdout_data, info.stderr_data);
        KJ_LOG(INFO, "Sandbox completed", name, exit_code,
               ClassificationName(result.GetClassification()));
        return result;
      });
  auto expired = timer_->afterDelay(timeout).then([this, name, timeout]() {
    KJ_LOG(WARNING, "Sandbox timed out, removing it", name);
    removals_.add(kj::evalNow([this, &name]() {
      return sandbox_->Remove(name);
    }));
    return ExecutionResult::TimedOut(timeout);
  });
  return completed.exclusiveJoin(kj::mv(expired));
}

void Executor::taskFailed(kj::Exception&& exception) {
  KJ_LOG(WARNING, "Forced removal failed", exception);
}

}  // namespace runner
