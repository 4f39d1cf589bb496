#include "sandbox/docker.hpp"

#include <stdexcept>

#include <kj/debug.h>

#include "sandbox/subprocess.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace sandbox {
namespace {

// Removal output is only used for error messages.
const constexpr size_t kRemoveOutputLimit = 4096;
// Exit status of a run the client could not start.
const constexpr int kClientFailure = 125;

int ScoreClient(const std::string& client, int score) {
  try {
    return util::which(client).empty() ? -1 : score;
  } catch (const std::runtime_error& e) {
    KJ_LOG(WARNING, "Cannot look up the container runtime", client, e.what());
    return -1;
  }
}

std::string JoinArgs(const std::vector<std::string>& args) {
  std::string joined;
  for (const std::string& arg : args) {
    if (!joined.empty()) joined += ' ';
    joined += arg;
  }
  return joined;
}

}  // namespace

Sandbox* Docker::Create(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer) {
  return new Docker(io, timer, kName,
                    Flags::remove_timeout_millis * kj::MILLISECONDS);
}

int Docker::Score() { return ScoreClient(kName, 10); }

Sandbox* Podman::Create(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer) {
  return new Podman(io, timer, kName,
                    Flags::remove_timeout_millis * kj::MILLISECONDS);
}

int Podman::Score() { return ScoreClient(kName, 5); }

Docker::Docker(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer,
               std::string client, kj::Duration remove_timeout)
    : io_(io),
      timer_(timer),
      client_(std::move(client)),
      remove_timeout_(remove_timeout) {}

std::vector<std::string> Docker::RunArgs(const ExecutionOptions& options) {
  const std::string memory = std::to_string(options.memory_limit_mb) + "m";
  return {"run",
          "--rm",
          "--name",
          options.name,
          "--network",
          "none",
          "--memory=" + memory,
          "--memory-swap=" + memory,
          "--pids-limit=" + std::to_string(options.max_procs),
          "--cpus=" + options.cpus,
          "-v",
          options.mount_source + ":" + options.mount_target + ":ro",
          options.image,
          options.interpreter,
          util::File::JoinPath(options.mount_target, options.script)};
}

std::vector<std::string> Docker::RemoveArgs(const std::string& name) {
  return {"rm", "-f", name};
}

std::vector<std::string> Docker::Command(std::vector<std::string> args) {
  std::string path = client_;
  if (path[0] != '/') path = util::which(client_);
  KJ_REQUIRE(!path.empty(), "Container runtime not found", client_);
  args.insert(args.begin(), path);
  return args;
}

kj::Promise<ExecutionInfo> Docker::ExecuteInternal(
    const ExecutionOptions& options) {
  std::vector<std::string> command = Command(RunArgs(options));
  KJ_LOG(INFO, "Launching sandbox", options.name, JoinArgs(command));
  std::string prefix = ErrorPrefix();
  return RunProcess(command, io_, timer_, options.max_output_bytes)
      .then([prefix](ExecutionInfo info) -> ExecutionInfo {
        if (info.signal == 0 && info.status_code == kClientFailure &&
            info.stderr_data.compare(0, prefix.size(), prefix) == 0) {
          kj::throwFatalException(KJ_EXCEPTION(
              DISCONNECTED, "Container runtime failed",
              util::trim(info.stderr_data)));
        }
        return info;
      });
}

kj::Promise<void> Docker::Remove(const std::string& name) {
  return kj::evalNow([&]() {
    std::vector<std::string> command = Command(RemoveArgs(name));
    KJ_LOG(INFO, "Removing sandbox", name);
    return timer_
        ->timeoutAfter(remove_timeout_,
                       RunProcess(command, io_, timer_, kRemoveOutputLimit))
        .then([name](ExecutionInfo info) {
          KJ_REQUIRE(info.signal == 0 && info.status_code == 0,
                     "Could not remove sandbox", name, info.status_code,
                     info.signal, util::trim(info.stderr_data));
        });
  });
}

Sandbox::Register<Docker> r_docker;  // NOLINT
Sandbox::Register<Podman> r_podman;  // NOLINT

}  // namespace sandbox
