#include "runner/pipeline.hpp"

#include <thread>

#include <kj/debug.h>

#include "util/flags.hpp"
#include "util/misc.hpp"

namespace runner {
namespace {

size_t NonNegative(int32_t value, const char* option) {
  KJ_REQUIRE(value >= 0, "Option must not be negative", option, value);
  return value;
}

}  // namespace

void AddPipelineOptions(kj::MainBuilder* builder) {
  builder
      ->addOptionWithArg({'S', "staging-dir"},
                         util::setString(&Flags::staging_directory), "<DIR>",
                         "Directory where submissions are staged")
      .addOption({'k', "keep-artifacts"},
                 util::setBool(&Flags::keep_artifacts),
                 "Do not delete staged submissions after running them")
      .addOptionWithArg({"max-code-length"},
                        util::setInt(&Flags::max_code_length), "<N>",
                        "Maximum length of a submission, in characters")
      .addOptionWithArg({'j', "max-running"},
                        util::setInt(&Flags::max_running), "<N>",
                        "Maximum number of running sandboxes. 0 means "
                        "unlimited, the default is the number of cores")
      .addOptionWithArg({"max-waiting"}, util::setInt(&Flags::max_waiting),
                        "<N>",
                        "Maximum number of submissions waiting to run. 0 "
                        "means unlimited")
      .addOptionWithArg({"runtime"}, util::setString(&Flags::runtime),
                        "<NAME>", "Container runtime: docker or podman")
      .addOptionWithArg({"image"}, util::setString(&Flags::image), "<IMAGE>",
                        "Image the sandboxes are created from")
      .addOptionWithArg({"interpreter"}, util::setString(&Flags::interpreter),
                        "<CMD>", "Command that runs a submission")
      .addOptionWithArg({"extension"}, util::setString(&Flags::extension),
                        "<EXT>", "Extension of the staged submissions")
      .addOptionWithArg({"mount-point"}, util::setString(&Flags::mount_point),
                        "<DIR>", "Where the staging directory is mounted")
      .addOptionWithArg({"name-prefix"}, util::setString(&Flags::name_prefix),
                        "<PREFIX>", "Prefix of the sandbox names")
      .addOptionWithArg({'m', "memory"}, util::setInt(&Flags::memory_mb),
                        "<MB>", "Memory limit of a sandbox, in MiB")
      .addOptionWithArg({"pids"}, util::setInt(&Flags::max_procs), "<N>",
                        "Maximum number of processes in a sandbox")
      .addOptionWithArg({"cpus"}, util::setString(&Flags::cpus), "<CPUS>",
                        "Number of CPUs a sandbox can use")
      .addOptionWithArg({'t', "timeout"}, util::setInt(&Flags::timeout_millis),
                        "<MS>", "Wall-clock limit of an execution, in ms")
      .addOptionWithArg({"remove-timeout"},
                        util::setInt(&Flags::remove_timeout_millis), "<MS>",
                        "Time limit for removing a sandbox, in ms")
      .addOptionWithArg({"max-output"}, util::setInt(&Flags::max_output_kb),
                        "<KB>", "Captured output per stream, in KiB");
}

size_t MaxRunning() {
  if (Flags::max_running >= 0) return Flags::max_running;
  unsigned cores = std::thread::hardware_concurrency();
  return cores == 0 ? 1 : cores;
}

Pipeline::Pipeline(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer)
    : stager_(Flags::staging_directory, Flags::extension),
      sandbox_(sandbox::Sandbox::Create(io, timer, Flags::runtime)),
      admission_(MaxRunning(),
                 NonNegative(Flags::max_waiting, "max-waiting")) {
  NonNegative(Flags::max_code_length, "max-code-length");
  NonNegative(Flags::max_output_kb, "max-output");
  KJ_REQUIRE(Flags::timeout_millis > 0, "The timeout must be positive");
  KJ_REQUIRE(sandbox_ != nullptr, "No container runtime available",
             Flags::runtime);
  executor_ =
      kj::heap<Executor>(sandbox_.get(), timer, ExecutorSettings::FromFlags());
  runner_ = kj::heap<Runner>(&stager_, &admission_, executor_.get(),
                             RunnerSettings::FromFlags());
  KJ_LOG(INFO, "Staging submissions in", stager_.Root());
}

}  // namespace runner
