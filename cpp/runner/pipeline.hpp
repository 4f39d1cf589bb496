#ifndef RUNNER_PIPELINE_HPP
#define RUNNER_PIPELINE_HPP

#include <memory>

#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/timer.h>

#include "runner/admission.hpp"
#include "runner/executor.hpp"
#include "runner/runner.hpp"
#include "sandbox/sandbox.hpp"
#include "staging/stager.hpp"

namespace runner {

// Registers the options that configure a Pipeline.
void AddPipelineOptions(kj::MainBuilder* builder);

// Maximum number of running sandboxes for Flags::max_running.
size_t MaxRunning();

// A Runner and everything it works with, configured from Flags.
class Pipeline {
 public:
  // Throws if the staging root cannot be created or no container runtime can
  // be used.
  Pipeline(kj::LowLevelAsyncIoProvider* io, kj::Timer* timer);
  KJ_DISALLOW_COPY(Pipeline);

  Runner& GetRunner() { return *runner_; }
  staging::Stager& GetStager() { return stager_; }
  Executor& GetExecutor() { return *executor_; }

 private:
  staging::Stager stager_;
  std::unique_ptr<sandbox::Sandbox> sandbox_;
  Admission admission_;
  kj::Own<Executor> executor_;
  kj::Own<Runner> runner_;
};

}  // namespace runner

#endif
