#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <cstdint>

#include <kj/async.h>
#include <kj/timer.h>

#include "capnp/runner.capnp.h"
#include "runner/pipeline.hpp"
#include "runner/runner.hpp"
#include "staging/stager.hpp"

namespace server {

// Implementation of the Runner interface.
class Server : public capnproto::Runner::Server {
 public:
  // The runner can be provided later with SetRunner, but before the first
  // request.
  explicit Server(runner::Runner* runner = nullptr) : runner_(runner) {}

  void SetRunner(runner::Runner* runner) { runner_ = runner; }

  // Serves requests with the runner of pipeline, which is destroyed together
  // with this capability and so outlives the calls it is serving.
  void SetPipeline(kj::Own<runner::Pipeline> pipeline) {
    runner_ = &pipeline->GetRunner();
    pipeline_ = kj::mv(pipeline);
  }

  kj::Promise<void> run(RunContext context) override;

 private:
  runner::Runner* runner_;
  kj::Own<runner::Pipeline> pipeline_;
};

// Deletes artifacts older than ttl seconds now, and then every ttl/2 seconds
// (at least one). Never resolves.
kj::Promise<void> SweepPeriodically(const staging::Stager* stager,
                                    kj::Timer* timer, int64_t ttl);

}  // namespace server

#endif
