#include "server/server.hpp"

#include <algorithm>
#include <string>

#include <kj/debug.h>

namespace server {

kj::Promise<void> Server::run(RunContext context) {
  if (runner_ == nullptr) {
    context.getResults().initResponse().setInternalError(
        "The server is not ready");
    return kj::READY_NOW;
  }
  auto code = context.getParams().getCode();
  return runner_->Run(std::string(code.begin(), code.size()))
      .then([context](runner::Response response) mutable {
        response.ToCapnp(context.getResults().initResponse());
      });
}

kj::Promise<void> SweepPeriodically(const staging::Stager* stager,
                                    kj::Timer* timer, int64_t ttl) {
  KJ_IF_MAYBE(exception,
              kj::runCatchingExceptions([&]() { stager->Sweep(ttl); })) {
    KJ_LOG(WARNING, "Cannot sweep the staging directory", *exception);
  }
  int64_t period = std::max<int64_t>(1, ttl / 2);
  return timer->afterDelay(period * kj::SECONDS)
      .then([stager, timer, ttl]() {
        return SweepPeriodically(stager, timer, ttl);
      });
}

}  // namespace server
