#ifndef SANDBOX_SUBPROCESS_HPP
#define SANDBOX_SUBPROCESS_HPP

#include <string>
#include <vector>

#include <kj/async-io.h>
#include <kj/timer.h>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs args[0] (an absolute path) with the given arguments in a new process
// group. Stdin is /dev/null, stdout and stderr are captured separately, each up
// to max_output_bytes (0 means unlimited); the excess is read and discarded.
// The promise resolves once both streams are closed and the process is reaped.
// Dropping the promise kills the whole process group and reaps the process.
kj::Promise<ExecutionInfo> RunProcess(const std::vector<std::string>& args,
                                      kj::LowLevelAsyncIoProvider* io,
                                      kj::Timer* timer,
                                      size_t max_output_bytes = 0)
    KJ_WARN_UNUSED_RESULT;

}  // namespace sandbox

#endif
