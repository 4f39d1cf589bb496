#ifndef RUNNER_RESULT_HPP
#define RUNNER_RESULT_HPP

#include <cstdint>
#include <string>

#include <kj/common.h>
#include <kj/time.h>

#include "capnp/runner.capnp.h"
#include "runner/classification.hpp"

namespace runner {

// What a client gets back for a submission that was executed.
class ExecutionResult {
 public:
  static const constexpr char* kMemoryLimitMessage =
      "Memory limit exceeded (container killed)";

  // Result of a program that ran to completion.
  static ExecutionResult Completed(int32_t exit_code,
                                   const std::string& stdout_data,
                                   const std::string& stderr_data);

  // Result of a program that was stopped after deadline.
  static ExecutionResult TimedOut(kj::Duration deadline);

  const std::string& Output() const { return output_; }
  const std::string& Error() const { return error_; }
  // Only set for runtime errors.
  kj::Maybe<int32_t> ExitCode() const { return exit_code_; }
  Classification GetClassification() const { return classification_; }

  void ToCapnp(capnproto::RunResult::Builder builder) const;

 private:
  ExecutionResult(Classification classification, std::string output,
                  std::string error, kj::Maybe<int32_t> exit_code)
      : classification_(classification),
        output_(std::move(output)),
        error_(std::move(error)),
        exit_code_(exit_code) {}

  Classification classification_;
  std::string output_;
  std::string error_;
  kj::Maybe<int32_t> exit_code_;
};

}  // namespace runner

#endif
