#include "runner/result.hpp"

#include "util/misc.hpp"

namespace runner {

ExecutionResult ExecutionResult::Completed(int32_t exit_code,
                                           const std::string& stdout_data,
                                           const std::string& stderr_data) {
  std::string output = util::rtrimNewlines(stdout_data);
  switch (Classify(exit_code, stderr_data)) {
    case SUCCESS:
      return ExecutionResult(SUCCESS, std::move(output), "", nullptr);
    case MEMORY_LIMIT_EXCEEDED:
      return ExecutionResult(MEMORY_LIMIT_EXCEEDED, std::move(output),
                             kMemoryLimitMessage, nullptr);
    default:
      return ExecutionResult(RUNTIME_ERROR, std::move(output),
                             util::trim(stderr_data), exit_code);
  }
}

namespace {

// Seconds with at most three decimals and no trailing zeros: 10, 2.5, 0.1.
std::string FormatSeconds(kj::Duration duration) {
  int64_t millis = duration / kj::MILLISECONDS;
  std::string seconds = std::to_string(millis / 1000);
  int64_t fraction = millis % 1000;
  if (fraction == 0) return seconds;
  std::string decimals = std::to_string(1000 + fraction).substr(1);
  while (decimals.back() == '0') decimals.pop_back();
  return seconds + "." + decimals;
}

}  // namespace

ExecutionResult ExecutionResult::TimedOut(kj::Duration deadline) {
  return ExecutionResult(
      TIMEOUT, "",
      "Execution timed out after " + FormatSeconds(deadline) + " seconds",
      nullptr);
}

void ExecutionResult::ToCapnp(capnproto::RunResult::Builder builder) const {
  builder.setOutput(capnp::Text::Reader(output_.data(), output_.size()));
  builder.setError(capnp::Text::Reader(error_.data(), error_.size()));
  switch (classification_) {
    case SUCCESS:
      builder.setClassification(capnproto::Classification::SUCCESS);
      break;
    case TIMEOUT:
      builder.setClassification(capnproto::Classification::TIMEOUT);
      break;
    case MEMORY_LIMIT_EXCEEDED:
      builder.setClassification(
          capnproto::Classification::MEMORY_LIMIT_EXCEEDED);
      break;
    case RUNTIME_ERROR:
      builder.setClassification(capnproto::Classification::RUNTIME_ERROR);
      break;
  }
  KJ_IF_MAYBE(code, exit_code_) { builder.getExitCode().setCode(*code); }
  else {
    builder.getExitCode().setNone();
  }
}

}  // namespace runner
