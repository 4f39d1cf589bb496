#ifndef RUNNER_CLASSIFICATION_HPP
#define RUNNER_CLASSIFICATION_HPP

#include <cstdint>
#include <string>

namespace runner {

enum Classification {
  SUCCESS,
  TIMEOUT,
  MEMORY_LIMIT_EXCEEDED,
  RUNTIME_ERROR
};

// Categorizes a program that ran to completion. The exit code decides first:
// 0 is a success and 137 (killed by SIGKILL) is a memory-limit kill. Otherwise
// stderr messages of the out-of-memory killer or of the interpreter also
// count as a memory-limit kill.
Classification Classify(int32_t exit_code, const std::string& stderr_data);

const char* ClassificationName(Classification classification);

}  // namespace runner

#endif
