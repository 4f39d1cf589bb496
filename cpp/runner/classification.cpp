#include "runner/classification.hpp"

namespace runner {
namespace {

const constexpr int32_t kKilledExitCode = 137;
const constexpr char* kMemoryMarkers[] = {"Killed", "Out of memory",
                                          "MemoryError"};

}  // namespace

Classification Classify(int32_t exit_code, const std::string& stderr_data) {
  if (exit_code == 0) return Classification::SUCCESS;
  if (exit_code == kKilledExitCode) {
    return Classification::MEMORY_LIMIT_EXCEEDED;
  }
  for (const char* marker : kMemoryMarkers) {
    if (stderr_data.find(marker) != std::string::npos) {
      return Classification::MEMORY_LIMIT_EXCEEDED;
    }
  }
  return Classification::RUNTIME_ERROR;
}

const char* ClassificationName(Classification classification) {
  switch (classification) {
    case Classification::SUCCESS:
      return "success";
    case Classification::TIMEOUT:
      return "timeout";
    case Classification::MEMORY_LIMIT_EXCEEDED:
      return "memory limit exceeded";
    case Classification::RUNTIME_ERROR:
      return "runtime error";
  }
  return "unknown";
}

}  // namespace runner
