#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <backward.hpp>
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>

namespace util {

// Formats kj log records and exceptions for the lifetime of the object.
// Records go to Flags::log_file when set, to stderr otherwise.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext* context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out_;
  bool colors_;
  backward::SignalHandling sh_;  // Override kj's signal handling.
};
}  // namespace util

#endif
