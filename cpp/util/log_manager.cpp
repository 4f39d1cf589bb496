#include "util/log_manager.hpp"
#include <unistd.h>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {
std::ostream& ChooseOut() {
  if (!Flags::log_file.empty()) {
    static std::ofstream of(Flags::log_file, std::ios::app);
    return of;
  }
  return std::cerr;
}

static const constexpr char* log_msg[] = {"INFO", "WARNING", "ERROR", "FATAL",
                                          "DBG"};
static const constexpr char* colors[] = {"\e[0;32m", "\e[0;33m", "\e[0;31m",
                                         "\e[7;31m", "\e[0;35m"};
const constexpr char* reset_color = "\e[m";
const constexpr char* file_color = "\e[0;34m";
const constexpr char* date_color = "\e[0;36m";

constexpr bool strings_equal(char const* a, char const* b) {
  return *a == *b && (*a == '\0' || strings_equal(a + 1, b + 1));
}

#define CHECK_MSG(lvl)                                                   \
  static_assert(strings_equal(#lvl, log_msg[(int)kj::LogSeverity::lvl]), \
                #lvl " has a wrong log message!");

CHECK_MSG(INFO);
CHECK_MSG(WARNING);
CHECK_MSG(ERROR);
CHECK_MSG(FATAL);
CHECK_MSG(DBG);

}  // namespace

void LogManager::PrintStackTrace() {
  if (!::kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode =
      colors_ ? backward::ColorMode::always : backward::ColorMode::never;
  p.print(s, out_);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

LogManager::LogManager(kj::ProcessContext* context)
    : out_(ChooseOut()),
      colors_(Flags::log_file.empty() && isatty(STDERR_FILENO)) {
  if (!out_) {
    context->exitError("Invalid log file provided!");
  }
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int /*contextDepth*/,
                            kj::String&& text) {
  auto color = [this](const char* c) { return colors_ ? c : ""; };
  auto t = std::time(nullptr);
  auto tm = *std::localtime(&t);
  out_ << color(date_color) << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << color(reset_color) << " ";
  out_ << color(colors[(int)severity]) << log_msg[(int)severity][0]
       << color(reset_color) << " ";
  out_ << std::left << std::setw(colors_ ? 35 : 25)
       << std::string(color(file_color)) + util::File::BaseName(file) + ":" +
              std::to_string(line) + color(reset_color);
  out_ << text.cStr() << std::endl;
}
}  // namespace util
