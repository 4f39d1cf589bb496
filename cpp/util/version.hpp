#ifndef UTIL_VERSION_HPP
#define UTIL_VERSION_HPP

#include <string>

namespace util {
static const std::string version = "v0.3.1";
// Shown by --version. kj::MainBuilder keeps a pointer to it.
static const std::string version_string = "runbox (" + version + ")";
}  // namespace util

#endif
