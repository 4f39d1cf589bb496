#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Removes every trailing '\n' (and the '\r' of a CRLF pair).
std::string rtrimNewlines(std::string s);

// Removes leading and trailing whitespace.
std::string trim(const std::string& s);

std::function<bool()> setBool(bool* var);
std::function<bool(kj::StringPtr)> setString(std::string* var);
std::function<bool(kj::StringPtr)> setInt(int* var);

}  // namespace util
#endif
