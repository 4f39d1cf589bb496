#include "util/misc.hpp"

#include <cctype>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string rtrimNewlines(std::string s) {
  while (!s.empty() && s.back() == '\n') {
    s.pop_back();
    if (!s.empty() && s.back() == '\r') s.pop_back();
  }
  return s;
}

std::string trim(const std::string& s) {
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  size_t begin = 0;
  while (begin < s.size() && is_space(s[begin])) begin++;
  size_t end = s.size();
  while (end > begin && is_space(s[end - 1])) end--;
  return s.substr(begin, end - begin);
}

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string* var) {
  return [var](kj::StringPtr p) {
    *var = p;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int* var) {
  return [var](kj::StringPtr p) {
    *var = std::stoi(std::string(p));
    return true;
  };
};

}  // namespace util
