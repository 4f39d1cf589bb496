#include "runner/validation.hpp"

#include <kj/encoding.h>

namespace runner {

kj::Maybe<size_t> CountCodePoints(const std::string& text) {
  auto decoded =
      kj::encodeUtf32(kj::ArrayPtr<const char>(text.data(), text.size()));
  if (decoded.hadErrors) return nullptr;
  // Surrogates and values past U+10FFFF are not UTF-8 text.
  for (char32_t c : decoded) {
    if ((c >= 0xd800 && c <= 0xdfff) || c > 0x10ffff) return nullptr;
  }
  return decoded.size();
}

kj::Maybe<std::string> ValidateCode(const std::string& code,
                                    size_t max_code_points) {
  KJ_IF_MAYBE(count, CountCodePoints(code)) {
    if (*count > max_code_points) {
      return "Code too long (max " + std::to_string(max_code_points) +
             " chars)";
    }
    return nullptr;
  }
  return std::string("Code must be UTF-8 text");
}

}  // namespace runner
