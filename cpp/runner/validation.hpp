#ifndef RUNNER_VALIDATION_HPP
#define RUNNER_VALIDATION_HPP

#include <cstddef>
#include <string>

#include <kj/common.h>

namespace runner {

// Number of code points in text, or nullptr if text is not well-formed UTF-8
// (overlong forms, surrogates and values past U+10FFFF are rejected).
kj::Maybe<size_t> CountCodePoints(const std::string& text);

// Checks a submission before anything is done with it. Returns a message for
// the client if the code is rejected.
kj::Maybe<std::string> ValidateCode(const std::string& code,
                                    size_t max_code_points);

}  // namespace runner

#endif
