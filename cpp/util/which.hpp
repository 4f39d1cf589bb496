#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled.
// The cache behavior is very basic: if the file is found it's put in the
// cache, and any other request for that command will come from the cache even
// if the file is no longer there. Commands that are not found are not cached.
// Throws if PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
