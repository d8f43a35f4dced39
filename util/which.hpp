#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns an empty string if the
// command cannot be found and throws if PATH is not set. Found commands are
// cached, unless caching is explicitly disabled; the cache is never
// invalidated.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
