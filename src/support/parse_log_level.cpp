/***
 * Name: wrapcc::support::ParseLogLevel
 * Purpose: Parse a level name, ignoring ASCII case.
 * Inputs: name
 * Outputs: LogLevel; Warning for unknown names
 */
#include "wrapcc/support/logger.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace wrapcc::support {

static bool equals_ci(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const unsigned char lhsCh = static_cast<unsigned char>(lhs[i]);
    const unsigned char rhsCh = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhsCh) != std::tolower(rhsCh)) { return false; }
  }
  return true;
}

LogLevel ParseLogLevel(std::string_view name) {
  using enum LogLevel;
  if (equals_ci(name, "debug")) { return Debug; }
  if (equals_ci(name, "info")) { return Info; }
  if (equals_ci(name, "warning") || equals_ci(name, "warn")) { return Warning; }
  if (equals_ci(name, "error")) { return Error; }
  if (equals_ci(name, "silent") || equals_ci(name, "none")) { return Silent; }
  return Warning;
}

}  // namespace wrapcc::support
