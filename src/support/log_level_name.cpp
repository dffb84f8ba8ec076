#include "wrapcc/support/logger.h"

namespace wrapcc::support {

/***
 * Name: wrapcc::support::LogLevelName
 * Purpose: Map a level to its lower-case name.
 */
const char* LogLevelName(const LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Error:
      return "error";
    case LogLevel::Silent:
      return "silent";
  }
  return "unknown";
}

}  // namespace wrapcc::support
