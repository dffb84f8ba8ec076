#include "wrapcc/support/logger.h"

#include <cstdlib>
#include <string_view>

namespace wrapcc::support {

/***
 * Name: wrapcc::support::LogLevelFromEnv
 * Purpose: Read the diagnostic threshold from WRAPCC_OUTPUT_LEVEL.
 */
LogLevel LogLevelFromEnv(const LogLevel fallback) {
  const char* env_value = std::getenv("WRAPCC_OUTPUT_LEVEL");
  if (env_value == nullptr || *env_value == '\0') { return fallback; }
  return ParseLogLevel(std::string_view{env_value});
}

}  // namespace wrapcc::support
