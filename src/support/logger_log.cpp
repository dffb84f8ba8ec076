/***
 * Name: wrapcc::support::Logger::Log / Enabled
 * Purpose: Emit one prefixed diagnostic line if the level passes the threshold.
 * Inputs: level, message
 * Outputs: Line written to the sink
 * Theory of Operation: Silent is never emitted; it only serves as a threshold.
 */
#include "wrapcc/support/logger.h"

#include <ostream>
#include <string_view>

namespace wrapcc::support {

bool Logger::Enabled(LogLevel level) const {
  return level != LogLevel::Silent && static_cast<int>(level) >= static_cast<int>(threshold_);
}

void Logger::Log(LogLevel level, std::string_view message) const {
  if (!Enabled(level)) {
    return;
  }
  *sink_ << "wrapcc: " << LogLevelName(level) << ": " << message << '\n';
}

}  // namespace wrapcc::support
