/***
 * Name: wrapcc::support::Logger::Logger
 * Purpose: Bind a logger to a sink stream and threshold.
 * Inputs: sink (not owned; must outlive the logger), threshold
 * Outputs: Initialized logger
 */
#include "wrapcc/support/logger.h"

#include <ostream>

namespace wrapcc {
namespace support {

Logger::Logger(std::ostream& sink, LogLevel threshold) : sink_(&sink), threshold_(threshold) {}

}  // namespace support
}  // namespace wrapcc
