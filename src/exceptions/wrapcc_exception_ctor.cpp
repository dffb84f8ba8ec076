/***
 * Name: wrapcc::exceptions::WrapccException::WrapccException
 * Purpose: Shared constructor for ArityError, ConfigError and AbortError.
 * Inputs:
 *   - msg: diagnostic naming the offending flag, pattern or handler
 * Outputs: Exception carrying msg
 * Theory of Operation: main() prints what() after "wrapcc: error: ", so msg carries
 *   no prefix of its own.
 */
#include "wrapcc/exceptions/wrapcc_exception.h"

#include <string>
#include <utility>

namespace wrapcc {
namespace exceptions {

WrapccException::WrapccException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace wrapcc
