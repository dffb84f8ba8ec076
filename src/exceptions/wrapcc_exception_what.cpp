/***
 * Name: wrapcc::exceptions::WrapccException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "wrapcc/exceptions/wrapcc_exception.h"

namespace wrapcc::exceptions {

const char* WrapccException::what() const noexcept { return message_.c_str(); }

}  // namespace wrapcc::exceptions
