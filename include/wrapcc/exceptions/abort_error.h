/***
 * Name: wrapcc::exceptions::AbortError
 * Purpose: Exception raised by the `abort` handler for flags the wrapper refuses to handle.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from WrapccException.
 */
#pragma once

#include <string>
#include <utility>

#include "wrapcc/exceptions/wrapcc_exception.h"

namespace wrapcc {
namespace exceptions {

class AbortError : public WrapccException {
 public:
  explicit AbortError(std::string msg) noexcept : WrapccException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace wrapcc
