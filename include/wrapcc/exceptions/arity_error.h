/***
 * Name: wrapcc::exceptions::ArityError
 * Purpose: Raised when a flag declares more trailing arguments than remain.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from WrapccException. The invocation is
 *   malformed and cannot be classified.
 */
#pragma once

#include <string>
#include <utility>

#include "wrapcc/exceptions/wrapcc_exception.h"

namespace wrapcc {
namespace exceptions {

class ArityError : public WrapccException {
 public:
  explicit ArityError(std::string msg) noexcept : WrapccException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace wrapcc
