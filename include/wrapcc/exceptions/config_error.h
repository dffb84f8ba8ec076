/***
 * Name: wrapcc::exceptions::ConfigError
 * Purpose: Exception for rule-table and option errors.
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

class ConfigError : public WrapccException {
 public:
  explicit ConfigError(std::string msg) noexcept : WrapccException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace wrapcc
