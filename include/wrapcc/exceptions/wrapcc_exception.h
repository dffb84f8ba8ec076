/***
 * Name: wrapcc::exceptions::WrapccException
 * Purpose: Base class for all wrapcc exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception so callers can catch it generically,
 *   but every throw in wrapcc uses a type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace wrapcc {
namespace exceptions {

class WrapccException : public std::exception {
 public:
  virtual ~WrapccException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit WrapccException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace wrapcc
