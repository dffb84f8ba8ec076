/***
 * Name: wrapcc::classify::TokenQueue
 * Purpose: Cursor over the tokens that remain to be classified.
 * Inputs: The full token list (owned)
 * Outputs: Tokens in order via Pop and Shift
 * Theory of Operation: An explicit index into an owned vector. Shift is all-or-nothing:
 *   asking for more tokens than remain throws ArityError and consumes nothing.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace wrapcc {
namespace classify {

class TokenQueue {
 public:
  explicit TokenQueue(std::vector<std::string> tokens);

  bool Empty() const { return next_ >= tokens_.size(); }
  std::size_t Remaining() const { return tokens_.size() - next_; }
  std::size_t Position() const { return next_; }

  /*** Pop: Remove and return the front token; throws ArityError when empty. */
  std::string Pop();

  /*** Shift: Remove the `count` tokens that belong to `flag`. */
  std::vector<std::string> Shift(const std::string& flag, std::size_t count);

 private:
  std::vector<std::string> tokens_;
  std::size_t next_ = 0;
};

}  // namespace classify
}  // namespace wrapcc
