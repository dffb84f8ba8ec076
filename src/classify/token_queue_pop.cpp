/***
 * Name: wrapcc::classify::TokenQueue::Pop
 * Purpose: Remove and return the front token.
 * Inputs: none
 * Outputs: The token at the cursor
 * Theory of Operation: Callers check Empty() first; popping an empty queue is a
 *   malformed-arity condition and throws ArityError.
 */
#include "wrapcc/classify/token_queue.h"
#include "wrapcc/exceptions/arity_error.h"

#include <string>

namespace wrapcc {
namespace classify {

std::string TokenQueue::Pop() {
  if (Empty()) {
    throw exceptions::ArityError("no arguments remain to classify");
  }
  return tokens_[next_++];
}

}  // namespace classify
}  // namespace wrapcc
