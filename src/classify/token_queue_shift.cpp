/***
 * Name: wrapcc::classify::TokenQueue::Shift
 * Purpose: Consume the trailing arguments that belong to a flag.
 * Inputs:
 *   - flag: the matched flag (used in the error message)
 *   - count: the rule's arity
 * Outputs: The next `count` tokens in order
 * Theory of Operation: Checks availability before moving the cursor so a failed
 *   shift leaves the queue untouched.
 */
#include "wrapcc/classify/token_queue.h"
#include "wrapcc/exceptions/arity_error.h"

#include <cstddef>
#include <string>
#include <vector>

namespace wrapcc {
namespace classify {

auto TokenQueue::Shift(const std::string& flag, std::size_t count) -> std::vector<std::string> {
  if (count > Remaining()) {
    throw exceptions::ArityError("flag '" + flag + "' expects " + std::to_string(count) +
                                 " argument(s) but only " + std::to_string(Remaining()) +
                                 " remain");
  }
  const auto first = tokens_.begin() + static_cast<std::ptrdiff_t>(next_);
  std::vector<std::string> taken(first, first + static_cast<std::ptrdiff_t>(count));
  next_ += count;
  return taken;
}

}  // namespace classify
}  // namespace wrapcc
