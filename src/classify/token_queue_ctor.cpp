/***
 * Name: wrapcc::classify::TokenQueue::TokenQueue
 * Purpose: Take ownership of the token list; the cursor starts at the front.
 */
#include "wrapcc/classify/token_queue.h"

#include <string>
#include <utility>
#include <vector>

namespace wrapcc::classify {

TokenQueue::TokenQueue(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}

}  // namespace wrapcc::classify
