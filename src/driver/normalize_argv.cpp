/***
 * Name: wrapcc::driver::detail::NormalizeArgv
 * Purpose: Copy the raw argv block into owned strings before option parsing.
 * Inputs: argc, argv (may be null when argc is zero)
 * Outputs: out, replaced with one string per argv slot
 * Theory of Operation: Slot count is preserved exactly; a null slot becomes an empty
 *   string so the compiler arguments forwarded to the classifier keep their positions.
 */
#include "wrapcc/driver/cli_parse.h"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace wrapcc {
namespace driver {
namespace detail {

void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out) {
  out.clear();
  if (argc <= 0 || argv == nullptr) {
    return;
  }
  const std::span<const char* const> slots(argv, static_cast<std::size_t>(argc));
  out.reserve(slots.size());
  for (const char* slot : slots) {
    out.emplace_back(slot != nullptr ? slot : "");
  }
}

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
