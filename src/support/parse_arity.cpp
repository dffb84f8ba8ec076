/***
 * Name: wrapcc::support::ParseArity
 * Purpose: Parse a rule arity strictly: digits only, no sign, no surrounding space.
 * Inputs: text view, out value, optional error string pointer
 * Outputs: value and status; err set on failure
 */
#include "wrapcc/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>

namespace wrapcc {
namespace support {

auto ParseArity(std::string_view text, std::size_t& value, std::string* err) -> bool {
  value = 0;
  constexpr std::size_t kBase10 = 10;
  constexpr char kZeroChar = '0';
  std::string local_err;
  if (text.empty()) {
    local_err = "missing arity";
  }
  for (const char digit_char : text) {
    if (!local_err.empty()) {
      break;
    }
    if (std::isdigit(static_cast<unsigned char>(digit_char)) == 0) {
      local_err = "invalid character in arity";
      break;
    }
    value = (value * kBase10) + static_cast<std::size_t>(digit_char - kZeroChar);
    if (value > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
      local_err = "arity overflow";
    }
  }
  if (!local_err.empty()) {
    if (err != nullptr) {
      *err = local_err;
    }
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace wrapcc
