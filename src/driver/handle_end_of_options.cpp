/***
 * Name: wrapcc::driver::detail::HandleEndOfOptions
 * Purpose: Stop wrapcc-classify option parsing at "--".
 * Inputs:
 *   - args: normalized argv
 *   - index: position of the candidate token; left at argc when matched
 *   - argc: token count
 *   - dst: receives the compiler invocation
 * Outputs: OptResult::Handled when the token is "--", else NotMatched
 * Theory of Operation: Everything after the separator belongs to the compiler
 *   invocation under classification, including tokens that look like our own options.
 */
#include "wrapcc/driver/cli_parse.h"
#include "wrapcc/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <string>
#include <vector>

namespace wrapcc {
namespace driver {
namespace detail {

auto HandleEndOfOptions(const std::vector<std::string>& args,
                        int& index,
                        int argc,
                        CliOptions& dst) -> OptResult {
  const auto separator = static_cast<std::size_t>(index);
  if (args[separator] != "--") {
    return OptResult::NotMatched;
  }
  dst.compiler_args.insert(dst.compiler_args.end(),
                           args.begin() + static_cast<std::ptrdiff_t>(separator + 1),
                           args.begin() + argc);
  index = argc;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
