/***
 * Name: wrapcc::driver::detail::HandleCompilerArgs
 * Purpose: Treat the first token no earlier handler claimed as the start of the
 *          compiler invocation.
 * Inputs:
 *   - args, index (advanced to the end), argc
 *   - dst: CLI options destination
 * Outputs: Always Handled.
 * Theory of Operation: This is the last handler evaluated by ParseCli. After it runs,
 *   wrapcc options are no longer recognized, so "-c --dump" classifies "--dump".
 */
#include "wrapcc/driver/cli_parse.h"
#include "wrapcc/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <string>
#include <vector>

namespace wrapcc {
namespace driver {
namespace detail {

auto HandleCompilerArgs(const std::vector<std::string>& args,
                        int& index,
                        int argc,
                        CliOptions& dst) -> OptResult {
  for (; index < argc; ++index) {
    dst.compiler_args.emplace_back(args[static_cast<std::size_t>(index)]);
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
