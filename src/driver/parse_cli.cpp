/***
 * Name: wrapcc::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation:
 *   The log level defaults to WRAPCC_OUTPUT_LEVEL. Each argument runs through the ordered
 *   handler table; the last handler takes the first unrecognized token and everything
 *   after it as the compiler invocation.
 */
#include "wrapcc/driver/cli.h"
#include "wrapcc/driver/cli_parse.h"
#include "wrapcc/support/logger.h"

#include <ostream>
#include <string>
#include <vector>

namespace wrapcc::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  // Reset to defaults
  dst = CliOptions{};
  dst.log_level = support::LogLevelFromEnv(support::LogLevel::Warning);

  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);
  const int count = static_cast<int>(args.size());

  for (int arg_index = 1; arg_index < count; ++arg_index) {
    const detail::OptResult result = detail::RunHandlers(args, arg_index, count, dst, err);
    if (result == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }
  return true;
}

}  // namespace wrapcc::driver
