/***
 * Name: wrapcc::driver::detail::HandleLogLevelArg
 * Purpose: Handle the --log-level=<level> option.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Recognizes the prefix and validates the value against the
 *   known level names, ignoring case as WRAPCC_OUTPUT_LEVEL does. Unlike the
 *   environment variable, an unknown name is an error here.
 */
#include "wrapcc/driver/cli_parse.h"
#include "wrapcc/driver/cli.h"  // direct use of CliOptions
#include "wrapcc/support/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <ostream>
#include <string>
#include <string_view>

namespace wrapcc {
namespace driver {
namespace detail {

auto HandleLogLevelArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  constexpr std::string_view kPrefix{"--log-level="};
  if (arg.rfind(kPrefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  const std::string value = arg.substr(kPrefix.size());
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  constexpr std::array<std::string_view, 7> kKnown{"debug", "info",  "warning", "warn",
                                                   "error", "silent", "none"};
  for (const auto known : kKnown) {
    if (lowered == known) {
      dst.log_level = support::ParseLogLevel(lowered);
      return OptResult::Handled;
    }
  }
  err << "wrapcc: error: unknown log level '" << value
      << "' (expected debug, info, warning, error or silent)" << '\n';
  return OptResult::Error;
}

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
