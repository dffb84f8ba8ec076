/***
 * Name: wrapcc::driver::detail::HandleSwitch
 * Purpose: Handle simple boolean switches: --dump and --hidden-objects.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match and success/failure
 */
#include "wrapcc/driver/cli_parse.h"
#include "wrapcc/driver/cli.h"  // direct use of CliOptions

#include <string>

namespace wrapcc {
namespace driver {
namespace detail {

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "--dump") {
    dst.dump = true;
    return OptResult::Handled;
  }
  if (arg == "--hidden-objects") {
    dst.hidden_objects = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
