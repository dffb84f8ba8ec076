/***
 * Name: wrapcc::driver::detail::HandleRuleArg
 * Purpose: Handle --rule= and --pattern= options.
 * Inputs:
 *   - arg: current argument string
 *   - params: option prefix, destination list, error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: One helper serves both tables; the prefix selects the list.
 */
#include "wrapcc/driver/cli_parse.h"
#include "wrapcc/driver/cli.h"

#include <string>
#include <utility>

namespace wrapcc {
namespace driver {
namespace detail {

auto HandleRuleArg(const std::string& arg, const RuleArgParams& params) -> OptResult {
  if (arg.rfind(params.prefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  RuleSpec spec;
  std::string message;
  if (!ParseRuleSpec(arg.substr(params.prefix.size()), spec, message)) {
    params.err << "wrapcc: error: " << params.prefix << ": " << message << '\n';
    return OptResult::Error;
  }
  params.out.push_back(std::move(spec));
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
