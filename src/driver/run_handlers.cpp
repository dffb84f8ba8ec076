/***
 * Name: wrapcc::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch; last handler captures the compiler args.
 */
#include "wrapcc/driver/cli_parse.h"
#include "wrapcc/driver/cli.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace wrapcc {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args,
                 int& index,
                 int argc,
                 CliOptions& dst,
                 std::ostream& err) -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleHelpArg(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleSwitch(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleLogLevelArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) {
        const RuleArgParams params{"--rule=", dst.exact_rules, err};
        return HandleRuleArg(args[static_cast<std::size_t>(idx)], params);
      }},
      HandlerFn{[&](int& idx) {
        const RuleArgParams params{"--pattern=", dst.pattern_rules, err};
        return HandleRuleArg(args[static_cast<std::size_t>(idx)], params);
      }},
      HandlerFn{[&](int& idx) { return HandleEndOfOptions(args, idx, argc, dst); }},
      HandlerFn{[&](int& idx) { return HandleCompilerArgs(args, idx, argc, dst); }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result == OptResult::Error) {
      return OptResult::Error;
    }
    if (result == OptResult::Handled) {
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
