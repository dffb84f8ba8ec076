/***
 * Name: wrapcc::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple.
 */
#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "wrapcc/driver/cli.h"

namespace wrapcc {
namespace driver {
namespace detail {

/*** HandleHelpArg: Recognize -h/--help and set flag. */
OptResult HandleHelpArg(const std::string& arg, CliOptions& dst);

/*** HandleSwitch: Handle booleans --dump and --hidden-objects. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleLogLevelArg: Parse --log-level=<level>. */
OptResult HandleLogLevelArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleRuleArg: Parse `<prefix><arity>:<handler>:<key>` and append to out. */
struct RuleArgParams {
  std::string_view prefix;
  std::vector<RuleSpec>& out;
  std::ostream& err;
};

OptResult HandleRuleArg(const std::string& arg, const RuleArgParams& params);

/*** HandleEndOfOptions: Handle "--" and push remaining tokens as compiler args. */
OptResult HandleEndOfOptions(const std::vector<std::string>& args,
                             int& index,
                             int argc,
                             CliOptions& dst);

/*** HandleCompilerArgs: First unrecognized token starts the compiler args. */
OptResult HandleCompilerArgs(const std::vector<std::string>& args,
                             int& index,
                             int argc,
                             CliOptions& dst);

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace wrapcc
