/***
 * Name: wrapcc::driver (cli)
 * Purpose: Declarations for wrapcc-classify options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: wrapcc-classify takes its own options first; the first token it
 *   does not recognize (or everything after "--") is the compiler invocation to classify.
 */
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "wrapcc/support/logger.h"

namespace wrapcc {
namespace driver {

/***
 * Name: wrapcc::driver::RuleSpec
 * Purpose: A caller rule given as text: `<arity>:<handler>:<key>`.
 * Inputs: Parsed from --rule= and --pattern= values.
 * Outputs: Turned into exact or pattern rules by BuildOverrides.
 * Theory of Operation: The key comes last so it may itself contain ':'.
 */
struct RuleSpec {
  std::size_t arity = 0;
  std::string handler;
  std::string key;
};

/***
 * Name: wrapcc::driver::CliOptions
 * Purpose: Hold parsed command-line options for a wrapcc-classify invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunClassify.
 */
struct CliOptions {
  std::vector<std::string> compiler_args;  // everything handed to the classifier
  bool show_help = false;                  // -h, --help
  bool dump = false;                       // --dump
  bool hidden_objects = false;             // --hidden-objects
  support::LogLevel log_level = support::LogLevel::Warning;  // --log-level=, WRAPCC_OUTPUT_LEVEL
  std::vector<RuleSpec> exact_rules;       // --rule=<arity>:<handler>:<flag>
  std::vector<RuleSpec> pattern_rules;     // --pattern=<arity>:<handler>:<regex>
};

/***
 * Name: wrapcc::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Theory of Operation: Allows the main parser to remain simple while delegating
 *   specific option formats to small helpers.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: wrapcc::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc, argv: process arguments (argv[0] is the program name)
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/*** ParseRuleSpec: Split `<arity>:<handler>:<key>`; false with a message in err on failure. */
bool ParseRuleSpec(const std::string& text, RuleSpec& out, std::string& err);

/*** PrintUsage: Print CLI usage information for wrapcc-classify. */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace wrapcc
