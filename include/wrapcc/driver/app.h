/***
 * Name: wrapcc::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options
 * Outputs: Classifier configuration, rule overrides, report text, status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units.
 */
#pragma once

#include <iosfwd>

#include "wrapcc/classify/classifier.h"
#include "wrapcc/classify/config.h"
#include "wrapcc/classify/rules.h"
#include "wrapcc/driver/cli.h"

namespace wrapcc {
namespace driver {

/***
 * Name: wrapcc::driver::Overrides
 * Purpose: Caller rule tables built from --rule and --pattern.
 */
struct Overrides {
  classify::ExactRules exact;
  classify::PatternRules patterns;
};

/***
 * Name: wrapcc::driver::BuildOverrides
 * Purpose: Resolve RuleSpecs into rule tables.
 * Inputs: opts
 * Outputs: Overrides
 * Theory of Operation: Handler names go through LookupHandler and patterns through
 *   MakePatternRule; both throw ConfigError on bad input. Later specs for the same key win.
 */
Overrides BuildOverrides(const CliOptions& opts);

/*** MakeConfig: Map CLI options to a ClassifierConfig writing to the given streams. */
classify::ClassifierConfig MakeConfig(const CliOptions& opts, std::ostream& out, std::ostream& err);

/***
 * Name: wrapcc::driver::PrintReport
 * Purpose: Print the classification and derived names, one `key: value` per line.
 */
void PrintReport(const classify::ArgumentClassifier& classifier, bool hidden_objects, std::ostream& out);

/***
 * Name: wrapcc::driver::RunClassify
 * Purpose: Classify opts.compiler_args and print the report.
 * Inputs: opts, out (report), err (diagnostics)
 * Outputs: POSIX status code (0 success)
 * Theory of Operation: Exceptions propagate to main(), which maps them to status 2.
 */
int RunClassify(const CliOptions& opts, std::ostream& out, std::ostream& err);

}  // namespace driver
}  // namespace wrapcc
