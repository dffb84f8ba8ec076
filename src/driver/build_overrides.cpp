/***
 * Name: wrapcc::driver::BuildOverrides
 * Purpose: Turn --rule and --pattern specs into classifier rule tables.
 * Inputs: opts
 * Outputs: Overrides (exact table and ordered pattern list)
 * Theory of Operation: Specs are applied in command-line order, so a later spec for the
 *   same flag or pattern replaces an earlier one.
 */
#include "wrapcc/classify/handlers.h"
#include "wrapcc/classify/rules.h"
#include "wrapcc/driver/app.h"

namespace wrapcc {
namespace driver {

Overrides BuildOverrides(const CliOptions& opts) {
  Overrides overrides;
  for (const auto& spec : opts.exact_rules) {
    overrides.exact.insert_or_assign(
        spec.key, classify::Rule{spec.arity, classify::handlers::LookupHandler(spec.handler)});
  }
  for (const auto& spec : opts.pattern_rules) {
    classify::PatternRules single{
        classify::MakePatternRule(spec.key, spec.arity, classify::handlers::LookupHandler(spec.handler))};
    classify::MergePatternRules(overrides.patterns, single);
  }
  return overrides;
}

}  // namespace driver
}  // namespace wrapcc
