/***
 * Name: wrapcc::classify::MergeExactRules / MergePatternRules
 * Purpose: Apply caller overrides on top of a rule table.
 * Inputs: base table (in/out), overrides
 * Outputs: base with overrides applied
 * Theory of Operation: Same key replaces, new key adds. Defaults are only ever shadowed.
 *   A replaced pattern keeps its position so match order stays predictable.
 */
#include "wrapcc/classify/rules.h"

#include <algorithm>

namespace wrapcc {
namespace classify {

void MergeExactRules(ExactRules& base, const ExactRules& overrides) {
  for (const auto& [flag, rule] : overrides) {
    base.insert_or_assign(flag, rule);
  }
}

void MergePatternRules(PatternRules& base, const PatternRules& overrides) {
  for (const auto& override_rule : overrides) {
    auto existing = std::find_if(base.begin(), base.end(), [&](const PatternRule& rule) {
      return rule.pattern == override_rule.pattern;
    });
    if (existing != base.end()) {
      *existing = override_rule;
    } else {
      base.push_back(override_rule);
    }
  }
}

}  // namespace classify
}  // namespace wrapcc
