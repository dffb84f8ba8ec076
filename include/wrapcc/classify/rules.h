/***
 * Name: wrapcc::classify (rules)
 * Purpose: Rule tables that map tokens to (arity, handler) pairs.
 * Inputs: Literal flags or regular expressions, arities, handlers
 * Outputs: ExactRules and PatternRules tables consumed by ArgumentClassifier
 * Theory of Operation:
 *   Exact rules are keyed by token equality and take priority. Pattern rules are an
 *   ordered list tried front to back against the whole token. Caller overrides shadow
 *   defaults with the same key; new keys are added (patterns after the defaults).
 */
#pragma once

#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "wrapcc/classify/result.h"
#include "wrapcc/support/logger.h"

namespace wrapcc {
namespace classify {

/***
 * Name: wrapcc::classify::HandlerContext
 * Purpose: State a handler may mutate plus the run's logger.
 */
struct HandlerContext {
  ClassificationResult& result;
  const support::Logger& log;
};

/*** Handler: Invoked with the matched flag and the `arity` tokens that followed it. */
using Handler = std::function<void(HandlerContext& ctx,
                                   const std::string& flag,
                                   const std::vector<std::string>& args)>;

struct Rule {
  std::size_t arity = 0;
  Handler handler;
};

using ExactRules = std::unordered_map<std::string, Rule>;

struct PatternRule {
  std::string pattern;  // source text, also the override key
  std::regex regex;
  Rule rule;
};

using PatternRules = std::vector<PatternRule>;

/*** DefaultExactRules: Literal flags every run recognizes (-o, -c, -E, -S, -O levels, ...). */
ExactRules DefaultExactRules();

/*** DefaultPatternRules: Source, object/library and numeric -O patterns, in match order. */
PatternRules DefaultPatternRules();

/*** MakePatternRule: Compile `pattern` (ECMAScript); throws ConfigError if it is invalid. */
PatternRule MakePatternRule(const std::string& pattern, std::size_t arity, Handler handler);

/*** MergeExactRules: Insert or replace every override in base. */
void MergeExactRules(ExactRules& base, const ExactRules& overrides);

/*** MergePatternRules: Replace same-pattern entries in place; append the rest in order. */
void MergePatternRules(PatternRules& base, const PatternRules& overrides);

}  // namespace classify
}  // namespace wrapcc
