/***
 * Name: wrapcc::classify::MakePatternRule
 * Purpose: Compile a pattern into a rule.
 * Inputs: pattern (ECMAScript syntax), arity, handler
 * Outputs: PatternRule
 * Theory of Operation: std::regex_error is rethrown as ConfigError so callers only see
 *   wrapcc exception types.
 */
#include "wrapcc/classify/rules.h"
#include "wrapcc/exceptions/config_error.h"

#include <cstddef>
#include <regex>
#include <string>
#include <utility>

namespace wrapcc {
namespace classify {

PatternRule MakePatternRule(const std::string& pattern, std::size_t arity, Handler handler) {
  if (!handler) {
    throw exceptions::ConfigError("pattern rule '" + pattern + "' has no handler");
  }
  try {
    return PatternRule{pattern, std::regex(pattern, std::regex::ECMAScript), Rule{arity, std::move(handler)}};
  } catch (const std::regex_error& ex) {
    throw exceptions::ConfigError("invalid pattern '" + pattern + "': " + ex.what());
  }
}

}  // namespace classify
}  // namespace wrapcc
