/***
 * Name: wrapcc::classify::ArgumentClassifier::MatchPattern
 * Purpose: Find the pattern rule that matches the whole token.
 * Inputs: ordered pattern list, token
 * Outputs: The first matching rule, or nullptr
 * Theory of Operation: First match in list order wins. With reject_overlapping_patterns
 *   the remaining patterns are also tried, and a second match is a ConfigError.
 */
#include "wrapcc/classify/classifier.h"
#include "wrapcc/exceptions/config_error.h"

#include <regex>
#include <string>

namespace wrapcc {
namespace classify {

auto ArgumentClassifier::MatchPattern(const PatternRules& patterns, const std::string& token) const
    -> const PatternRule* {
  const PatternRule* winner = nullptr;
  for (const auto& candidate : patterns) {
    if (!std::regex_match(token, candidate.regex)) {
      continue;
    }
    if (winner == nullptr) {
      winner = &candidate;
      if (!config_.reject_overlapping_patterns) {
        break;
      }
      continue;
    }
    throw exceptions::ConfigError("token '" + token + "' matches overlapping patterns '" +
                                  winner->pattern + "' and '" + candidate.pattern + "'");
  }
  return winner;
}

}  // namespace classify
}  // namespace wrapcc
