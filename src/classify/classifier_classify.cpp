/***
 * Name: wrapcc::classify::ArgumentClassifier::Classify
 * Purpose: Consume the token queue front to back, routing every token to a handler.
 * Inputs: merged exact and pattern tables
 * Outputs: result_ mutated by handlers
 * Theory of Operation:
 *   Order per token: linker-group opener, exact table, pattern list, default bucket.
 *   Oversized tokens skip the pattern list so the regex engine never sees them.
 *   The loop ends when the queue is empty or a terminal flag (-E, -S) has been seen;
 *   tokens after a terminal flag are never popped.
 */
#include "wrapcc/classify/classifier.h"
#include "wrapcc/exceptions/config_error.h"

#include <string>

namespace wrapcc {
namespace classify {

void ArgumentClassifier::Classify(const ExactRules& exact, const PatternRules& patterns) {
  while (!queue_.Empty() && !(result_.is_preprocess_only || result_.is_assemble_only)) {
    const std::string current = queue_.Pop();
    if (log_.Enabled(support::LogLevel::Debug)) {
      log_.Debug("trying to match item " + current);
    }

    if (current == kStartGroup) {
      ConsumeLinkingGroup(current);
      continue;
    }

    if (const auto found = exact.find(current); found != exact.end()) {
      Dispatch(found->second, current);
      continue;
    }

    if (current.size() > kMaxPatternTokenLength) {
      log_.Warning("not matching patterns against a " + std::to_string(current.size()) +
                   "-character argument; keeping it for the compile step");
      result_.compile_args.push_back(current);
      continue;
    }

    if (const PatternRule* matched = MatchPattern(patterns, current); matched != nullptr) {
      Dispatch(matched->rule, current);
      continue;
    }

    // Unknown flags are kept for the compile step rather than rejected.
    if (log_.Enabled(support::LogLevel::Warning)) {
      log_.Warning("did not recognize the compiler flag \"" + current + "\"");
    }
    result_.compile_args.push_back(current);
  }
}

void ArgumentClassifier::Dispatch(const Rule& rule, const std::string& flag) {
  if (!rule.handler) {
    throw exceptions::ConfigError("rule for '" + flag + "' has no handler");
  }
  const auto args = queue_.Shift(flag, rule.arity);
  HandlerContext ctx{result_, log_};
  rule.handler(ctx, flag, args);
}

}  // namespace classify
}  // namespace wrapcc
