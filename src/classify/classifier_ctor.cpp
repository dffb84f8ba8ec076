/***
 * Name: wrapcc::classify::ArgumentClassifier::ArgumentClassifier
 * Purpose: Build the rule tables and classify the whole token list.
 * Inputs:
 *   - tokens: argv tail
 *   - config: dump/log settings and overlap policy
 *   - exact_overrides, pattern_overrides: caller rules merged over the defaults
 * Outputs: Fully populated result_
 * Theory of Operation: Defaults first, overrides merged on top, then one linear pass.
 *   The dump, when requested, is written after the pass completes.
 */
#include "wrapcc/classify/classifier.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace wrapcc {
namespace classify {

ArgumentClassifier::ArgumentClassifier(std::vector<std::string> tokens,
                                       ClassifierConfig config,
                                       const ExactRules& exact_overrides,
                                       const PatternRules& pattern_overrides)
    : input_list_(tokens),
      config_(config),
      log_(config.log_stream != nullptr ? *config.log_stream : std::cerr, config.log_level),
      queue_(std::move(tokens)) {
  ExactRules exact = DefaultExactRules();
  MergeExactRules(exact, exact_overrides);
  PatternRules patterns = DefaultPatternRules();
  MergePatternRules(patterns, pattern_overrides);

  Classify(exact, patterns);

  if (config_.dump) {
    Dump(config_.dump_stream != nullptr ? *config_.dump_stream : std::cerr);
  }
}

}  // namespace classify
}  // namespace wrapcc
