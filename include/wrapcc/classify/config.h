/***
 * Name: wrapcc::classify::ClassifierConfig
 * Purpose: Per-run settings for ArgumentClassifier.
 * Inputs: Filled by the caller (the CLI maps its options and environment here).
 * Outputs: Consumed once by the ArgumentClassifier constructor.
 * Theory of Operation: Streams are non-owning; nullptr selects std::cerr.
 */
#pragma once

#include <iosfwd>

#include "wrapcc/support/logger.h"

namespace wrapcc {
namespace classify {

struct ClassifierConfig {
  bool dump = false;                    // print the partition after classification
  std::ostream* dump_stream = nullptr;  // destination for dump output
  support::LogLevel log_level = support::LogLevel::Warning;
  std::ostream* log_stream = nullptr;   // destination for diagnostics
  // A token matched by two pattern rules raises ConfigError instead of taking the first.
  bool reject_overlapping_patterns = true;
};

}  // namespace classify
}  // namespace wrapcc
