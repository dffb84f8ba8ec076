/***
 * Name: wrapcc::classify::ArgumentClassifier
 * Purpose: Partition a compiler invocation's arguments for a bitcode-emitting build wrapper.
 * Inputs:
 *   - tokens: argv tail (program name excluded)
 *   - config: dump/log settings and overlap policy
 *   - exact_overrides / pattern_overrides: caller rules that shadow or extend the defaults
 * Outputs:
 *   - ClassificationResult plus derived artifact names and the skip decision
 * Theory of Operation:
 *   The constructor runs the whole classification. Each token is checked against the
 *   linker-group opener, then the exact table, then the ordered pattern list; unmatched
 *   tokens go to the compile arguments, as do tokens longer than kMaxPatternTokenLength
 *   that miss the exact table. -E and -S stop classification immediately.
 *   ArityError and ConfigError propagate out of the constructor.
 */
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "wrapcc/classify/config.h"
#include "wrapcc/classify/result.h"
#include "wrapcc/classify/rules.h"
#include "wrapcc/classify/token_queue.h"
#include "wrapcc/support/logger.h"

namespace wrapcc {
namespace classify {

inline constexpr const char* kStartGroup = "-Wl,--start-group";
inline constexpr const char* kEndGroup = "-Wl,--end-group";
inline constexpr const char* kDefaultBinaryName = "a.out";

// Longest token the pattern list is tried against. std::regex recurses per character,
// and no file name exceeds PATH_MAX, so longer tokens go straight to compile_args.
inline constexpr std::size_t kMaxPatternTokenLength = 4096;

class ArgumentClassifier {
 public:
  explicit ArgumentClassifier(std::vector<std::string> tokens,
                              ClassifierConfig config = {},
                              const ExactRules& exact_overrides = {},
                              const PatternRules& pattern_overrides = {});

  const ClassificationResult& result() const { return result_; }
  const std::vector<std::string>& input_list() const { return input_list_; }

  /*** Number of tokens consumed; fewer than input_list().size() only after -E or -S. */
  std::size_t consumed() const { return queue_.Position(); }

  /*** OutputFilename: -o value, else `<stem>.o` for -c, else a.out. */
  std::string OutputFilename() const;

  /*** BitcodeFilename: Hidden `.<name>.bc` beside OutputFilename(). */
  std::string BitcodeFilename() const;

  /*** ArtifactNames: (object, bitcode) names for one source; object is dot-prefixed if hidden. */
  std::pair<std::string, std::string> ArtifactNames(const std::string& src_file,
                                                    bool hidden = false) const;

  /*** SkipBitcodeGeneration: (true, reason) when the invocation needs no bitcode pass. */
  std::pair<bool, std::string> SkipBitcodeGeneration() const;

  /*** Dump: Human-readable partition, per-source artifacts and flags. */
  void Dump(std::ostream& out) const;

 private:
  void Classify(const ExactRules& exact, const PatternRules& patterns);
  void ConsumeLinkingGroup(const std::string& opener);
  const PatternRule* MatchPattern(const PatternRules& patterns, const std::string& token) const;
  void Dispatch(const Rule& rule, const std::string& flag);

  std::vector<std::string> input_list_;
  ClassifierConfig config_;
  support::Logger log_;
  TokenQueue queue_;
  ClassificationResult result_;
};

}  // namespace classify
}  // namespace wrapcc
