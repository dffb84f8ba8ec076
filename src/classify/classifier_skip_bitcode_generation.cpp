/***
 * Name: wrapcc::classify::ArgumentClassifier::SkipBitcodeGeneration
 * Purpose: Decide whether the wrapper can skip the bitcode-emitting pass.
 * Inputs: none (reads result_)
 * Outputs: (true, reason) to skip; (false, "") when bitcode must be produced
 * Theory of Operation: Skip when the invocation stops before producing object code,
 *   only computes dependencies, compiles assembly, reads its source from stdin, or
 *   has no source inputs at all (pure link steps).
 */
#include "wrapcc/classify/classifier.h"

#include <string>
#include <utility>

namespace wrapcc {
namespace classify {

std::pair<bool, std::string> ArgumentClassifier::SkipBitcodeGeneration() const {
  if (result_.is_preprocess_only) {
    return {true, "Preprocess only"};
  }
  if (result_.is_assemble_only) {
    return {true, "Assemble only"};
  }
  if (result_.is_dependency_only && !result_.is_compile_only) {
    return {true, "Dependency only"};
  }
  if (result_.is_assembly) {
    return {true, "Assembly source"};
  }
  if (result_.is_standard_in) {
    return {true, "Reading from standard input"};
  }
  if (result_.input_files.empty()) {
    return {true, "No input source files"};
  }
  return {false, ""};
}

}  // namespace classify
}  // namespace wrapcc
