/***
 * Name: wrapcc::classify::ClassificationResult
 * Purpose: Partitioned record of a compiler invocation's intent.
 * Inputs: Populated by handlers while ArgumentClassifier consumes the token list.
 * Outputs: Read by the build wrapper to pick compile/link argument lists and artifact names.
 * Theory of Operation: Plain aggregate. Every sequence keeps appearance order and only grows.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wrapcc {
namespace classify {

struct ClassificationResult {
  std::vector<std::string> input_files;     // sources: .c .cpp .s .bc .f90 ...
  std::vector<std::string> object_files;    // .o .a .so .dylib, versioned .so.N
  std::vector<std::string> compile_args;    // flags for the compile step
  std::vector<std::string> link_args;       // flags for the link step
  std::vector<std::string> forbidden_args;  // recognized, stripped from both steps
  std::optional<std::string> output_filename;  // -o <file>

  bool is_verbose = false;          // --verbose
  bool is_dependency_only = false;  // -M style flags (caller rules)
  bool is_preprocess_only = false;  // -E
  bool is_assemble_only = false;    // -S
  bool is_assembly = false;         // an input ends in .s or .S
  bool is_compile_only = false;     // -c, -v, --version
  bool is_emit_llvm = false;        // -emit-llvm (caller rules)
  bool is_standard_in = false;      // -
};

}  // namespace classify
}  // namespace wrapcc
