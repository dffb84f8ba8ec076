/***
 * Name: wrapcc::classify::ArgumentClassifier::Dump
 * Purpose: Print the partition of the arguments for troubleshooting.
 * Inputs: out (destination stream)
 * Outputs: Text listing of every accumulator, per-source artifacts and every flag
 */
#include "wrapcc/classify/classifier.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace wrapcc {
namespace classify {

static void PrintList(std::ostream& out, const char* label, const std::vector<std::string>& items) {
  out << label << ": [";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0) { out << ", "; }
    out << '\'' << items[i] << '\'';
  }
  out << "]\n";
}

static const char* Bool(bool value) { return value ? "True" : "False"; }

void ArgumentClassifier::Dump(std::ostream& out) const {
  out << '\n';
  PrintList(out, "compileArgs", result_.compile_args);
  PrintList(out, "inputFiles", result_.input_files);
  PrintList(out, "linkArgs", result_.link_args);
  out << '\n';
  PrintList(out, "objectFiles", result_.object_files);
  PrintList(out, "forbiddenArgs", result_.forbidden_args);
  out << "outputFilename: " << (result_.output_filename ? *result_.output_filename : "None") << '\n';

  for (const auto& src_file : result_.input_files) {
    const auto [object_name, bitcode_name] = ArtifactNames(src_file);
    out << '\n' << src_file << " ===> (" << object_name << ", " << bitcode_name << ")\n";
  }

  out << "\nFlags:\n";
  out << "isVerbose = " << Bool(result_.is_verbose) << '\n';
  out << "isDependencyOnly = " << Bool(result_.is_dependency_only) << '\n';
  out << "isPreprocessOnly = " << Bool(result_.is_preprocess_only) << '\n';
  out << "isAssembleOnly = " << Bool(result_.is_assemble_only) << '\n';
  out << "isAssembly = " << Bool(result_.is_assembly) << '\n';
  out << "isCompileOnly = " << Bool(result_.is_compile_only) << '\n';
  out << "isEmitLLVM = " << Bool(result_.is_emit_llvm) << '\n';
  out << "isStandardIn = " << Bool(result_.is_standard_in) << '\n';
}

}  // namespace classify
}  // namespace wrapcc
