/***
 * Name: wrapcc::driver::PrintReport
 * Purpose: Print the classification result and everything derived from it.
 * Inputs:
 *   - classifier: finished classification
 *   - hidden_objects: report dot-prefixed object names
 *   - out: destination stream
 * Outputs: `key: value` lines; lists are space separated
 * Theory of Operation: The format is line oriented so shell scripts can grep it.
 */
#include "wrapcc/driver/app.h"

#include <ostream>
#include <string>
#include <vector>

namespace wrapcc {
namespace driver {

static void PrintList(std::ostream& out, const char* key, const std::vector<std::string>& items) {
  out << key << ':';
  for (const auto& item : items) {
    out << ' ' << item;
  }
  out << '\n';
}

void PrintReport(const classify::ArgumentClassifier& classifier, bool hidden_objects, std::ostream& out) {
  const auto& result = classifier.result();
  PrintList(out, "input-files", result.input_files);
  PrintList(out, "object-files", result.object_files);
  PrintList(out, "compile-args", result.compile_args);
  PrintList(out, "link-args", result.link_args);
  PrintList(out, "forbidden-args", result.forbidden_args);
  out << "output: " << classifier.OutputFilename() << '\n';
  out << "bitcode: " << classifier.BitcodeFilename() << '\n';
  for (const auto& src_file : result.input_files) {
    const auto [object_name, bitcode_name] = classifier.ArtifactNames(src_file, hidden_objects);
    out << "artifact: " << src_file << ' ' << object_name << ' ' << bitcode_name << '\n';
  }
  const auto [skip, reason] = classifier.SkipBitcodeGeneration();
  out << "skip-bitcode: " << (skip ? "yes" : "no");
  if (skip) {
    out << " (" << reason << ')';
  }
  out << '\n';
}

}  // namespace driver
}  // namespace wrapcc
