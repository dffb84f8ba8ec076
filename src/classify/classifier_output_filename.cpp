/***
 * Name: wrapcc::classify::ArgumentClassifier::OutputFilename
 * Purpose: Name of the file the real compiler invocation will produce.
 * Inputs: none (reads result_)
 * Outputs: -o value; `<stem>.o` for -c without -o; otherwise a.out
 * Theory of Operation: -c without -o puts the object in the current directory, named
 *   after the first input source. With no input sources there is nothing to derive a
 *   name from, so the default binary name is returned.
 */
#include "wrapcc/classify/classifier.h"
#include "wrapcc/support/path.h"

#include <string>

namespace wrapcc {
namespace classify {

std::string ArgumentClassifier::OutputFilename() const {
  if (result_.output_filename.has_value()) {
    return *result_.output_filename;
  }
  if (result_.is_compile_only && !result_.input_files.empty()) {
    return support::StripExtension(support::BaseName(result_.input_files.front())) + ".o";
  }
  return kDefaultBinaryName;
}

}  // namespace classify
}  // namespace wrapcc
