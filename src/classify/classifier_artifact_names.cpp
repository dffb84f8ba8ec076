/***
 * Name: wrapcc::classify::ArgumentClassifier::ArtifactNames
 * Purpose: Object and bitcode names staged for one input source.
 * Inputs:
 *   - src_file: source path as given on the command line
 *   - hidden: dot-prefix the object name like the bitcode name
 * Outputs: (objectName, bitcodeName), e.g. ("x.o", ".x.o.bc") for "dir/x.cpp"
 * Theory of Operation: Names are relative to the current directory; the source's
 *   directory is dropped, as the compiler does for -c without -o.
 */
#include "wrapcc/classify/classifier.h"
#include "wrapcc/support/path.h"

#include <string>
#include <utility>

namespace wrapcc {
namespace classify {

auto ArgumentClassifier::ArtifactNames(const std::string& src_file, bool hidden) const
    -> std::pair<std::string, std::string> {
  const std::string root = support::StripExtension(support::BaseName(src_file));
  std::string object_name = hidden ? "." + root + ".o" : root + ".o";
  std::string bitcode_name = "." + root + ".o.bc";
  return {std::move(object_name), std::move(bitcode_name)};
}

}  // namespace classify
}  // namespace wrapcc
