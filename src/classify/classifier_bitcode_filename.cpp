/***
 * Name: wrapcc::classify::ArgumentClassifier::BitcodeFilename
 * Purpose: Hidden bitcode file paired with the output ("out/app" -> "out/.app.bc").
 */
#include "wrapcc/classify/classifier.h"
#include "wrapcc/support/path.h"

#include <string>

namespace wrapcc::classify {

std::string ArgumentClassifier::BitcodeFilename() const {
  const std::string output = OutputFilename();
  return support::JoinPath(support::DirName(output), "." + support::BaseName(output) + ".bc");
}

}  // namespace wrapcc::classify
