/***
 * Name: wrapcc::driver::RunClassify
 * Purpose: Classify one compiler invocation and report the result.
 * Inputs: opts (CLI options), out, err
 * Outputs: POSIX status code (0 success)
 * Theory of Operation: Build overrides and config, classify, print. ArityError,
 *   ConfigError and AbortError propagate to main().
 */
#include "wrapcc/classify/classifier.h"
#include "wrapcc/driver/app.h"

#include <ostream>

namespace wrapcc {
namespace driver {

int RunClassify(const CliOptions& opts, std::ostream& out, std::ostream& err) {
  const Overrides overrides = BuildOverrides(opts);
  const classify::ArgumentClassifier classifier(opts.compiler_args, MakeConfig(opts, out, err),
                                                overrides.exact, overrides.patterns);
  PrintReport(classifier, opts.hidden_objects, out);
  return 0;
}

}  // namespace driver
}  // namespace wrapcc
