/***
 * Name: wrapcc::driver::MakeConfig
 * Purpose: Map CLI options onto a ClassifierConfig.
 * Inputs: opts, out (dump destination), err (diagnostics destination)
 * Outputs: ClassifierConfig
 */
#include "wrapcc/driver/app.h"

#include <ostream>

namespace wrapcc::driver {

auto MakeConfig(const CliOptions& opts, std::ostream& out, std::ostream& err) -> classify::ClassifierConfig {
  classify::ClassifierConfig config;
  config.dump = opts.dump;
  config.dump_stream = &out;
  config.log_level = opts.log_level;
  config.log_stream = &err;
  return config;
}

}  // namespace wrapcc::driver
