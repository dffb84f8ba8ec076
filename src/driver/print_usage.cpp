/***
 * Name: wrapcc::driver::PrintUsage
 * Purpose: Print CLI usage information for wrapcc-classify.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 * Theory of Operation: Lists the options and the stock handler names usable in rules.
 */
#include "wrapcc/classify/handlers.h"
#include "wrapcc/driver/cli.h"

#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

namespace wrapcc::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"wrapcc-classify"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] [--] <compiler arguments...>" << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help                       Print this help and exit" << '\n'
      << "  --dump                           Dump the raw partition after classification" << '\n'
      << "  --hidden-objects                 Report dot-prefixed object names" << '\n'
      << "  --log-level=<level>              debug|info|warning|error|silent (default: warning," << '\n'
      << "                                   or $WRAPCC_OUTPUT_LEVEL)" << '\n'
      << "  --rule=<arity>:<handler>:<flag>  Add or replace an exact-match rule" << '\n'
      << "  --pattern=<arity>:<handler>:<re> Add or replace a pattern rule" << '\n'
      << "  --                               End of options" << '\n'
      << '\n'
      << "Handlers:" << '\n';
  for (const auto& name : classify::handlers::HandlerNames()) {
    out << "  " << name << '\n';
  }
}

}  // namespace wrapcc::driver
