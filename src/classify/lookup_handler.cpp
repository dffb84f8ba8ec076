/***
 * Name: wrapcc::classify::handlers::LookupHandler / HandlerNames
 * Purpose: Resolve stock handlers by name for rules given as text (CLI --rule/--pattern).
 * Inputs: name
 * Outputs: Handler; ConfigError for unknown names
 * Theory of Operation: A static ordered table; names are kebab-case.
 */
#include "wrapcc/classify/handlers.h"
#include "wrapcc/exceptions/config_error.h"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace wrapcc {
namespace classify {
namespace handlers {

static const std::map<std::string, Handler, std::less<>>& Registry() {
  static const std::map<std::string, Handler, std::less<>> registry{
      {"standard-in", StandardIn},
      {"output-file", OutputFile},
      {"input-file", InputFile},
      {"object-file", ObjectFile},
      {"compile-only", CompileOnly},
      {"preprocess-only", PreprocessOnly},
      {"assemble-only", AssembleOnly},
      {"verbose", Verbose},
      {"emit-llvm", EmitLlvm},
      {"dependency-only", DependencyOnly},
      {"dependency-binary", DependencyBinary},
      {"compile-unary", CompileUnary},
      {"compile-binary", CompileBinary},
      {"link-unary", LinkUnary},
      {"link-binary", LinkBinary},
      {"compile-link-unary", CompileLinkUnary},
      {"linking-group", LinkingGroup},
      {"forbidden", Forbidden},
      {"ignore-binary", IgnoreBinary},
      {"abort", Abort},
  };
  return registry;
}

Handler LookupHandler(std::string_view name) {
  const auto& registry = Registry();
  const auto found = registry.find(name);
  if (found == registry.end()) {
    throw exceptions::ConfigError("unknown handler '" + std::string(name) + "'");
  }
  return found->second;
}

std::vector<std::string> HandlerNames() {
  std::vector<std::string> names;
  for (const auto& entry : Registry()) {
    names.push_back(entry.first);
  }
  return names;
}

}  // namespace handlers
}  // namespace classify
}  // namespace wrapcc
