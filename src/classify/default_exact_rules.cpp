/***
 * Name: wrapcc::classify::DefaultExactRules
 * Purpose: Build the literal-flag table every classification starts from.
 * Inputs: none
 * Outputs: ExactRules keyed by flag spelling
 * Theory of Operation:
 *   Only -o takes a trailing argument. Every explicit optimization level is forbidden:
 *   the wrapper chooses the optimization level of the bitcode pass itself.
 */
#include "wrapcc/classify/handlers.h"
#include "wrapcc/classify/rules.h"

namespace wrapcc {
namespace classify {

ExactRules DefaultExactRules() {
  namespace h = handlers;
  return ExactRules{
      {"-", Rule{0, h::StandardIn}},

      {"-o", Rule{1, h::OutputFile}},
      {"-c", Rule{0, h::CompileOnly}},
      {"-E", Rule{0, h::PreprocessOnly}},
      {"-S", Rule{0, h::AssembleOnly}},

      {"--verbose", Rule{0, h::Verbose}},

      // Queries that produce no object; treat them as compile-only runs.
      {"--version", Rule{0, h::CompileOnly}},
      {"-v", Rule{0, h::CompileOnly}},

      {"-O", Rule{0, h::Forbidden}},
      {"-O0", Rule{0, h::Forbidden}},
      {"-O1", Rule{0, h::Forbidden}},
      {"-O2", Rule{0, h::Forbidden}},
      {"-O3", Rule{0, h::Forbidden}},
      {"-Os", Rule{0, h::Forbidden}},
      {"-Ofast", Rule{0, h::Forbidden}},
      {"-Og", Rule{0, h::Forbidden}},
  };
}

}  // namespace classify
}  // namespace wrapcc
