/***
 * Name: wrapcc::classify::DefaultPatternRules
 * Purpose: Build the ordered pattern table for sources, objects and numeric -O levels.
 * Inputs: none
 * Outputs: PatternRules in match order
 * Theory of Operation: The defaults are pairwise disjoint, so no token can trip the
 *   overlap check without a caller override.
 */
#include "wrapcc/classify/handlers.h"
#include "wrapcc/classify/rules.h"

namespace wrapcc {
namespace classify {

PatternRules DefaultPatternRules() {
  namespace h = handlers;
  PatternRules rules;
  rules.push_back(MakePatternRule(R"(^.+\.(c|cc|cpp|C|cxx|i|s|S|bc)$)", 0, h::InputFile));
  // Fortran: .f .F .f90 .F77 .for .FOR .fpp .FPP
  rules.push_back(MakePatternRule(R"(^.+\.([fF](|[0-9][0-9]|or|OR|pp|PP))$)", 0, h::InputFile));
  rules.push_back(MakePatternRule(R"(^.+\.(o|lo|So|so|po|a|dylib)$)", 0, h::ObjectFile));
  // Versioned shared libraries: libfoo.so.4.5.6, libfoo.dylib.1
  rules.push_back(MakePatternRule(R"(^.+\.dylib(\.\d+)+$)", 0, h::ObjectFile));
  rules.push_back(MakePatternRule(R"(^.+\.(So|so)(\.\d+)+$)", 0, h::ObjectFile));
  rules.push_back(MakePatternRule(R"(^-O[0-9]+$)", 0, h::Forbidden));
  return rules;
}

}  // namespace classify
}  // namespace wrapcc
