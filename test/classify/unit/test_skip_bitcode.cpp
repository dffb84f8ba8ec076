/***
 * Name: test_skip_bitcode
 * Purpose: Verify when the bitcode pass is skipped and the reason reported.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "wrapcc/classify/classifier.h"
#include "wrapcc/classify/handlers.h"

using namespace wrapcc::classify;

static ClassifierConfig Quiet(std::ostringstream& log) {
  ClassifierConfig config;
  config.log_stream = &log;
  return config;
}

static std::string SkipReason(const ArgumentClassifier& c) {
  const auto [skip, reason] = c.SkipBitcodeGeneration();
  return skip ? reason : std::string("no-skip");
}

TEST(SkipBitcode, RegularCompileNeedsBitcode) {
  std::ostringstream log;
  EXPECT_EQ(SkipReason(ArgumentClassifier({"-c", "a.c"}, Quiet(log))), "no-skip");
  EXPECT_EQ(SkipReason(ArgumentClassifier({"a.c", "b.o", "-o", "app"}, Quiet(log))), "no-skip");
}

TEST(SkipBitcode, StopBeforeObjectCode) {
  std::ostringstream log;
  EXPECT_EQ(SkipReason(ArgumentClassifier({"-E", "a.c"}, Quiet(log))), "Preprocess only");
  EXPECT_EQ(SkipReason(ArgumentClassifier({"-S", "a.c"}, Quiet(log))), "Assemble only");
}

TEST(SkipBitcode, SourcesWithoutBitcode) {
  std::ostringstream log;
  EXPECT_EQ(SkipReason(ArgumentClassifier({"-c", "start.S"}, Quiet(log))), "Assembly source");
  EXPECT_EQ(SkipReason(ArgumentClassifier({"-c", "-"}, Quiet(log))), "Reading from standard input");
  EXPECT_EQ(SkipReason(ArgumentClassifier({"a.o", "b.o", "-o", "app"}, Quiet(log))), "No input source files");
}

TEST(SkipBitcode, DependencyOnlyUnlessCompiling) {
  std::ostringstream log;
  const ExactRules exact{{"-M", Rule{0, handlers::DependencyOnly}}, {"-MD", Rule{0, handlers::DependencyOnly}}};
  EXPECT_EQ(SkipReason(ArgumentClassifier({"-M", "a.c"}, Quiet(log), exact)), "Dependency only");
  EXPECT_EQ(SkipReason(ArgumentClassifier({"-MD", "-c", "a.c"}, Quiet(log), exact)), "no-skip");
}
