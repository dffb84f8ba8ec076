/***
 * Name: test_derived_names
 * Purpose: Verify output, bitcode and per-source artifact name derivation.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <utility>

#include "wrapcc/classify/classifier.h"

using namespace wrapcc::classify;

static ClassifierConfig Quiet(std::ostringstream& log) {
  ClassifierConfig config;
  config.log_stream = &log;
  return config;
}

TEST(DerivedNames, OutputFilename) {
  std::ostringstream log;
  EXPECT_EQ(ArgumentClassifier({"-c", "src/bar.cpp"}, Quiet(log)).OutputFilename(), "bar.o");
  EXPECT_EQ(ArgumentClassifier({"-c", "a.tar.c", "b.c"}, Quiet(log)).OutputFilename(), "a.tar.o");
  EXPECT_EQ(ArgumentClassifier({"a.c", "b.c"}, Quiet(log)).OutputFilename(), "a.out");
  EXPECT_EQ(ArgumentClassifier({"-c", "a.c", "-o", "obj/a.o"}, Quiet(log)).OutputFilename(), "obj/a.o");
}

TEST(DerivedNames, CompileOnlyWithoutSourcesFallsBackToDefault) {
  std::ostringstream log;
  EXPECT_EQ(ArgumentClassifier({"--version"}, Quiet(log)).OutputFilename(), "a.out");
}

TEST(DerivedNames, BitcodeFilenameIsHiddenBesideOutput) {
  std::ostringstream log;
  EXPECT_EQ(ArgumentClassifier({"-o", "build/app", "a.c"}, Quiet(log)).BitcodeFilename(), "build/.app.bc");
  EXPECT_EQ(ArgumentClassifier({"a.c"}, Quiet(log)).BitcodeFilename(), ".a.out.bc");
  EXPECT_EQ(ArgumentClassifier({"-c", "x/foo.c"}, Quiet(log)).BitcodeFilename(), ".foo.o.bc");
}

TEST(DerivedNames, ArtifactNames) {
  std::ostringstream log;
  const ArgumentClassifier c({}, Quiet(log));
  EXPECT_EQ(c.ArtifactNames("dir/x.cpp", true), std::make_pair(std::string(".x.o"), std::string(".x.o.bc")));
  EXPECT_EQ(c.ArtifactNames("dir/x.cpp"), std::make_pair(std::string("x.o"), std::string(".x.o.bc")));
  EXPECT_EQ(c.ArtifactNames("lib.v2.c").first, "lib.v2.o");
  EXPECT_EQ(c.ArtifactNames("noext").second, ".noext.o.bc");
}
