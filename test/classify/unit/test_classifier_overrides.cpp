/***
 * Name: test_classifier_overrides
 * Purpose: Verify caller rules shadow or extend the default tables.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "wrapcc/classify/classifier.h"
#include "wrapcc/classify/handlers.h"

using namespace wrapcc::classify;

using Tokens = std::vector<std::string>;

static ClassifierConfig Quiet(std::ostringstream& log) {
  ClassifierConfig config;
  config.log_stream = &log;
  return config;
}

TEST(Classifier_Overrides, ExactOverrideShadowsDefault) {
  std::ostringstream log;
  const ExactRules exact{{"-c", Rule{0, handlers::CompileUnary}}};
  const ArgumentClassifier c({"-c", "a.c"}, Quiet(log), exact);
  EXPECT_FALSE(c.result().is_compile_only);
  EXPECT_EQ(c.result().compile_args, (Tokens{"-c"}));
}

TEST(Classifier_Overrides, ExactAdditionsConsumeTheirArguments) {
  std::ostringstream log;
  const ExactRules exact{
      {"-I", Rule{1, handlers::CompileBinary}},
      {"-L", Rule{1, handlers::LinkBinary}},
      {"-l", Rule{1, handlers::LinkBinary}},
      {"--coverage", Rule{0, handlers::CompileLinkUnary}},
  };
  const ArgumentClassifier c({"-I", "inc", "a.c", "-L", "lib", "-l", "m", "--coverage"}, Quiet(log), exact);
  EXPECT_EQ(c.result().compile_args, (Tokens{"-I", "inc", "--coverage"}));
  EXPECT_EQ(c.result().link_args, (Tokens{"-L", "lib", "-l", "m", "--coverage"}));
  EXPECT_EQ(c.result().input_files, (Tokens{"a.c"}));
  EXPECT_TRUE(log.str().empty());
}

TEST(Classifier_Overrides, ArgumentOfAFlagIsNeverClassified) {
  std::ostringstream log;
  const ExactRules exact{{"-include", Rule{1, handlers::CompileBinary}}};
  const ArgumentClassifier c({"-include", "config.c", "main.c"}, Quiet(log), exact);
  EXPECT_EQ(c.result().input_files, (Tokens{"main.c"}));
  EXPECT_EQ(c.result().compile_args, (Tokens{"-include", "config.c"}));
}

TEST(Classifier_Overrides, ExactBeatsPattern) {
  std::ostringstream log;
  const ExactRules exact{{"generated.c", Rule{0, handlers::CompileUnary}}};
  const ArgumentClassifier c({"generated.c", "main.c"}, Quiet(log), exact);
  EXPECT_EQ(c.result().compile_args, (Tokens{"generated.c"}));
  EXPECT_EQ(c.result().input_files, (Tokens{"main.c"}));
}

TEST(Classifier_Overrides, PatternAdditions) {
  std::ostringstream log;
  const PatternRules patterns{
      MakePatternRule("^-l.+$", 0, handlers::LinkUnary),
      MakePatternRule("^-L.+$", 0, handlers::LinkUnary),
      MakePatternRule("^-M(M)?D$", 0, handlers::DependencyOnly),
      MakePatternRule("^-emit-llvm$", 0, handlers::EmitLlvm),
  };
  const ArgumentClassifier c({"-lm", "-L/opt/lib", "-MMD", "-emit-llvm", "a.c"}, Quiet(log), {}, patterns);
  EXPECT_EQ(c.result().link_args, (Tokens{"-lm", "-L/opt/lib"}));
  EXPECT_EQ(c.result().compile_args, (Tokens{"-MMD"}));
  EXPECT_TRUE(c.result().is_dependency_only);
  EXPECT_TRUE(c.result().is_emit_llvm);
  EXPECT_TRUE(c.result().is_compile_only);
}

TEST(Classifier_Overrides, SamePatternReplacesDefaultInPlace) {
  std::ostringstream log;
  const PatternRules patterns{
      MakePatternRule(R"(^.+\.(c|cc|cpp|C|cxx|i|s|S|bc)$)", 0, handlers::CompileUnary)};
  const ArgumentClassifier c({"a.c", "b.o"}, Quiet(log), {}, patterns);
  EXPECT_EQ(c.result().compile_args, (Tokens{"a.c"}));
  EXPECT_TRUE(c.result().input_files.empty());
  EXPECT_EQ(c.result().object_files, (Tokens{"b.o"}));
}

TEST(Classifier_Overrides, DependencyBinaryKeepsArgument) {
  std::ostringstream log;
  const ExactRules exact{{"-MF", Rule{1, handlers::DependencyBinary}}};
  const ArgumentClassifier c({"-MF", "a.d", "-c", "a.c"}, Quiet(log), exact);
  EXPECT_EQ(c.result().compile_args, (Tokens{"-MF", "a.d"}));
  EXPECT_TRUE(c.result().is_dependency_only);
}

TEST(Classifier_Overrides, IgnoreBinaryDropsThePair) {
  std::ostringstream log;
  const ExactRules exact{{"-arch", Rule{1, handlers::IgnoreBinary}}};
  const ArgumentClassifier c({"-arch", "x86_64", "a.c"}, Quiet(log), exact);
  EXPECT_TRUE(c.result().compile_args.empty());
  EXPECT_TRUE(c.result().link_args.empty());
  EXPECT_TRUE(c.result().forbidden_args.empty());
  EXPECT_NE(log.str().find("-arch x86_64"), std::string::npos);
}

TEST(Classifier_Overrides, MergeHelpersKeepDefaults) {
  ExactRules exact = DefaultExactRules();
  const auto before = exact.size();
  MergeExactRules(exact, ExactRules{{"-c", Rule{0, handlers::CompileUnary}}, {"-x", Rule{1, handlers::CompileBinary}}});
  EXPECT_EQ(exact.size(), before + 1);
  EXPECT_EQ(exact.at("-x").arity, 1u);

  PatternRules patterns = DefaultPatternRules();
  const auto count = patterns.size();
  const std::string first = patterns.front().pattern;
  MergePatternRules(patterns, PatternRules{MakePatternRule(first, 0, handlers::CompileUnary),
                                           MakePatternRule("^-W.*$", 0, handlers::CompileUnary)});
  ASSERT_EQ(patterns.size(), count + 1);
  EXPECT_EQ(patterns.front().pattern, first);
  EXPECT_EQ(patterns.back().pattern, "^-W.*$");
}

TEST(Classifier_Overrides, HandlerRegistryCoversEveryStockHandler) {
  const auto names = handlers::HandlerNames();
  EXPECT_EQ(names.size(), 20u);
  for (const auto& name : names) {
    EXPECT_TRUE(static_cast<bool>(handlers::LookupHandler(name))) << name;
  }
}
