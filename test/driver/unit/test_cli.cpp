/***
 * Name: wrapcc::tests::Cli
 * Purpose: Validate wrapcc-classify option parsing.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Feed synthetic argv arrays into ParseCli and assert
 *   on populated CliOptions and error handling.
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "wrapcc/driver/cli.h"

using namespace wrapcc::driver;

using Tokens = std::vector<std::string>;

static std::vector<const char*> MakeArgv(const std::vector<std::string>& args) {
  static std::vector<std::string> storage;  // keeps c_str alive for the test duration
  storage = args;
  std::vector<const char*> argv;
  argv.reserve(storage.size());
  for (auto& s : storage) argv.push_back(s.c_str());
  return argv;
}

class Cli : public ::testing::Test {
 protected:
  void SetUp() override { unsetenv("WRAPCC_OUTPUT_LEVEL"); }
};

TEST_F(Cli, HelpFlag) {
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "-h"});
  EXPECT_TRUE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err)) << err.str();
  EXPECT_TRUE(opts.show_help);

  std::ostringstream out;
  PrintUsage(out, "/usr/bin/wrapcc-classify");
  EXPECT_NE(std::string::npos, out.str().find("Usage: wrapcc-classify"));
  EXPECT_NE(std::string::npos, out.str().find("compile-binary"));
}

TEST_F(Cli, EndOfOptions) {
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "--dump", "--", "--dump", "-c", "a.c"});
  ASSERT_TRUE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err)) << err.str();
  EXPECT_TRUE(opts.dump);
  EXPECT_EQ(opts.compiler_args, (Tokens{"--dump", "-c", "a.c"}));
}

TEST_F(Cli, FirstUnknownTokenStartsCompilerArgs) {
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "--hidden-objects", "-c", "a.c", "--dump", "-h"});
  ASSERT_TRUE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err)) << err.str();
  EXPECT_TRUE(opts.hidden_objects);
  EXPECT_FALSE(opts.dump);
  EXPECT_FALSE(opts.show_help);
  EXPECT_EQ(opts.compiler_args, (Tokens{"-c", "a.c", "--dump", "-h"}));
}

TEST_F(Cli, NullArgvSlotKeepsItsPosition) {
  CliOptions opts;
  std::ostringstream err;
  const char* argv[] = {"wrapcc-classify", "--", "-c", nullptr, "a.c"};
  ASSERT_TRUE(ParseCli(5, argv, opts, err)) << err.str();
  EXPECT_EQ(opts.compiler_args, (Tokens{"-c", "", "a.c"}));

  CliOptions none;
  EXPECT_TRUE(ParseCli(0, nullptr, none, err));
  EXPECT_TRUE(none.compiler_args.empty());
}

TEST_F(Cli, LogLevel) {
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "--log-level=debug", "a.c"});
  ASSERT_TRUE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err)) << err.str();
  EXPECT_EQ(opts.log_level, wrapcc::support::LogLevel::Debug);

  auto bad = MakeArgv({"wrapcc-classify", "--log-level=loud", "a.c"});
  EXPECT_FALSE(ParseCli(static_cast<int>(bad.size()), bad.data(), opts, err));
  EXPECT_NE(std::string::npos, err.str().find("unknown log level 'loud'"));
}

TEST_F(Cli, LogLevelDefaultsFromEnvironment) {
  setenv("WRAPCC_OUTPUT_LEVEL", "error", 1);
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "a.c"});
  ASSERT_TRUE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err)) << err.str();
  EXPECT_EQ(opts.log_level, wrapcc::support::LogLevel::Error);
  unsetenv("WRAPCC_OUTPUT_LEVEL");
}

TEST_F(Cli, LogLevelIgnoresCase) {
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "--log-level=DEBUG", "a.c"});
  ASSERT_TRUE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err)) << err.str();
  EXPECT_EQ(opts.log_level, wrapcc::support::LogLevel::Debug);

  auto mixed = MakeArgv({"wrapcc-classify", "--log-level=Silent", "a.c"});
  ASSERT_TRUE(ParseCli(static_cast<int>(mixed.size()), mixed.data(), opts, err)) << err.str();
  EXPECT_EQ(opts.log_level, wrapcc::support::LogLevel::Silent);

  auto bad = MakeArgv({"wrapcc-classify", "--log-level=LOUD", "a.c"});
  EXPECT_FALSE(ParseCli(static_cast<int>(bad.size()), bad.data(), opts, err));
  EXPECT_NE(std::string::npos, err.str().find("unknown log level 'LOUD'"));
}

TEST_F(Cli, RuleAndPatternSpecs) {
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "--rule=1:compile-binary:-I",
                            "--pattern=0:link-unary:^-l.+$", "-I", "inc", "a.c"});
  ASSERT_TRUE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err)) << err.str();
  ASSERT_EQ(opts.exact_rules.size(), 1u);
  EXPECT_EQ(opts.exact_rules[0].arity, 1u);
  EXPECT_EQ(opts.exact_rules[0].handler, "compile-binary");
  EXPECT_EQ(opts.exact_rules[0].key, "-I");
  ASSERT_EQ(opts.pattern_rules.size(), 1u);
  EXPECT_EQ(opts.pattern_rules[0].key, "^-l.+$");
  EXPECT_EQ(opts.compiler_args, (Tokens{"-I", "inc", "a.c"}));
}

TEST_F(Cli, MalformedRuleSpec) {
  CliOptions opts;
  std::ostringstream err;
  auto argv_vec = MakeArgv({"wrapcc-classify", "--rule=x:compile-unary:-I"});
  EXPECT_FALSE(ParseCli(static_cast<int>(argv_vec.size()), argv_vec.data(), opts, err));
  EXPECT_NE(std::string::npos, err.str().find("invalid character in arity"));
}

TEST_F(Cli, RuleSpecKeyKeepsColons) {
  RuleSpec spec;
  std::string err;
  ASSERT_TRUE(ParseRuleSpec("0:link-unary:-Wl,-z:relro", spec, err)) << err;
  EXPECT_EQ(spec.arity, 0u);
  EXPECT_EQ(spec.handler, "link-unary");
  EXPECT_EQ(spec.key, "-Wl,-z:relro");

  EXPECT_FALSE(ParseRuleSpec("0:link-unary", spec, err));
  EXPECT_FALSE(ParseRuleSpec("0::-x", spec, err));
  EXPECT_FALSE(ParseRuleSpec("1:compile-binary:", spec, err));
}
