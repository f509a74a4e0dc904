#include <gtest/gtest.h>

#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace primint::test {
namespace {

class ConfigTest : public CliTestFixture {};

TEST_F(ConfigTest, DefaultsComeFromPrimintToml) {
  WritePrimintToml("u8", "hex");

  auto result = Run({"pow", "2", "4"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "0x10\n");
}

TEST_F(ConfigTest, FlagsOverrideConfig) {
  WritePrimintToml("u8", "hex");

  auto result = Run({"pow", "2", "4", "-t", "u16", "--radix", "dec"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "16\n");
}

TEST_F(ConfigTest, ConfigFoundFromSubdirectory) {
  WritePrimintToml("u8");
  WriteFile("nested/dir/.keep", "");

  auto result = RunIn(TestDir() / "nested" / "dir", {"pow", "2", "8"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "0\n");
}

TEST_F(ConfigTest, ExplicitConfigPath) {
  WriteFile("custom.toml", "[defaults]\ntype = \"i8\"\n");

  auto result = Run({"--config", "custom.toml", "checked-pow", "2", "7"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.stdout_output, "overflow\n");
}

TEST_F(ConfigTest, InvalidTypeIsDiagnostic) {
  WritePrimintToml("u7");

  auto result = Run({"pow", "2", "2"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.stderr_output.find("primint.toml"), std::string::npos);
  EXPECT_NE(result.stderr_output.find("defaults.type"), std::string::npos);
}

TEST_F(ConfigTest, NonStringTypeIsDiagnostic) {
  WriteFile("primint.toml", "[defaults]\ntype = 8\n");

  auto result = Run({"pow", "2", "8"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.stdout_output.empty());
  EXPECT_NE(result.stderr_output.find("defaults.type"), std::string::npos);
}

TEST_F(ConfigTest, MalformedTomlIsDiagnostic) {
  WriteFile("primint.toml", "[defaults\n");

  auto result = Run({"pow", "2", "2"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.stderr_output.find("failed to parse"), std::string::npos);
}

TEST_F(ConfigTest, LogLevelFromConfig) {
  WritePrimintToml("u8", "", "debug");

  auto result = Run({"pow", "3", "2"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "9\n");
  EXPECT_NE(result.stderr_output.find("[debug]"), std::string::npos);
}

TEST_F(ConfigTest, VerboseFlagEnablesDebugLogs) {
  auto result = Run({"-v", "pow", "3", "2"});

  EXPECT_TRUE(result.Success());
  EXPECT_NE(result.stderr_output.find("[primint][debug]"), std::string::npos);
  EXPECT_EQ(result.stderr_output.find("[primint][trace]"), std::string::npos);
}

TEST_F(ConfigTest, DoubleVerboseEnablesTraceLogs) {
  auto result = Run({"-vv", "pow", "3", "2"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "9\n");
  EXPECT_NE(
      result.stderr_output.find("[primint][trace] options:"),
      std::string::npos);
}

TEST_F(ConfigTest, VerboseFlagBeatsConfiguredLevel) {
  WritePrimintToml("u8", "", "error");

  auto quiet = Run({"pow", "3", "2"});
  auto verbose = Run({"-v", "pow", "3", "2"});

  EXPECT_TRUE(quiet.Success());
  EXPECT_EQ(quiet.stderr_output.find("[primint][debug]"), std::string::npos);
  EXPECT_TRUE(verbose.Success());
  EXPECT_NE(verbose.stderr_output.find("[primint][debug]"), std::string::npos);
}

}  // namespace
}  // namespace primint::test
