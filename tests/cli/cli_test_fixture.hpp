#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace primint::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string stdout_output;
  std::string stderr_output;

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Test fixture for CLI integration tests
//
// Provides utilities for:
// - Running the primint binary with arguments
// - Managing a temporary directory per test
// - Writing primint.toml files
//
// The binary is taken from the PRIMINT_BIN environment variable, falling back
// to "primint" on PATH.
//
// Usage:
//   TEST_F(PowCliTest, Squares) {
//     auto result = Run({"pow", "3", "2"});
//     EXPECT_EQ(result.stdout_output, "9\n");
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run primint with given arguments from the test directory
  auto Run(std::initializer_list<std::string> args) -> CliResult;

  // Run primint from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, const std::vector<std::string>& args)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create primint.toml in the test directory; empty fields are omitted
  void WritePrimintToml(
      const std::string& type, const std::string& radix = "",
      const std::string& log_level = "");

  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path primint_bin_;
};

}  // namespace primint::test
