#include <gtest/gtest.h>

#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace primint::test {
namespace {

class CommandTest : public CliTestFixture {};

// Value printed after `label` in `bits` output, empty when the line is missing
auto BitsField(const std::string& out, const std::string& label)
    -> std::string {
  auto pos = out.find(label + " ");
  if (pos == std::string::npos) {
    return "";
  }
  auto start = out.find_first_not_of(' ', pos + label.size());
  auto end = out.find('\n', start);
  return out.substr(start, end - start);
}

// =============================================================================
// pow / checked-pow
// =============================================================================

TEST_F(CommandTest, PowDefaultsToU32) {
  auto result = Run({"pow", "3", "4"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "81\n");
}

TEST_F(CommandTest, PowWraps) {
  auto result = Run({"pow", "2", "8", "-t", "u8"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "0\n");
}

TEST_F(CommandTest, PowSignedMinimum) {
  auto result = Run({"pow", "-2", "7", "--type", "i8"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "-128\n");
}

TEST_F(CommandTest, PowHexOutput) {
  auto result = Run({"pow", "16", "3", "-t", "u16", "--radix", "hex"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "0x1000\n");
}

TEST_F(CommandTest, CheckedPowFits) {
  auto result = Run({"checked-pow", "2", "7", "-t", "u8"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "128\n");
}

TEST_F(CommandTest, CheckedPowOverflowExitsOne) {
  auto result = Run({"checked-pow", "7", "8", "-t", "u8"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.stdout_output, "overflow\n");
}

TEST_F(CommandTest, CheckedPowWideWord) {
  auto result = Run({"checked-pow", "2", "127", "-t", "u128"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(
      result.stdout_output, "170141183460469231731687303715884105728\n");
}

// =============================================================================
// reverse-bits / bits
// =============================================================================

TEST_F(CommandTest, ReverseBitsKnownPattern) {
  auto result = Run({"reverse-bits", "0x12345678", "--radix", "hex"});

  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_output, "0x1e6a2c48\n");
}

TEST_F(CommandTest, ReverseBitsFallbackAgrees) {
  auto native = Run({"reverse-bits", "1", "-t", "i8"});
  auto fallback = Run({"reverse-bits", "1", "-t", "i8", "--fallback"});

  EXPECT_TRUE(native.Success());
  EXPECT_TRUE(fallback.Success());
  EXPECT_EQ(native.stdout_output, "-128\n");
  EXPECT_EQ(fallback.stdout_output, native.stdout_output);
}

TEST_F(CommandTest, BitsSummary) {
  auto result = Run({"bits", "0b1011", "-t", "u8", "--shift", "2"});

  EXPECT_TRUE(result.Success());
  const auto& out = result.stdout_output;
  EXPECT_NE(out.find("count_ones     3\n"), std::string::npos);
  EXPECT_NE(out.find("leading_zeros  4\n"), std::string::npos);
  EXPECT_NE(out.find("rotate_left    44\n"), std::string::npos);
  EXPECT_NE(out.find("reverse_bits   208\n"), std::string::npos);
}

TEST_F(CommandTest, BitsPrintsAllEndianConversions) {
  auto result = Run({"bits", "0x0102", "-t", "u16", "--radix", "hex"});

  EXPECT_TRUE(result.Success());
  const auto& out = result.stdout_output;
  auto to_be = BitsField(out, "to_be");
  auto to_le = BitsField(out, "to_le");
  EXPECT_EQ(BitsField(out, "from_be"), to_be);
  EXPECT_EQ(BitsField(out, "from_le"), to_le);
  // One of the two is the identity on any host, the other swaps bytes
  EXPECT_TRUE(
      (to_be == "0x0102" && to_le == "0x0201") ||
      (to_be == "0x0201" && to_le == "0x0102"))
      << out;
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(CommandTest, LiteralOutOfRange) {
  auto result = Run({"pow", "256", "1", "-t", "u8"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.stdout_output.empty());
  EXPECT_NE(result.stderr_output.find("does not fit"), std::string::npos);
}

TEST_F(CommandTest, MalformedLiteral) {
  auto result = Run({"reverse-bits", "12a"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.stderr_output.find("12a"), std::string::npos);
}

TEST_F(CommandTest, UnknownWordType) {
  auto result = Run({"pow", "2", "2", "-t", "u7"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(
      result.stderr_output.find("unknown word type 'u7'"), std::string::npos);
}

TEST_F(CommandTest, MissingOperandIsUsageError) {
  auto result = Run({"pow", "2"});

  EXPECT_EQ(result.exit_code, 2);
}

TEST_F(CommandTest, NoColorDiagnosticIsPlain) {
  auto result = Run({"--no-color", "pow", "256", "1", "-t", "u8"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.stderr_output.find("error: "), std::string::npos);
  EXPECT_EQ(result.stderr_output.find('\x1b'), std::string::npos);
}

TEST_F(CommandTest, NoColorUsageErrorIsPlain) {
  auto result = Run({"--no-color", "pow", "2"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_NE(result.stderr_output.find("error: "), std::string::npos);
  EXPECT_EQ(result.stderr_output.find('\x1b'), std::string::npos);
}

TEST_F(CommandTest, NoColorLogsArePlain) {
  auto result = Run({"--no-color", "-v", "pow", "3", "2"});

  EXPECT_TRUE(result.Success());
  EXPECT_NE(result.stderr_output.find("[primint][debug]"), std::string::npos);
  EXPECT_EQ(result.stderr_output.find('\x1b'), std::string::npos);
}

}  // namespace
}  // namespace primint::test
