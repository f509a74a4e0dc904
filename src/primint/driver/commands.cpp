#include "commands.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "primint/common/diagnostic.hpp"
#include "primint/common/literal.hpp"
#include "primint/common/word_type.hpp"
#include "primint/pow.hpp"
#include "primint/prim_int.hpp"
#include "primint/reverse_bits.hpp"

namespace primint::driver {

namespace {

using common::FormatWord;
using common::ParseLiteral;
using common::Radix;

// Parse the positional operand `name` as T; prints the diagnostic on failure
template <typename T>
auto ParseOperand(
    const argparse::ArgumentParser& cmd, const char* name,
    const CommandOptions& opts) -> std::optional<T> {
  auto text = cmd.get<std::string>(name);
  auto value = ParseLiteral<T>(text);
  if (!value) {
    PrintDiagnostic(value.error(), opts.colors);
    return std::nullopt;
  }
  spdlog::debug("{} = {}", name, FormatWord(*value, Radix::kHex));
  return *value;
}

}  // namespace

auto ResolveOptions(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config, bool colors)
    -> Result<CommandOptions> {
  CommandOptions opts;
  opts.colors = colors;

  if (auto name = cmd.present<std::string>("--type")) {
    auto type = common::ParseWordType(*name);
    if (!type) {
      return std::unexpected(
          Diagnostic::Error(fmt::format("unknown word type '{}'", *name)));
    }
    opts.type = *type;
  } else if (config && config->type) {
    opts.type = *config->type;
  }

  if (auto name = cmd.present<std::string>("--radix")) {
    auto radix = common::ParseRadix(*name);
    if (!radix) {
      return std::unexpected(
          Diagnostic::Error(
              fmt::format("unknown radix '{}', use dec, hex or bin", *name)));
    }
    opts.radix = *radix;
  } else if (config && config->radix) {
    opts.radix = *config->radix;
  }

  spdlog::trace(
      "options: type={} radix={} colors={}", common::ToString(opts.type),
      common::ToString(opts.radix), opts.colors);
  return opts;
}

auto PowCommand(const argparse::ArgumentParser& cmd, const CommandOptions& opts)
    -> int {
  auto exp = ParseOperand<uint32_t>(cmd, "exp", opts);
  if (!exp) {
    return 1;
  }
  return common::VisitWordType(
      opts.type, [&]<typename T>(std::type_identity<T>) -> int {
        auto base = ParseOperand<T>(cmd, "base", opts);
        if (!base) {
          return 1;
        }
        fmt::print("{}\n", FormatWord(Pow(*base, *exp), opts.radix));
        return 0;
      });
}

auto CheckedPowCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& opts) -> int {
  auto exp = ParseOperand<uint32_t>(cmd, "exp", opts);
  if (!exp) {
    return 1;
  }
  return common::VisitWordType(
      opts.type, [&]<typename T>(std::type_identity<T>) -> int {
        auto base = ParseOperand<T>(cmd, "base", opts);
        if (!base) {
          return 1;
        }
        auto result = CheckedPow(*base, *exp);
        if (!result) {
          spdlog::debug(
              "{}^{} does not fit in {}", FormatWord(*base, Radix::kDec), *exp,
              common::ToString(opts.type));
          fmt::print("overflow\n");
          return 1;
        }
        fmt::print("{}\n", FormatWord(*result, opts.radix));
        return 0;
      });
}

auto ReverseBitsCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& opts) -> int {
  bool fallback = cmd.get<bool>("--fallback");
  return common::VisitWordType(
      opts.type, [&]<typename T>(std::type_identity<T>) -> int {
        auto value = ParseOperand<T>(cmd, "value", opts);
        if (!value) {
          return 1;
        }
        if (!fallback && kHasNativeReverseBits<T>) {
          spdlog::debug("using native bit reverse");
        }
        auto reversed =
            fallback ? ReverseBitsFallback(*value) : ReverseBits(*value);
        fmt::print("{}\n", FormatWord(reversed, opts.radix));
        return 0;
      });
}

auto BitsCommand(const argparse::ArgumentParser& cmd, const CommandOptions& opts)
    -> int {
  auto shift = ParseOperand<uint32_t>(cmd, "--shift", opts);
  if (!shift) {
    return 1;
  }
  return common::VisitWordType(
      opts.type, [&]<typename T>(std::type_identity<T>) -> int {
        auto value = ParseOperand<T>(cmd, "value", opts);
        if (!value) {
          return 1;
        }
        auto word = [&](T v) { return FormatWord(v, opts.radix); };
        auto n = *shift;
        fmt::print("value          {}\n", word(*value));
        fmt::print("count_ones     {}\n", CountOnes(*value));
        fmt::print("count_zeros    {}\n", CountZeros(*value));
        fmt::print("leading_zeros  {}\n", LeadingZeros(*value));
        fmt::print("leading_ones   {}\n", LeadingOnes(*value));
        fmt::print("trailing_zeros {}\n", TrailingZeros(*value));
        fmt::print("trailing_ones  {}\n", TrailingOnes(*value));
        fmt::print("rotate_left    {}\n", word(RotateLeft(*value, n)));
        fmt::print("rotate_right   {}\n", word(RotateRight(*value, n)));
        fmt::print("signed_shl     {}\n", word(SignedShl(*value, n)));
        fmt::print("signed_shr     {}\n", word(SignedShr(*value, n)));
        fmt::print("unsigned_shl   {}\n", word(UnsignedShl(*value, n)));
        fmt::print("unsigned_shr   {}\n", word(UnsignedShr(*value, n)));
        fmt::print("swap_bytes     {}\n", word(SwapBytes(*value)));
        fmt::print("reverse_bits   {}\n", word(ReverseBits(*value)));
        fmt::print("to_be          {}\n", word(ToBe(*value)));
        fmt::print("to_le          {}\n", word(ToLe(*value)));
        fmt::print("from_be        {}\n", word(FromBe(*value)));
        fmt::print("from_le        {}\n", word(FromLe(*value)));
        return 0;
      });
}

}  // namespace primint::driver
