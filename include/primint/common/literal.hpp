#pragma once

// Integer literal parsing and formatting for the command line and the
// YAML-driven tests.
//
// Accepted syntax: [+|-] then decimal digits, 0x hex digits or 0b binary
// digits. Underscores may separate digits ("1_000", "0xdead_beef").

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/format.h>

#include "primint/common/diagnostic.hpp"
#include "primint/common/word_type.hpp"
#include "primint/word.hpp"

namespace primint::common {

struct ParsedLiteral {
  bool negative = false;
  u128 magnitude = 0;
};

// Sign and magnitude of a literal; fails on bad syntax or a magnitude above
// 2^128 - 1
auto ParseMagnitude(std::string_view text) -> Result<ParsedLiteral>;

template <BuiltinInteger T>
auto ParseLiteral(std::string_view text) -> Result<T> {
  auto parsed = ParseMagnitude(text);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }

  using U = std::make_unsigned_t<T>;
  constexpr auto kMax = static_cast<u128>(std::numeric_limits<T>::max());
  auto out_of_range = [&] {
    return std::unexpected(
        Diagnostic::Error(
            fmt::format(
                "literal '{}' does not fit in a {}-bit {} word", text,
                WordTraits<T>::kBits,
                std::is_signed_v<T> ? "signed" : "unsigned")));
  };

  if (!parsed->negative) {
    if (parsed->magnitude > kMax) {
      return out_of_range();
    }
    return static_cast<T>(parsed->magnitude);
  }

  if constexpr (std::is_signed_v<T>) {
    // |min| == max + 1 for two's complement
    if (parsed->magnitude > kMax + 1) {
      return out_of_range();
    }
    return static_cast<T>(static_cast<U>(0) - static_cast<U>(parsed->magnitude));
  } else {
    if (parsed->magnitude != 0) {
      return std::unexpected(
          Diagnostic::Error(
              fmt::format(
                  "negative literal '{}' for an unsigned word", text)));
    }
    return T{0};
  }
}

// Hex and binary print the full W-bit two's complement pattern
template <BuiltinInteger T>
auto FormatWord(T value, Radix radix) -> std::string {
  using U = std::make_unsigned_t<T>;
  // Widen 8-bit words so char-like types print as numbers
  using Printable = std::conditional_t<
      (sizeof(T) == 1), std::conditional_t<std::is_signed_v<T>, int, unsigned>,
      T>;
  constexpr auto kBits = WordTraits<T>::kBits;
  switch (radix) {
    case Radix::kDec:
      return fmt::format("{}", static_cast<Printable>(value));
    case Radix::kHex:
      return fmt::format("0x{:0{}x}", static_cast<U>(value), kBits / 4);
    case Radix::kBin:
      return fmt::format("0b{:0{}b}", static_cast<U>(value), kBits);
  }
  ThrowInternalError("FormatWord", "unknown radix");
}

}  // namespace primint::common
