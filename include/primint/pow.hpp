#pragma once

// Exponentiation by squaring over any Word.
//
// Both variants run the same two phases:
//   1. strip trailing zero bits of the exponent, squaring the base once per
//      bit;
//   2. square-and-accumulate over the remaining bits.
// Pow uses the Word's own multiply, so whether it wraps is decided by the
// Word type, never here. CheckedPow stops at the first multiply that does
// not fit.
//
// By convention Pow(0, 0) == 1.

#include <cstdint>
#include <optional>

#include "primint/word.hpp"

namespace primint {

template <Word T>
constexpr auto Pow(T base, uint32_t exp) -> T {
  using Traits = WordTraits<T>;
  if (exp == 0) {
    return Traits::One();
  }

  while ((exp & 1U) == 0) {
    base = Traits::Mul(base, base);
    exp >>= 1;
  }
  if (exp == 1) {
    return base;
  }

  T acc = base;
  while (exp > 1) {
    exp >>= 1;
    base = Traits::Mul(base, base);
    if ((exp & 1U) == 1) {
      acc = Traits::Mul(acc, base);
    }
  }
  return acc;
}

template <Word T>
constexpr auto CheckedPow(T base, uint32_t exp) -> std::optional<T> {
  using Traits = WordTraits<T>;
  if (exp == 0) {
    return Traits::One();
  }

  while ((exp & 1U) == 0) {
    auto squared = Traits::CheckedMul(base, base);
    if (!squared) {
      return std::nullopt;
    }
    base = *squared;
    exp >>= 1;
  }
  if (exp == 1) {
    return base;
  }

  T acc = base;
  while (exp > 1) {
    exp >>= 1;
    auto squared = Traits::CheckedMul(base, base);
    if (!squared) {
      return std::nullopt;
    }
    base = *squared;
    if ((exp & 1U) == 1) {
      auto product = Traits::CheckedMul(acc, base);
      if (!product) {
        return std::nullopt;
      }
      acc = *product;
    }
  }
  return acc;
}

}  // namespace primint
