#pragma once

// Portable bit reversal for Words without a native reverse-bits instruction.
//
// Byte swap reverses the byte order in one step; after that each byte is
// reversed on its own with three fixed swap rounds (nibbles, bit pairs,
// single bits). The masks for those rounds are built from the literal 1, so
// the same code serves every width.

#include <cstdint>

#include "primint/word.hpp"

namespace primint {

// Word with bit 0 of every byte set, e.g. 0x01010101 for 32 bits
template <Word T>
constexpr auto OnePerByte() -> T {
  auto ret = WordTraits<T>::One();
  uint32_t shift = 8;
  // zero bits of `one`, in bytes: (W / 8) - 1
  uint32_t remaining = (WordTraits<T>::kBits - 1) >> 3;
  while (remaining != 0) {
    ret = static_cast<T>((ret << shift) | ret);
    shift <<= 1;
    remaining >>= 1;
  }
  return ret;
}

template <Word T>
constexpr auto ReverseBitsFallback(T value) -> T {
  const auto rep_01 = OnePerByte<T>();
  const auto rep_03 = static_cast<T>((rep_01 << 1U) | rep_01);
  const auto rep_05 = static_cast<T>((rep_01 << 2U) | rep_01);
  const auto rep_0f = static_cast<T>((rep_03 << 2U) | rep_03);
  const auto rep_33 = static_cast<T>((rep_03 << 4U) | rep_03);
  const auto rep_55 = static_cast<T>((rep_05 << 4U) | rep_05);

  auto ret = WordTraits<T>::SwapBytes(value);
  ret = static_cast<T>(
      static_cast<T>(static_cast<T>(ret & rep_0f) << 4U) |
      static_cast<T>(static_cast<T>(ret >> 4U) & rep_0f));
  ret = static_cast<T>(
      static_cast<T>(static_cast<T>(ret & rep_33) << 2U) |
      static_cast<T>(static_cast<T>(ret >> 2U) & rep_33));
  ret = static_cast<T>(
      static_cast<T>(static_cast<T>(ret & rep_55) << 1U) |
      static_cast<T>(static_cast<T>(ret >> 1U) & rep_55));
  return ret;
}

}  // namespace primint
