#pragma once

// Per-type primitive operations for builtin integers.
//
// Every function here is a thin forwarder onto a standard library or
// compiler primitive, written once for all widths. Counting and rotation go
// through the unsigned counterpart so signed inputs are treated as their
// two's complement bit pattern.

#include <bit>
#include <cstdint>
#include <type_traits>

#include "primint/pow.hpp"
#include "primint/reverse_bits.hpp"
#include "primint/word.hpp"

#if defined(__has_builtin)
#if __has_builtin(__builtin_bitreverse64)
#define PRIMINT_HAS_BUILTIN_BITREVERSE 1
#endif
#endif

namespace primint {

namespace detail {

template <BuiltinInteger T>
constexpr auto AsUnsigned(T value) -> std::make_unsigned_t<T> {
  return static_cast<std::make_unsigned_t<T>>(value);
}

// Shift counts are reduced modulo the bit width
template <BuiltinInteger T>
constexpr auto ShiftCount(uint32_t n) -> uint32_t {
  return n % WordTraits<T>::kBits;
}

}  // namespace detail

template <BuiltinInteger T>
constexpr auto CountOnes(T value) -> uint32_t {
  return static_cast<uint32_t>(std::popcount(detail::AsUnsigned(value)));
}

template <BuiltinInteger T>
constexpr auto CountZeros(T value) -> uint32_t {
  return WordTraits<T>::kBits - CountOnes(value);
}

template <BuiltinInteger T>
constexpr auto LeadingZeros(T value) -> uint32_t {
  return static_cast<uint32_t>(std::countl_zero(detail::AsUnsigned(value)));
}

template <BuiltinInteger T>
constexpr auto LeadingOnes(T value) -> uint32_t {
  return static_cast<uint32_t>(std::countl_one(detail::AsUnsigned(value)));
}

template <BuiltinInteger T>
constexpr auto TrailingZeros(T value) -> uint32_t {
  return static_cast<uint32_t>(std::countr_zero(detail::AsUnsigned(value)));
}

template <BuiltinInteger T>
constexpr auto TrailingOnes(T value) -> uint32_t {
  return static_cast<uint32_t>(std::countr_one(detail::AsUnsigned(value)));
}

template <BuiltinInteger T>
constexpr auto RotateLeft(T value, uint32_t n) -> T {
  return static_cast<T>(std::rotl(
      detail::AsUnsigned(value), static_cast<int>(detail::ShiftCount<T>(n))));
}

template <BuiltinInteger T>
constexpr auto RotateRight(T value, uint32_t n) -> T {
  return static_cast<T>(std::rotr(
      detail::AsUnsigned(value), static_cast<int>(detail::ShiftCount<T>(n))));
}

// Shift as the signed counterpart: right shift replicates the sign bit
template <BuiltinInteger T>
constexpr auto SignedShl(T value, uint32_t n) -> T {
  using S = std::make_signed_t<T>;
  return static_cast<T>(
      static_cast<S>(static_cast<S>(value) << detail::ShiftCount<T>(n)));
}

template <BuiltinInteger T>
constexpr auto SignedShr(T value, uint32_t n) -> T {
  using S = std::make_signed_t<T>;
  return static_cast<T>(
      static_cast<S>(static_cast<S>(value) >> detail::ShiftCount<T>(n)));
}

// Shift as the unsigned counterpart: right shift fills with zeros
template <BuiltinInteger T>
constexpr auto UnsignedShl(T value, uint32_t n) -> T {
  using U = std::make_unsigned_t<T>;
  return static_cast<T>(
      static_cast<U>(detail::AsUnsigned(value) << detail::ShiftCount<T>(n)));
}

template <BuiltinInteger T>
constexpr auto UnsignedShr(T value, uint32_t n) -> T {
  using U = std::make_unsigned_t<T>;
  return static_cast<T>(
      static_cast<U>(detail::AsUnsigned(value) >> detail::ShiftCount<T>(n)));
}

template <BuiltinInteger T>
constexpr auto SwapBytes(T value) -> T {
  return WordTraits<T>::SwapBytes(value);
}

// True when ReverseBits<T> lowers to a compiler bit-reverse builtin
template <BuiltinInteger T>
inline constexpr bool kHasNativeReverseBits =
#if defined(PRIMINT_HAS_BUILTIN_BITREVERSE)
    sizeof(T) <= 8;
#else
    false;
#endif

template <BuiltinInteger T>
constexpr auto ReverseBits(T value) -> T {
#if defined(PRIMINT_HAS_BUILTIN_BITREVERSE)
  if constexpr (sizeof(T) == 1) {
    return static_cast<T>(__builtin_bitreverse8(static_cast<uint8_t>(value)));
  } else if constexpr (sizeof(T) == 2) {
    return static_cast<T>(__builtin_bitreverse16(static_cast<uint16_t>(value)));
  } else if constexpr (sizeof(T) == 4) {
    return static_cast<T>(__builtin_bitreverse32(static_cast<uint32_t>(value)));
  } else if constexpr (sizeof(T) == 8) {
    return static_cast<T>(__builtin_bitreverse64(static_cast<uint64_t>(value)));
  } else {
    return ReverseBitsFallback(value);
  }
#else
  return ReverseBitsFallback(value);
#endif
}

// Endianness conversions relative to the host byte order
template <BuiltinInteger T>
constexpr auto ToBe(T value) -> T {
  if constexpr (std::endian::native == std::endian::big) {
    return value;
  } else {
    return SwapBytes(value);
  }
}

template <BuiltinInteger T>
constexpr auto ToLe(T value) -> T {
  if constexpr (std::endian::native == std::endian::little) {
    return value;
  } else {
    return SwapBytes(value);
  }
}

template <BuiltinInteger T>
constexpr auto FromBe(T value) -> T {
  return ToBe(value);
}

template <BuiltinInteger T>
constexpr auto FromLe(T value) -> T {
  return ToLe(value);
}

}  // namespace primint
