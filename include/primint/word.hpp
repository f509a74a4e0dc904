#pragma once

// Word capability shared by the generic algorithms.
//
// A Word is a fixed-width binary integer. The algorithms in pow.hpp and
// reverse_bits.hpp only see it through WordTraits<T> plus the bitwise and
// shift operators, so any type that specializes WordTraits (builtin integers,
// Wrapping<T>) can be passed to them.

#include <bit>
#include <concepts>
#include <cstdint>
#include <optional>
#include <type_traits>

namespace primint {

// 128-bit words are a GNU extension on both GCC and Clang
using i128 = __int128;
using u128 = unsigned __int128;

template <typename T>
concept BuiltinInteger = std::is_integral_v<T> && !std::is_same_v<T, bool>;

// Customization point: specialize for every type usable as a Word.
template <typename T>
struct WordTraits;

template <BuiltinInteger T>
struct WordTraits<T> {
  using Unsigned = std::make_unsigned_t<T>;
  static constexpr uint32_t kBits = sizeof(T) * 8;

  static constexpr auto One() -> T {
    return T{1};
  }

  // Two's complement wrapping multiply. Operands narrower than unsigned int
  // are widened first so the promoted product cannot overflow a signed int.
  static constexpr auto Mul(T lhs, T rhs) -> T {
    using Wide = std::conditional_t<
        (sizeof(T) < sizeof(unsigned)), unsigned, Unsigned>;
    return static_cast<T>(
        static_cast<Wide>(static_cast<Unsigned>(lhs)) *
        static_cast<Wide>(static_cast<Unsigned>(rhs)));
  }

  // Exact product, or nullopt when it does not fit in T
  static constexpr auto CheckedMul(T lhs, T rhs) -> std::optional<T> {
    T result{};
    if (__builtin_mul_overflow(lhs, rhs, &result)) {
      return std::nullopt;
    }
    return result;
  }

  static constexpr auto SwapBytes(T value) -> T {
    return std::byteswap(value);
  }
};

template <typename T>
concept Word = std::copyable<T> && std::equality_comparable<T> &&
               requires(T lhs, T rhs, uint32_t shift) {
                 { WordTraits<T>::kBits } -> std::convertible_to<uint32_t>;
                 { WordTraits<T>::One() } -> std::same_as<T>;
                 { WordTraits<T>::Mul(lhs, rhs) } -> std::same_as<T>;
                 {
                   WordTraits<T>::CheckedMul(lhs, rhs)
                 } -> std::same_as<std::optional<T>>;
                 { WordTraits<T>::SwapBytes(lhs) } -> std::same_as<T>;
                 { lhs & rhs } -> std::convertible_to<T>;
                 { lhs | rhs } -> std::convertible_to<T>;
                 { lhs << shift } -> std::convertible_to<T>;
                 { lhs >> shift } -> std::convertible_to<T>;
               };

}  // namespace primint
