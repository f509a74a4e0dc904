#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <type_traits>

#include "primint/word.hpp"

namespace primint {

// Wrapping<T> is a builtin integer whose arithmetic wraps modulo 2^W.
// - Signed: Wrapping<int32_t> behaves like two's complement hardware,
//   INT32_MAX + 1 == INT32_MIN
// - Shift amounts are masked to the bit width, so every shift is defined
// Generic algorithms see it as a Word; their overflow behaviour follows from
// the multiply defined here.
template <BuiltinInteger T>
class Wrapping {
 public:
  using Storage = T;
  using Unsigned = std::make_unsigned_t<T>;
  static constexpr uint32_t kBits = WordTraits<T>::kBits;

  constexpr Wrapping() : value_{0} {
  }

  explicit constexpr Wrapping(T value) : value_{value} {
  }

  [[nodiscard]] constexpr auto Value() const -> T {
    return value_;
  }

  [[nodiscard]] constexpr auto operator~() const -> Wrapping {
    return Wrapping{static_cast<T>(~value_)};
  }

  // Two's complement negation; negating the minimum value yields itself
  [[nodiscard]] constexpr auto operator-() const -> Wrapping {
    return Wrapping{static_cast<T>(Unsigned{0} - Bits())};
  }

  [[nodiscard]] constexpr auto operator&(Wrapping other) const -> Wrapping {
    return Wrapping{static_cast<T>(value_ & other.value_)};
  }

  [[nodiscard]] constexpr auto operator|(Wrapping other) const -> Wrapping {
    return Wrapping{static_cast<T>(value_ | other.value_)};
  }

  [[nodiscard]] constexpr auto operator^(Wrapping other) const -> Wrapping {
    return Wrapping{static_cast<T>(value_ ^ other.value_)};
  }

  [[nodiscard]] constexpr auto operator==(Wrapping other) const -> bool {
    return value_ == other.value_;
  }

  [[nodiscard]] constexpr auto operator!=(Wrapping other) const -> bool {
    return value_ != other.value_;
  }

  [[nodiscard]] constexpr auto operator<(Wrapping other) const -> bool {
    return value_ < other.value_;
  }

  [[nodiscard]] constexpr auto operator<=(Wrapping other) const -> bool {
    return value_ <= other.value_;
  }

  [[nodiscard]] constexpr auto operator>(Wrapping other) const -> bool {
    return value_ > other.value_;
  }

  [[nodiscard]] constexpr auto operator>=(Wrapping other) const -> bool {
    return value_ >= other.value_;
  }

  // Arithmetic is done on the unsigned bit pattern, then reinterpreted
  [[nodiscard]] constexpr auto operator+(Wrapping other) const -> Wrapping {
    return Wrapping{static_cast<T>(Widen(Bits()) + Widen(other.Bits()))};
  }

  [[nodiscard]] constexpr auto operator-(Wrapping other) const -> Wrapping {
    return Wrapping{static_cast<T>(Widen(Bits()) - Widen(other.Bits()))};
  }

  [[nodiscard]] constexpr auto operator*(Wrapping other) const -> Wrapping {
    return Wrapping{WordTraits<T>::Mul(value_, other.value_)};
  }

  // Left shift is the same for signed and unsigned
  [[nodiscard]] constexpr auto operator<<(uint32_t amount) const -> Wrapping {
    return Wrapping{static_cast<T>(Widen(Bits()) << (amount & (kBits - 1)))};
  }

  // Right shift: arithmetic for signed, logical for unsigned
  [[nodiscard]] constexpr auto operator>>(uint32_t amount) const -> Wrapping {
    return Wrapping{static_cast<T>(value_ >> (amount & (kBits - 1)))};
  }

  constexpr auto operator&=(Wrapping other) -> Wrapping& {
    *this = *this & other;
    return *this;
  }

  constexpr auto operator|=(Wrapping other) -> Wrapping& {
    *this = *this | other;
    return *this;
  }

  constexpr auto operator^=(Wrapping other) -> Wrapping& {
    *this = *this ^ other;
    return *this;
  }

  constexpr auto operator+=(Wrapping other) -> Wrapping& {
    *this = *this + other;
    return *this;
  }

  constexpr auto operator-=(Wrapping other) -> Wrapping& {
    *this = *this - other;
    return *this;
  }

  constexpr auto operator*=(Wrapping other) -> Wrapping& {
    *this = *this * other;
    return *this;
  }

  constexpr auto operator<<=(uint32_t amount) -> Wrapping& {
    *this = *this << amount;
    return *this;
  }

  constexpr auto operator>>=(uint32_t amount) -> Wrapping& {
    *this = *this >> amount;
    return *this;
  }

  // Stream output; 128-bit storage has no ostream inserter
  friend auto operator<<(std::ostream& os, Wrapping w) -> std::ostream&
    requires(sizeof(T) <= 8)
  {
    if constexpr (std::is_signed_v<T>) {
      return os << static_cast<int64_t>(w.value_);
    } else {
      // Cast to largest type to avoid char interpretation for uint8_t
      return os << static_cast<uint64_t>(w.value_);
    }
  }

 private:
  using Wide =
      std::conditional_t<(sizeof(T) < sizeof(unsigned)), unsigned, Unsigned>;

  [[nodiscard]] constexpr auto Bits() const -> Unsigned {
    return static_cast<Unsigned>(value_);
  }

  static constexpr auto Widen(Unsigned bits) -> Wide {
    return static_cast<Wide>(bits);
  }

  T value_;
};

template <BuiltinInteger T>
struct WordTraits<Wrapping<T>> {
  static constexpr uint32_t kBits = WordTraits<T>::kBits;

  static constexpr auto One() -> Wrapping<T> {
    return Wrapping<T>{T{1}};
  }

  static constexpr auto Mul(Wrapping<T> lhs, Wrapping<T> rhs) -> Wrapping<T> {
    return lhs * rhs;
  }

  static constexpr auto CheckedMul(Wrapping<T> lhs, Wrapping<T> rhs)
      -> std::optional<Wrapping<T>> {
    auto product = WordTraits<T>::CheckedMul(lhs.Value(), rhs.Value());
    if (!product) {
      return std::nullopt;
    }
    return Wrapping<T>{*product};
  }

  static constexpr auto SwapBytes(Wrapping<T> value) -> Wrapping<T> {
    return Wrapping<T>{WordTraits<T>::SwapBytes(value.Value())};
  }
};

}  // namespace primint
