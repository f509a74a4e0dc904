#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "primint/common/internal_error.hpp"
#include "primint/word.hpp"

namespace primint::common {

// Concrete word types selectable at runtime (CLI, config, test cases)
enum class WordType : uint8_t {
  kU8,
  kU16,
  kU32,
  kU64,
  kU128,
  kUsize,
  kI8,
  kI16,
  kI32,
  kI64,
  kI128,
  kIsize,
};

// Output radix for printed words
enum class Radix : uint8_t { kDec, kHex, kBin };

// Accepts the short names "u8" ... "isize"
auto ParseWordType(std::string_view name) -> std::optional<WordType>;
auto ParseRadix(std::string_view name) -> std::optional<Radix>;

auto ToString(WordType type) -> std::string_view;
auto ToString(Radix radix) -> std::string_view;

auto BitWidth(WordType type) -> uint32_t;
auto IsSigned(WordType type) -> bool;

// Calls fn(std::type_identity<T>{}) with the builtin type named by `type`.
// All instantiations of fn must return the same type.
template <typename Fn>
auto VisitWordType(WordType type, Fn&& fn) -> decltype(auto) {
  switch (type) {
    case WordType::kU8:
      return std::forward<Fn>(fn)(std::type_identity<uint8_t>{});
    case WordType::kU16:
      return std::forward<Fn>(fn)(std::type_identity<uint16_t>{});
    case WordType::kU32:
      return std::forward<Fn>(fn)(std::type_identity<uint32_t>{});
    case WordType::kU64:
      return std::forward<Fn>(fn)(std::type_identity<uint64_t>{});
    case WordType::kU128:
      return std::forward<Fn>(fn)(std::type_identity<u128>{});
    case WordType::kUsize:
      return std::forward<Fn>(fn)(std::type_identity<std::size_t>{});
    case WordType::kI8:
      return std::forward<Fn>(fn)(std::type_identity<int8_t>{});
    case WordType::kI16:
      return std::forward<Fn>(fn)(std::type_identity<int16_t>{});
    case WordType::kI32:
      return std::forward<Fn>(fn)(std::type_identity<int32_t>{});
    case WordType::kI64:
      return std::forward<Fn>(fn)(std::type_identity<int64_t>{});
    case WordType::kI128:
      return std::forward<Fn>(fn)(std::type_identity<i128>{});
    case WordType::kIsize:
      return std::forward<Fn>(fn)(std::type_identity<std::ptrdiff_t>{});
  }
  ThrowInternalError("VisitWordType", "unknown word type");
}

}  // namespace primint::common
