#include "primint/common/word_type.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace primint::common {

namespace {

constexpr std::array<std::pair<std::string_view, WordType>, 12> kWordTypeNames =
    {{
        {"u8", WordType::kU8},
        {"u16", WordType::kU16},
        {"u32", WordType::kU32},
        {"u64", WordType::kU64},
        {"u128", WordType::kU128},
        {"usize", WordType::kUsize},
        {"i8", WordType::kI8},
        {"i16", WordType::kI16},
        {"i32", WordType::kI32},
        {"i64", WordType::kI64},
        {"i128", WordType::kI128},
        {"isize", WordType::kIsize},
    }};

}  // namespace

auto ParseWordType(std::string_view name) -> std::optional<WordType> {
  for (const auto& [text, type] : kWordTypeNames) {
    if (text == name) {
      return type;
    }
  }
  return std::nullopt;
}

auto ParseRadix(std::string_view name) -> std::optional<Radix> {
  if (name == "dec") {
    return Radix::kDec;
  }
  if (name == "hex") {
    return Radix::kHex;
  }
  if (name == "bin") {
    return Radix::kBin;
  }
  return std::nullopt;
}

auto ToString(WordType type) -> std::string_view {
  for (const auto& [text, candidate] : kWordTypeNames) {
    if (candidate == type) {
      return text;
    }
  }
  ThrowInternalError("ToString(WordType)", "unknown word type");
}

auto ToString(Radix radix) -> std::string_view {
  switch (radix) {
    case Radix::kDec:
      return "dec";
    case Radix::kHex:
      return "hex";
    case Radix::kBin:
      return "bin";
  }
  ThrowInternalError("ToString(Radix)", "unknown radix");
}

auto BitWidth(WordType type) -> uint32_t {
  return VisitWordType(type, []<typename T>(std::type_identity<T>) {
    return WordTraits<T>::kBits;
  });
}

auto IsSigned(WordType type) -> bool {
  return VisitWordType(type, []<typename T>(std::type_identity<T>) {
    return std::is_signed_v<T>;
  });
}

}  // namespace primint::common
