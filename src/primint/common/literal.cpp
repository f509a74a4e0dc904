#include "primint/common/literal.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/core.h>

#include "primint/common/diagnostic.hpp"
#include "primint/word.hpp"

namespace primint::common {

namespace {

auto DigitValue(char chr) -> std::optional<uint32_t> {
  if (chr >= '0' && chr <= '9') {
    return static_cast<uint32_t>(chr - '0');
  }
  if (chr >= 'a' && chr <= 'f') {
    return static_cast<uint32_t>(chr - 'a' + 10);
  }
  if (chr >= 'A' && chr <= 'F') {
    return static_cast<uint32_t>(chr - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

auto ParseMagnitude(std::string_view text) -> Result<ParsedLiteral> {
  auto invalid = [&](std::string_view why) {
    return std::unexpected(
        Diagnostic::Error(
            fmt::format("invalid integer literal '{}': {}", text, why)));
  };

  ParsedLiteral result;
  std::string_view rest = text;
  if (!rest.empty() && (rest.front() == '+' || rest.front() == '-')) {
    result.negative = rest.front() == '-';
    rest.remove_prefix(1);
  }

  uint32_t base = 10;
  if (rest.starts_with("0x") || rest.starts_with("0X")) {
    base = 16;
    rest.remove_prefix(2);
  } else if (rest.starts_with("0b") || rest.starts_with("0B")) {
    base = 2;
    rest.remove_prefix(2);
  }

  if (rest.empty()) {
    return invalid("no digits");
  }
  if (rest.front() == '_' || rest.back() == '_') {
    return invalid("separator must sit between digits");
  }

  using Traits = WordTraits<u128>;
  bool any_digit = false;
  for (char chr : rest) {
    if (chr == '_') {
      continue;
    }
    auto digit = DigitValue(chr);
    if (!digit || *digit >= base) {
      return invalid(fmt::format("unexpected character '{}'", chr));
    }
    auto scaled = Traits::CheckedMul(result.magnitude, u128{base});
    if (!scaled) {
      return invalid("magnitude exceeds 128 bits");
    }
    u128 next = 0;
    if (__builtin_add_overflow(*scaled, u128{*digit}, &next)) {
      return invalid("magnitude exceeds 128 bits");
    }
    result.magnitude = next;
    any_digit = true;
  }
  if (!any_digit) {
    return invalid("no digits");
  }
  return result;
}

}  // namespace primint::common
