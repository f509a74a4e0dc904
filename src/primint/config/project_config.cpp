#include "primint/config/project_config.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <spdlog/common.h>

#include "primint/common/diagnostic.hpp"
#include "primint/common/word_type.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace primint::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 6>
    kLogLevels = {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off},
    }};

auto ParseLogLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
  for (const auto& [text, level] : kLogLevels) {
    if (text == name) {
      return level;
    }
  }
  return std::nullopt;
}

[[noreturn]] void ThrowInvalidValue(
    const fs::path& config_path, std::string_view key, std::string_view value,
    std::string_view expected) {
  throw DiagnosticException(
      Diagnostic::Error(
          fmt::format(
              "{}: invalid value '{}' for '{}' (expected {})",
              config_path.string(), value, key, expected)));
}

[[noreturn]] void ThrowWrongType(
    const fs::path& config_path, std::string_view key,
    std::string_view expected) {
  throw DiagnosticException(
      Diagnostic::Error(
          fmt::format(
              "{}: '{}' must be a {}", config_path.string(), key, expected)));
}

// String value of `key`, nullopt when absent; any other TOML type is an error
auto ReadString(
    toml::node_view<toml::node> node, const fs::path& config_path,
    std::string_view key) -> std::optional<std::string> {
  if (!node) {
    return std::nullopt;
  }
  auto text = node.value_exact<std::string>();
  if (!text) {
    ThrowWrongType(config_path, key, "string");
  }
  return text;
}

// Section table, nullptr when absent; any other TOML type is an error
auto ReadSection(
    toml::table& tbl, const fs::path& config_path, std::string_view name)
    -> toml::table* {
  auto* node = tbl.get(name);
  if (node == nullptr) {
    return nullptr;
  }
  auto* section = node->as_table();
  if (section == nullptr) {
    ThrowWrongType(config_path, name, "table");
  }
  return section;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "primint.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> ProjectConfig {
  ProjectConfig config;
  config.source = config_path;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    throw DiagnosticException(
        Diagnostic::Error(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [defaults] section (optional)
  if (auto* defaults = ReadSection(tbl, config_path, "defaults")) {
    if (auto type =
            ReadString((*defaults)["type"], config_path, "defaults.type")) {
      config.type = common::ParseWordType(*type);
      if (!config.type) {
        ThrowInvalidValue(
            config_path, "defaults.type", *type,
            "u8, u16, u32, u64, u128, usize or their i* forms");
      }
    }
    if (auto radix =
            ReadString((*defaults)["radix"], config_path, "defaults.radix")) {
      config.radix = common::ParseRadix(*radix);
      if (!config.radix) {
        ThrowInvalidValue(
            config_path, "defaults.radix", *radix, "dec, hex or bin");
      }
    }
  }

  // [log] section (optional)
  if (auto* log = ReadSection(tbl, config_path, "log")) {
    if (auto level = ReadString((*log)["level"], config_path, "log.level")) {
      config.log_level = ParseLogLevel(*level);
      if (!config.log_level) {
        ThrowInvalidValue(
            config_path, "log.level", *level,
            "trace, debug, info, warn, error or off");
      }
    }
  }

  return config;
}

}  // namespace primint::config
