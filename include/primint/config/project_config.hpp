#pragma once

#include <filesystem>
#include <optional>

#include <spdlog/common.h>

#include "primint/common/word_type.hpp"

namespace primint::config {

// Defaults read from primint.toml. Every field is optional; command line
// flags take precedence over all of them.
struct ProjectConfig {
  std::optional<common::WordType> type;
  std::optional<common::Radix> radix;
  std::optional<spdlog::level::level_enum> log_level;

  // Path of the primint.toml the values came from
  std::filesystem::path source;
};

// Search for primint.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse primint.toml file
// Throws DiagnosticException on parse errors or invalid values
auto LoadConfig(const std::filesystem::path& config_path) -> ProjectConfig;

}  // namespace primint::config
