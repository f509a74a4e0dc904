#pragma once

#include <optional>

#include <argparse/argparse.hpp>

#include "primint/common/diagnostic.hpp"
#include "primint/common/word_type.hpp"
#include "primint/config/project_config.hpp"

namespace primint::driver {

// Options shared by every subcommand after merging config and flags
struct CommandOptions {
  common::WordType type = common::WordType::kU32;
  common::Radix radix = common::Radix::kDec;
  bool colors = true;
};

// Flags override config, config overrides built-in defaults
auto ResolveOptions(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config, bool colors)
    -> Result<CommandOptions>;

auto PowCommand(const argparse::ArgumentParser& cmd, const CommandOptions& opts)
    -> int;
auto CheckedPowCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& opts) -> int;
auto ReverseBitsCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& opts) -> int;
auto BitsCommand(const argparse::ArgumentParser& cmd, const CommandOptions& opts)
    -> int;

}  // namespace primint::driver
