#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <argparse/argparse.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "primint/common/diagnostic.hpp"
#include "primint/config/project_config.hpp"

namespace {

namespace fs = std::filesystem;

constexpr int kUsageError = 2;

void AddWordFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-t", "--type")
      .help("Word type: u8 u16 u32 u64 u128 usize i8 i16 i32 i64 i128 isize");
  cmd.add_argument("--radix").help("Output radix: dec, hex or bin");
}

void SetupLogging(int verbosity, bool colors) {
  auto logger = colors ? spdlog::stderr_color_mt("primint")
                       : spdlog::stderr_logger_mt("primint");
  logger->set_pattern("[primint][%l] %v");
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(spdlog::level::warn);
  if (verbosity >= 2) {
    spdlog::set_level(spdlog::level::trace);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::debug);
  }
}

// --no-color must also apply when argument parsing itself fails
auto HasNoColorFlag(int argc, char* argv[]) -> bool {
  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == "--no-color") {
      return true;
    }
  }
  return false;
}

// Explicit --config wins over the primint.toml search
auto LoadOptionalConfig(const argparse::ArgumentParser& program)
    -> std::optional<primint::config::ProjectConfig> {
  std::optional<fs::path> config_path;
  if (auto path = program.present<std::string>("--config")) {
    config_path = fs::path(*path);
  } else {
    config_path = primint::config::FindConfig();
  }
  if (!config_path) {
    return std::nullopt;
  }
  return primint::config::LoadConfig(*config_path);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  int verbosity = 0;

  argparse::ArgumentParser program("primint", "0.1.0");
  program.add_description(
      "Generic power and bit manipulation on fixed-width integers");
  program.add_argument("--config")
      .help("Path to primint.toml (default: search upward from cwd)")
      .metavar("file");
  program.add_argument("-v", "--verbose")
      .help("Increase log verbosity (repeatable)")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0);
  program.add_argument("--no-color")
      .default_value(false)
      .implicit_value(true)
      .help("Disable colored diagnostics");

  // Subcommand: pow
  argparse::ArgumentParser pow_cmd("pow");
  pow_cmd.add_description("Wrapping exponentiation by squaring");
  pow_cmd.add_argument("base").help("Base literal");
  pow_cmd.add_argument("exp").help("Exponent (unsigned 32-bit)");
  AddWordFlags(pow_cmd);

  // Subcommand: checked-pow
  argparse::ArgumentParser checked_pow_cmd("checked-pow");
  checked_pow_cmd.add_description(
      "Exponentiation that reports overflow instead of wrapping");
  checked_pow_cmd.add_argument("base").help("Base literal");
  checked_pow_cmd.add_argument("exp").help("Exponent (unsigned 32-bit)");
  AddWordFlags(checked_pow_cmd);

  // Subcommand: reverse-bits
  argparse::ArgumentParser reverse_cmd("reverse-bits");
  reverse_cmd.add_description("Reverse the bit order of a word");
  reverse_cmd.add_argument("value").help("Value literal");
  reverse_cmd.add_argument("--fallback")
      .default_value(false)
      .implicit_value(true)
      .help("Use the portable byte-swap fallback even if a builtin exists");
  AddWordFlags(reverse_cmd);

  // Subcommand: bits
  argparse::ArgumentParser bits_cmd("bits");
  bits_cmd.add_description("Show counting, rotation, shift and byte order ops");
  bits_cmd.add_argument("value").help("Value literal");
  bits_cmd.add_argument("--shift")
      .default_value(std::string("1"))
      .help("Amount used for rotations and shifts");
  AddWordFlags(bits_cmd);

  program.add_subparser(pow_cmd);
  program.add_subparser(checked_pow_cmd);
  program.add_subparser(reverse_cmd);
  program.add_subparser(bits_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    primint::PrintDiagnostic(
        primint::Diagnostic::Error(err.what()), !HasNoColorFlag(argc, argv));
    std::cerr << program;
    return kUsageError;
  }

  bool colors = !program.get<bool>("--no-color");
  SetupLogging(verbosity, colors);

  std::optional<primint::config::ProjectConfig> config;
  try {
    config = LoadOptionalConfig(program);
  } catch (const primint::DiagnosticException& e) {
    primint::PrintDiagnostic(e.GetDiagnostic(), colors);
    return 1;
  }
  if (config) {
    spdlog::debug("loaded config {}", config->source.string());
    // -v on the command line beats the configured level
    if (config->log_level && verbosity == 0) {
      spdlog::set_level(*config->log_level);
    }
  }

  auto dispatch = [&](const argparse::ArgumentParser& cmd, auto command) {
    auto opts = primint::driver::ResolveOptions(cmd, config, colors);
    if (!opts) {
      primint::PrintDiagnostic(opts.error(), colors);
      return 1;
    }
    return command(cmd, *opts);
  };

  if (program.is_subcommand_used("pow")) {
    return dispatch(pow_cmd, primint::driver::PowCommand);
  }
  if (program.is_subcommand_used("checked-pow")) {
    return dispatch(checked_pow_cmd, primint::driver::CheckedPowCommand);
  }
  if (program.is_subcommand_used("reverse-bits")) {
    return dispatch(reverse_cmd, primint::driver::ReverseBitsCommand);
  }
  if (program.is_subcommand_used("bits")) {
    return dispatch(bits_cmd, primint::driver::BitsCommand);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
