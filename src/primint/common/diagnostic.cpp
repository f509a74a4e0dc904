#include "primint/common/diagnostic.hpp"

#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

namespace primint {

namespace {

auto GetSeverityString(DiagnosticSeverity severity) -> std::string_view {
  switch (severity) {
    case DiagnosticSeverity::kNote:
      return "note";
    case DiagnosticSeverity::kWarning:
      return "warning";
    case DiagnosticSeverity::kError:
      return "error";
  }
  return "unknown";
}

auto GetSeverityColor(DiagnosticSeverity severity) -> fmt::terminal_color {
  switch (severity) {
    case DiagnosticSeverity::kNote:
      return fmt::terminal_color::bright_black;
    case DiagnosticSeverity::kWarning:
      return fmt::terminal_color::bright_yellow;
    case DiagnosticSeverity::kError:
      return fmt::terminal_color::bright_red;
  }
  return fmt::terminal_color::white;
}

}  // namespace

void PrintDiagnostic(const Diagnostic& diag, bool colors) {
  auto severity_color = GetSeverityColor(diag.severity);
  auto severity_string = GetSeverityString(diag.severity);

  if (colors) {
    fmt::print(
        stderr, "{}: {}\n",
        fmt::styled(severity_string, fmt::fg(severity_color)),
        fmt::styled(diag.message, fmt::emphasis::bold));
  } else {
    fmt::print(stderr, "{}: {}\n", severity_string, diag.message);
  }
}

}  // namespace primint
