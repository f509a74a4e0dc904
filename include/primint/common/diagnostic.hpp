#pragma once

#include <exception>
#include <expected>
#include <string>
#include <utility>

namespace primint {

enum class DiagnosticSeverity { kNote, kWarning, kError };

struct Diagnostic {
  DiagnosticSeverity severity;
  std::string message;

  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .severity = DiagnosticSeverity::kError, .message = std::move(msg)};
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .severity = DiagnosticSeverity::kWarning, .message = std::move(msg)};
  }

  static auto Note(std::string msg) -> Diagnostic {
    return Diagnostic{
        .severity = DiagnosticSeverity::kNote, .message = std::move(msg)};
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Print "severity: message" to stderr
void PrintDiagnostic(const Diagnostic& diag, bool colors = true);

}  // namespace primint
