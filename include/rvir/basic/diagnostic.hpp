// rvir/basic/diagnostic.hpp - Diagnostics for tools built on the core
//
// The core reports failures as rvir::Error values. Front ends turn them into
// Diagnostics, collected in a DiagnosticBag and rendered by
// DiagnosticPrinter.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rvir/basic/error.hpp"

namespace rvir
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,  // report-only error kinds
};

enum class LabelStyle {
  Primary,    // the value the diagnostic is about
  Secondary,  // related values
};

/// A labelled value, identified by its description
struct Label
{
  std::string subject;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "E003"
  std::string message;

  std::vector<Label> labels;
  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to its bag when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_note(std::string note);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  /// Start a tool-level error that has no core error behind it
  DiagnosticBuilder report_error(std::string message);

  /**
   * Start a diagnostic for a core error.
   *
   * The code and message come from `error`; type mismatches get labels for
   * the supplied and the expected type. Report-only kinds (AffineUsed,
   * RelevantUnused) are warnings, everything else is an error.
   */
  DiagnosticBuilder report(const Error & error);

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace rvir
