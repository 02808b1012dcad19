// rvir/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "rvir/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace rvir
{

namespace
{

const char * severity_name(Severity severity)
{
  return severity == Severity::Warning ? "warning" : "error";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Subject line: --> primary value ===
  if (const Label * primary = diag.primary_label()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), primary->subject);
  }

  if (!diag.labels.empty() || !diag.notes.empty() || diag.help_message) {
    fmt::print(os_, "{}\n", gutter_pipe());
  }

  // === Labels ===
  for (const auto & label : diag.labels) {
    print_label(label);
  }

  // === Notes ===
  for (const auto & note : diag.notes) {
    print_note(note);
  }

  // === Help message ===
  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  for (const auto & d : diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold
        << (diag.severity == Severity::Warning ? rang::fg::yellow : rang::fg::red);
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label)
{
  if (label.message.empty()) {
    return;
  }
  if (use_color_ && label.style == LabelStyle::Primary) {
    os_ << gutter_equals() << rang::fg::red << rang::style::bold << label.message
        << rang::style::reset << rang::fg::reset;
    fmt::print(os_, ": {}\n", label.subject);
    return;
  }
  fmt::print(os_, "{}{}: {}\n", gutter_equals(), label.message, label.subject);
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}note: {}\n", gutter_equals(), message);
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}help: {}\n", gutter_equals(), message);
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_equals() const
{
  if (use_color_) {
    return fmt::format("{}      = {}", "\033[1;36m", "\033[0m");
  }
  return "      = ";
}

}  // namespace rvir
