// rvir/basic/diagnostic_printer.hpp
//
// Prints diagnostics in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "rvir/basic/diagnostic.hpp"

namespace rvir
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E003]: type mismatch: argument #0 of a logical operator
 *     --> #finite(16)
 *       |
 *       = expected type: #bool
 *       = note: while evaluating the multiplexer
 *       = help: pass a boolean
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, in insertion order.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label);
  void print_note(std::string_view message);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_equals() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace rvir
