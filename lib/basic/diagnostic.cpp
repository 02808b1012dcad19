// rvir/basic/diagnostic.cpp - Diagnostic implementation
#include "rvir/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

#include "rvir/graph/describe.hpp"

namespace rvir
{

namespace
{

Severity severity_of(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::AffineUsed:
    case ErrorKind::RelevantUnused:
      return Severity::Warning;
    default:
      return Severity::Error;
  }
}

}  // namespace

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(std::string message)
{
  Diagnostic d;
  d.message = std::move(message);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report(const Error & error)
{
  Diagnostic d;
  d.severity = severity_of(error.kind);
  d.code = std::string(error.code());
  d.message = error.message();
  if (error.kind == ErrorKind::TypeMismatch) {
    d.labels.push_back(Label{describe(error.actual), "supplied type", LabelStyle::Primary});
    d.labels.push_back(Label{describe(error.expected), "expected type", LabelStyle::Secondary});
  }
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

}  // namespace rvir
