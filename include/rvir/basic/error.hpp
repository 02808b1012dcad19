// rvir/basic/error.hpp - Typed errors for construction and evaluation
//
// Every fallible operation of the core returns rvir::Result<T>. Errors carry
// a kind, a short detail string and, for type mismatches, both types.
//
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "rvir/graph/valid.hpp"

namespace rvir
{

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind : uint8_t {
  // Placement
  IncomparableRegions,
  ParameterOutOfRange,

  // Typing
  TypeMismatch,
  NotAType,

  // Arity
  TooManyArgs,
  NotAFunction,

  // Substructural (reported only)
  AffineUsed,
  RelevantUnused,

  // Leaf constructor validation
  InvalidIndex,
  InvalidLogical,

  // Deliberately unsupported evaluation
  Unimplemented,
};

/// Stable name of an error kind (e.g. "type mismatch")
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Diagnostic code of an error kind (e.g. "E003")
[[nodiscard]] std::string_view error_code(ErrorKind kind) noexcept;

// ============================================================================
// Error
// ============================================================================

struct Error
{
  ErrorKind kind = ErrorKind::Unimplemented;
  std::string detail;

  /// TypeMismatch: declared parameter type
  TypeId expected;
  /// TypeMismatch: supplied argument type
  TypeId actual;

  [[nodiscard]] static Error make(ErrorKind kind, std::string detail = {});

  [[nodiscard]] static Error type_mismatch(TypeId expected, TypeId actual, std::string detail = {});

  /// Human-readable one-line message ("type mismatch: <detail>")
  [[nodiscard]] std::string message() const;

  [[nodiscard]] std::string_view code() const noexcept { return error_code(kind); }
};

template <typename T>
using Result = std::expected<T, Error>;

/// Shorthand for returning an error from a Result-returning function
[[nodiscard]] inline std::unexpected<Error> fail(ErrorKind kind, std::string detail = {})
{
  return std::unexpected(Error::make(kind, std::move(detail)));
}

[[nodiscard]] inline std::unexpected<Error> fail(Error error)
{
  return std::unexpected(std::move(error));
}

}  // namespace rvir
