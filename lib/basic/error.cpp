// rvir/basic/error.cpp - Error kinds and messages
#include "rvir/basic/error.hpp"

#include <utility>

namespace rvir
{

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::IncomparableRegions:
      return "incomparable regions";
    case ErrorKind::ParameterOutOfRange:
      return "parameter index out of range";
    case ErrorKind::TypeMismatch:
      return "type mismatch";
    case ErrorKind::NotAType:
      return "not a type";
    case ErrorKind::TooManyArgs:
      return "too many arguments";
    case ErrorKind::NotAFunction:
      return "not a function";
    case ErrorKind::AffineUsed:
      return "affine value used more than once";
    case ErrorKind::RelevantUnused:
      return "relevant value never used";
    case ErrorKind::InvalidIndex:
      return "invalid index";
    case ErrorKind::InvalidLogical:
      return "invalid logical operation";
    case ErrorKind::Unimplemented:
      return "unimplemented";
  }
  return "unknown error";
}

std::string_view error_code(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::IncomparableRegions:
      return "E001";
    case ErrorKind::ParameterOutOfRange:
      return "E002";
    case ErrorKind::TypeMismatch:
      return "E003";
    case ErrorKind::NotAType:
      return "E004";
    case ErrorKind::TooManyArgs:
      return "E005";
    case ErrorKind::NotAFunction:
      return "E006";
    case ErrorKind::AffineUsed:
      return "E007";
    case ErrorKind::RelevantUnused:
      return "E008";
    case ErrorKind::InvalidIndex:
      return "E009";
    case ErrorKind::InvalidLogical:
      return "E010";
    case ErrorKind::Unimplemented:
      return "E099";
  }
  return "E000";
}

Error Error::make(ErrorKind kind, std::string detail)
{
  Error e;
  e.kind = kind;
  e.detail = std::move(detail);
  return e;
}

Error Error::type_mismatch(TypeId expected, TypeId actual, std::string detail)
{
  Error e = make(ErrorKind::TypeMismatch, std::move(detail));
  e.expected = std::move(expected);
  e.actual = std::move(actual);
  return e;
}

std::string Error::message() const
{
  std::string msg(to_string(kind));
  if (!detail.empty()) {
    msg += ": ";
    msg += detail;
  }
  return msg;
}

}  // namespace rvir
