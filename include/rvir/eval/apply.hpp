// rvir/eval/apply.hpp - Application protocol
//
// Applying a value to arguments either succeeds (a value plus the arguments
// it did not consume) or is stuck, in which case only the type of the
// application is known. Being stuck is an ordinary outcome, not an error.
//
#pragma once

#include <gsl/span>
#include <utility>
#include <vector>

#include "rvir/basic/error.hpp"
#include "rvir/eval/eval_ctx.hpp"
#include "rvir/graph/valid.hpp"

namespace rvir
{

/**
 * Outcome of an application.
 */
class ApplyResult
{
public:
  /// Application cannot reduce; `ty` is the type of the application
  [[nodiscard]] static ApplyResult symbolic(TypeId ty)
  {
    ApplyResult r;
    r.type_ = std::move(ty);
    r.symbolic_ = true;
    return r;
  }

  /// Application reduced to `value`; `rest` are the unconsumed arguments
  [[nodiscard]] static ApplyResult success(ValId value, std::vector<ValId> rest = {})
  {
    ApplyResult r;
    r.type_ = value.ty();
    r.value_ = std::move(value);
    r.rest_ = std::move(rest);
    return r;
  }

  [[nodiscard]] bool is_symbolic() const noexcept { return symbolic_; }
  [[nodiscard]] bool is_success() const noexcept { return !symbolic_; }

  /// Type of the application (of the value on success)
  [[nodiscard]] const TypeId & type() const noexcept { return type_; }

  /// Reduced value; empty when symbolic
  [[nodiscard]] const ValId & value() const noexcept { return value_; }

  [[nodiscard]] const std::vector<ValId> & rest() const noexcept { return rest_; }

private:
  ApplyResult() = default;

  TypeId type_;
  ValId value_;
  std::vector<ValId> rest_;
  bool symbolic_ = false;
};

/**
 * Apply `fn` once to `args`.
 *
 * Consumes as many arguments as `fn` binds; the surplus is returned in
 * ApplyResult::rest(). Fewer arguments than parameters is symbolic.
 *
 * @return The outcome, or TypeMismatch / NotAFunction / TooManyArgs /
 *         Unimplemented. `ctx` is left as it was on entry.
 */
[[nodiscard]] Result<ApplyResult> apply(
  EvalCtx & ctx, const ValId & fn, gsl::span<const ValId> args);

/**
 * Apply `fn` to `args`, re-applying the produced value to unconsumed
 * arguments until they are exhausted, the result stops changing, or the
 * application becomes stuck.
 *
 * @return The outcome; a non-function left with arguments is TooManyArgs
 */
[[nodiscard]] Result<ApplyResult> curried(
  EvalCtx & ctx, const ValId & fn, gsl::span<const ValId> args);

/**
 * Type of applying a value of function type `fn_ty` to `args`.
 *
 * With fewer arguments than parameters the result is a Pi over the
 * remaining parameters, with the supplied arguments substituted.
 */
[[nodiscard]] Result<TypeId> apply_ty(
  EvalCtx & ctx, const TypeId & fn_ty, gsl::span<const ValId> args);

}  // namespace rvir
