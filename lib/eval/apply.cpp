// rvir/eval/apply.cpp - Application protocol
#include "rvir/eval/apply.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

#include "rvir/graph/function.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/graph/primitive.hpp"

namespace rvir
{

namespace
{

std::vector<ValId> tail(gsl::span<const ValId> args, size_t from)
{
  if (from >= args.size()) {
    return {};
  }
  return {args.begin() + static_cast<std::ptrdiff_t>(from), args.end()};
}

/// Stuck application of a value of Pi type
Result<ApplyResult> symbolic_by_type(
  EvalCtx & ctx, const ValId & fn, gsl::span<const ValId> args)
{
  if (!fn.ty() || !fn.ty()->is<Pi>()) {
    return fail(
      ErrorKind::NotAFunction, fmt::format("cannot apply a {} value", to_string(fn->kind())));
  }
  auto ty = apply_ty(ctx, fn.ty(), args);
  if (!ty) {
    return fail(std::move(ty.error()));
  }
  return ApplyResult::symbolic(std::move(*ty));
}

class Applier
{
public:
  Applier(EvalCtx & ctx, const ValId & fn, gsl::span<const ValId> args)
  : ctx_(ctx), fn_(fn), args_(args)
  {
  }

  Result<ApplyResult> operator()(const Lambda & l)
  {
    const Region & def = l.def_region;
    if (args_.size() < def.size()) {
      return symbolic_by_type(ctx_, fn_, args_);
    }

    ValId value;
    {
      ScopeGuard scope(ctx_);
      auto image = ctx_.push_region(def, args_);
      if (!image) {
        return fail(std::move(image.error()));
      }
      if (l.result.depth() < def.depth()) {
        // Constant abstraction: the body cannot see the parameters
        value = l.result;
      } else {
        auto result = ctx_.evaluate(l.result);
        if (!result) {
          return fail(std::move(result.error()));
        }
        value = std::move(*result);
      }
    }
    return ApplyResult::success(std::move(value), tail(args_, def.size()));
  }

  Result<ApplyResult> operator()(const Ternary & t)
  {
    const ValId & selector = args_[0];
    const TypeId bool_ty = make_bool_type(ctx_.store());
    if (selector.ty() != bool_ty) {
      return fail(
        Error::type_mismatch(bool_ty, selector.ty(), "selector argument must be a bool"));
    }
    if (const auto * b = selector->as<Bool>()) {
      return ApplyResult::success(b->value ? t.high() : t.low(), tail(args_, 1));
    }
    return symbolic_by_type(ctx_, fn_, args_);
  }

  Result<ApplyResult> operator()(const Logical & l)
  {
    ValueStore & store = ctx_.store();
    const TypeId bool_ty = make_bool_type(store);

    Logical current = l;
    size_t consumed = 0;
    for (; consumed < args_.size() && current.arity > 0; ++consumed) {
      const ValId & arg = args_[consumed];
      if (arg.ty() != bool_ty) {
        return fail(Error::type_mismatch(
          bool_ty, arg.ty(), fmt::format("argument #{} of a logical operator", consumed)));
      }
      if (const auto * b = arg->as<Bool>()) {
        current = logical_apply(current, b->value);
        continue;
      }
      const Logical on_true = logical_apply(current, true);
      const Logical on_false = logical_apply(current, false);
      if (on_true != on_false) {
        return symbolic_by_type(ctx_, fn_, args_);
      }
      // Result does not depend on this argument
      current = on_true;
    }

    if (current.arity == 0) {
      return ApplyResult::success(
        make_bool(store, (current.table & 1) != 0), tail(args_, consumed));
    }
    auto partial = make_logical(store, current.arity, current.table);
    if (!partial) {
      return fail(std::move(partial.error()));
    }
    return ApplyResult::success(std::move(*partial), tail(args_, consumed));
  }

  Result<ApplyResult> operator()(const Tuple & t)
  {
    ValueStore & store = ctx_.store();
    const ValId & ix = args_[0];
    const TypeId finite = make_finite(store, t.elements.size());
    if (ix.ty() != finite) {
      return fail(
        Error::type_mismatch(finite, ix.ty(), "tuple projection needs a matching index"));
    }
    if (const auto * i = ix->as<Index>()) {
      return ApplyResult::success(t.elements[i->index], tail(args_, 1));
    }

    // Symbolic projection is only typeable out of a homogeneous tuple
    const auto & types = fn_.ty()->as<Product>()->elements;
    const bool homogeneous =
      !types.empty() && std::all_of(types.begin(), types.end(), [&](const TypeId & ty) {
        return ty == types.front();
      });
    if (!homogeneous) {
      return fail(
        ErrorKind::Unimplemented, "projection by a symbolic index out of a heterogeneous tuple");
    }
    auto ty = apply_ty(ctx_, types.front(), args_.subspan(1));
    if (!ty) {
      return fail(std::move(ty.error()));
    }
    return ApplyResult::symbolic(std::move(*ty));
  }

  Result<ApplyResult> operator()(const Application & a)
  {
    std::vector<ValId> combined(a.args.begin() + 1, a.args.end());
    combined.insert(combined.end(), args_.begin(), args_.end());
    return apply(ctx_, a.args.front(), combined);
  }

  template <typename Other>
  Result<ApplyResult> operator()(const Other &)
  {
    return symbolic_by_type(ctx_, fn_, args_);
  }

private:
  EvalCtx & ctx_;
  const ValId & fn_;
  gsl::span<const ValId> args_;
};

}  // namespace

Result<ApplyResult> apply(EvalCtx & ctx, const ValId & fn, gsl::span<const ValId> args)
{
  if (args.empty()) {
    return ApplyResult::success(fn);
  }
  return std::visit(Applier(ctx, fn, args), fn->data());
}

Result<ApplyResult> curried(EvalCtx & ctx, const ValId & fn, gsl::span<const ValId> args)
{
  auto outcome = apply(ctx, fn, args);
  if (!outcome || outcome->is_symbolic()) {
    return outcome;
  }

  ApplyResult current = std::move(*outcome);
  while (!current.rest().empty()) {
    auto next = apply(ctx, current.value(), current.rest());
    if (!next) {
      if (next.error().kind == ErrorKind::NotAFunction) {
        return fail(
          ErrorKind::TooManyArgs,
          fmt::format(
            "{} argument(s) left over after reducing to a {} value", current.rest().size(),
            to_string(current.value()->kind())));
      }
      return next;
    }
    if (next->is_symbolic()) {
      return next;
    }
    if (next->value() == current.value() && next->rest().size() == current.rest().size()) {
      break;
    }
    current = std::move(*next);
  }
  return current;
}

Result<TypeId> apply_ty(EvalCtx & ctx, const TypeId & fn_ty, gsl::span<const ValId> args)
{
  if (args.empty()) {
    return fn_ty;
  }
  const Pi * pi = fn_ty ? fn_ty->as<Pi>() : nullptr;
  if (pi == nullptr) {
    return fail(ErrorKind::NotAFunction, "type of applied value is not a function type");
  }

  const Region & def = pi->def_region;
  TypeId result;
  {
    ScopeGuard scope(ctx);
    auto image = ctx.push_region(def, args);
    if (!image) {
      return fail(std::move(image.error()));
    }
    auto substituted = ctx.evaluate(pi->result);
    if (!substituted) {
      return substituted;
    }
    if (args.size() < def.size()) {
      return make_pi(ctx.store(), *substituted, *image);
    }
    result = std::move(*substituted);
  }

  if (args.size() == def.size()) {
    return result;
  }
  if (!result->is<Pi>()) {
    return fail(
      ErrorKind::TooManyArgs,
      fmt::format("{} argument(s) left over after a function type", args.size() - def.size()));
  }
  return apply_ty(ctx, result, args.subspan(def.size()));
}

}  // namespace rvir
