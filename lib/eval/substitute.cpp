// rvir/eval/substitute.cpp - Per-kind substitution
#include "rvir/eval/substitute.hpp"

#include <utility>
#include <vector>

#include "rvir/graph/application.hpp"
#include "rvir/graph/function.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/graph/parameter.hpp"
#include "rvir/graph/ternary.hpp"
#include "rvir/graph/tuple.hpp"

namespace rvir
{

namespace
{

/// Evaluate every element; `changed` reports whether any image differs
Result<std::vector<ValId>> evaluate_all(
  EvalCtx & ctx, const std::vector<ValId> & values, bool & changed)
{
  std::vector<ValId> images;
  images.reserve(values.size());
  for (const auto & v : values) {
    auto image = ctx.evaluate(v);
    if (!image) {
      return fail(std::move(image.error()));
    }
    changed = changed || *image != v;
    images.push_back(std::move(*image));
  }
  return images;
}

class Substituter
{
public:
  Substituter(EvalCtx & ctx, const ValId & value) : ctx_(ctx), value_(value) {}

  Result<ValId> operator()(const Parameter & p)
  {
    auto region = ctx_.evaluate_region(p.region);
    if (!region) {
      return fail(std::move(region.error()));
    }
    if (*region == p.region) {
      return value_;
    }
    return param(ctx_.store(), *region, p.index);
  }

  Result<ValId> operator()(const Application & a)
  {
    bool changed = false;
    auto args = evaluate_all(ctx_, a.args, changed);
    if (!args) {
      return fail(std::move(args.error()));
    }
    if (!changed) {
      return value_;
    }
    return make_application(ctx_, std::move(*args));
  }

  Result<ValId> operator()(const Lambda & l)
  {
    auto region = ctx_.evaluate_region(l.def_region);
    if (!region) {
      return fail(std::move(region.error()));
    }
    auto result = ctx_.evaluate(l.result);
    if (!result) {
      return result;
    }
    if (*region == l.def_region && *result == l.result) {
      return value_;
    }
    return make_lambda(ctx_.store(), *result, *region);
  }

  Result<ValId> operator()(const Pi & p)
  {
    auto region = ctx_.evaluate_region(p.def_region);
    if (!region) {
      return fail(std::move(region.error()));
    }
    auto result = ctx_.evaluate(p.result);
    if (!result) {
      return result;
    }
    if (*region == p.def_region && *result == p.result) {
      return value_;
    }
    return make_pi(ctx_.store(), *result, *region);
  }

  Result<ValId> operator()(const Tuple & t)
  {
    bool changed = false;
    auto elements = evaluate_all(ctx_, t.elements, changed);
    if (!elements) {
      return fail(std::move(elements.error()));
    }
    if (!changed) {
      return value_;
    }
    return make_tuple(ctx_.store(), std::move(*elements));
  }

  Result<ValId> operator()(const Product & p)
  {
    bool changed = false;
    auto elements = evaluate_all(ctx_, p.elements, changed);
    if (!elements) {
      return fail(std::move(elements.error()));
    }
    if (!changed) {
      return value_;
    }
    return make_product(ctx_.store(), std::move(*elements));
  }

  Result<ValId> operator()(const Ternary & t)
  {
    auto high = ctx_.evaluate(t.high());
    if (!high) {
      return high;
    }
    auto low = ctx_.evaluate(t.low());
    if (!low) {
      return low;
    }
    if (*high == t.high() && *low == t.low()) {
      return value_;
    }
    return make_ternary(ctx_.store(), *high, *low);
  }

  // Leaves are closed
  template <typename Leaf>
  Result<ValId> operator()(const Leaf &)
  {
    return value_;
  }

private:
  EvalCtx & ctx_;
  const ValId & value_;
};

}  // namespace

Result<ValId> substitute_node(EvalCtx & ctx, const ValId & value)
{
  return std::visit(Substituter(ctx, value), value->data());
}

}  // namespace rvir
