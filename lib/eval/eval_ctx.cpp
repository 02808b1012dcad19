// rvir/eval/eval_ctx.cpp - Substitution context implementation
#include "rvir/eval/eval_ctx.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

#include "rvir/eval/substitute.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/graph/parameter.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

EvalCtx::EvalCtx(ValueStore & store) : store_(store) {}

// ============================================================================
// Scope stack
// ============================================================================

void EvalCtx::push(Region region)
{
  parents_.push_back(std::move(top_));
  top_ = Frame{};
  top_.active = std::move(region);
}

bool EvalCtx::pop()
{
  if (parents_.empty()) {
    return false;
  }
  top_ = std::move(parents_.back());
  parents_.pop_back();
  return true;
}

void EvalCtx::pop_to(size_t scope_depth)
{
  while (parents_.size() > scope_depth) {
    pop();
  }
}

void EvalCtx::restore(Snapshot snapshot) noexcept
{
  top_ = std::move(snapshot.top);
  parents_ = std::move(snapshot.parents);
}

size_t EvalCtx::cache_size() const noexcept { return top_.values ? top_.values->size() : 0; }

EvalCtx::ValueMap & EvalCtx::mutable_values()
{
  if (!top_.values) {
    top_.values = std::make_shared<ValueMap>();
  } else if (top_.values.use_count() > 1) {
    top_.values = std::make_shared<ValueMap>(*top_.values);
  }
  return *top_.values;
}

EvalCtx::RegionMap & EvalCtx::mutable_regions()
{
  if (!top_.regions) {
    top_.regions = std::make_shared<RegionMap>();
  } else if (top_.regions.use_count() > 1) {
    top_.regions = std::make_shared<RegionMap>(*top_.regions);
  }
  return *top_.regions;
}

// ============================================================================
// Binding
// ============================================================================

Result<void> EvalCtx::substitute(const ValId & lhs, ValId rhs, bool check)
{
  if (check) {
    auto expected = evaluate(lhs.ty());
    if (!expected) {
      return fail(std::move(expected.error()));
    }
    if (!rhs || rhs.ty() != *expected) {
      return fail(Error::type_mismatch(
        *expected, rhs ? rhs.ty() : TypeId{},
        fmt::format("argument does not match the type of parameter at depth {}", lhs.depth())));
    }
  }
  top_.minimum_depth = std::min(top_.minimum_depth, lhs.depth());
  mutable_values().insert_or_assign(lhs, std::move(rhs));
  return {};
}

Result<Region> EvalCtx::substitute_region(const Region & region, gsl::span<const ValId> args)
{
  const size_t bound = std::min(args.size(), region.size());
  for (size_t i = 0; i < bound; ++i) {
    auto p = param(store_, region, i);
    if (!p) {
      return fail(std::move(p.error()));
    }
    auto bound_ok = substitute(*p, args[i], true);
    if (!bound_ok) {
      return fail(std::move(bound_ok.error()));
    }
  }
  // A region is touched even when it binds nothing
  top_.minimum_depth = std::min(top_.minimum_depth, region.depth());

  auto parent = evaluate_region(region.parent());
  if (!parent) {
    return parent;
  }

  std::vector<Region> placed;
  placed.reserve(bound + 1);
  placed.push_back(*parent);
  for (size_t i = 0; i < bound; ++i) {
    placed.push_back(args[i].region());
  }
  auto target = least_common(placed);
  if (!target) {
    return target;
  }
  top_.target = *target;

  Region image = *target;
  if (bound < region.size()) {
    std::vector<TypeId> remaining;
    remaining.reserve(region.size() - bound);
    for (size_t i = bound; i < region.size(); ++i) {
      auto ty = evaluate(region.param_types()[i]);
      if (!ty) {
        return fail(std::move(ty.error()));
      }
      remaining.push_back(std::move(*ty));
    }
    auto residual = Region::with(store_, std::move(remaining), *target);
    if (!residual) {
      return residual;
    }
    image = *residual;
    for (size_t i = bound; i < region.size(); ++i) {
      auto from = param(store_, region, i);
      auto to = param(store_, image, i - bound);
      if (!from) {
        return fail(std::move(from.error()));
      }
      if (!to) {
        return fail(std::move(to.error()));
      }
      auto renamed = substitute(*from, std::move(*to), false);
      if (!renamed) {
        return fail(std::move(renamed.error()));
      }
    }
  }

  mutable_regions().insert_or_assign(region, image);
  return image;
}

Result<Region> EvalCtx::push_region(const Region & region, gsl::span<const ValId> args)
{
  Snapshot before = save();
  push(region);
  auto image = substitute_region(region, args);
  if (!image) {
    restore(std::move(before));
  }
  return image;
}

// ============================================================================
// Evaluation
// ============================================================================

std::optional<ValId> EvalCtx::try_evaluate(const ValId & value) const
{
  if (!value || value.depth() < top_.minimum_depth) {
    return value;
  }
  if (top_.values) {
    if (auto it = top_.values->find(value); it != top_.values->end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

Result<ValId> EvalCtx::evaluate(const ValId & value)
{
  if (auto known = try_evaluate(value)) {
    return std::move(*known);
  }
  auto image = substitute_node(*this, value);
  if (!image) {
    return image;
  }
  mutable_values().emplace(value, *image);
  return image;
}

Result<Region> EvalCtx::evaluate_region(const Region & region)
{
  if (region.is_null() || region.depth() < top_.minimum_depth) {
    return region;
  }
  if (top_.regions) {
    if (auto it = top_.regions->find(region); it != top_.regions->end()) {
      return it->second;
    }
  }

  auto parent = evaluate_region(region.parent());
  if (!parent) {
    return parent;
  }
  std::vector<TypeId> types;
  types.reserve(region.size());
  for (const auto & ty : region.param_types()) {
    auto image = evaluate(ty);
    if (!image) {
      return fail(std::move(image.error()));
    }
    types.push_back(std::move(*image));
  }
  auto image = Region::with(store_, std::move(types), *parent);
  if (!image) {
    return image;
  }
  mutable_regions().emplace(region, *image);
  return image;
}

}  // namespace rvir
