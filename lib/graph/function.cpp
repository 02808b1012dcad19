// rvir/graph/function.cpp - Abstractions and dependent function types
#include "rvir/graph/function.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "rvir/graph/node.hpp"
#include "rvir/graph/parameter.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

namespace
{

/// Placement of a node depending on `deps` and typed by `ty`
Result<Region> placement_of(const std::vector<ValId> & deps, const TypeId & ty)
{
  std::vector<Region> regions;
  regions.reserve(deps.size() + 1);
  for (const auto & d : deps) {
    regions.push_back(d.region());
  }
  if (ty) {
    regions.push_back(ty.region());
  }
  return least_common(gsl::span<const Region>(regions));
}

Result<void> check_def_region(const Region & def_region)
{
  if (def_region.is_null()) {
    return fail(ErrorKind::IncomparableRegions, "binder requires a non-null defining region");
  }
  return {};
}

}  // namespace

Result<std::vector<ValId>> collect_free_deps(const ValId & result, const Region & def_region)
{
  switch (compare(result.region(), def_region)) {
    case RegionOrdering::Ancestor:
      return std::vector<ValId>{result};
    case RegionOrdering::Equal:
      break;
    case RegionOrdering::Descendant:
    case RegionOrdering::Incomparable:
      return fail(
        ErrorKind::IncomparableRegions,
        fmt::format(
          "body result at depth {} escapes the scope of its defining region (depth {})",
          result.depth(), def_region.depth()));
  }

  const size_t depth = def_region.depth();
  std::vector<ValId> free;
  std::unordered_set<ValId, ValIdHash> visited{result};
  std::vector<ValId> stack{result};

  auto visit = [&](const ValId & v) {
    if (!v || !visited.insert(v).second) {
      return;
    }
    if (v.depth() < depth) {
      free.push_back(v);
    } else {
      stack.push_back(v);
    }
  };

  while (!stack.empty()) {
    const ValId current = std::move(stack.back());
    stack.pop_back();
    for (const auto & dep : current->deps()) {
      visit(dep);
    }
    visit(current.ty());
  }
  return free;
}

Result<TypeId> make_pi(ValueStore & store, const TypeId & result, const Region & def_region)
{
  if (auto ok = check_def_region(def_region); !ok) {
    return fail(std::move(ok.error()));
  }
  if (!is_type(result)) {
    return fail(ErrorKind::NotAType, "result of a function type must be a type");
  }

  auto deps = collect_free_deps(result, def_region);
  if (!deps) {
    return fail(std::move(deps.error()));
  }
  uint32_t level = universe_level(result);
  for (const auto & ty : def_region.param_types()) {
    level = std::max(level, universe_level(ty));
    if (std::find(deps->begin(), deps->end(), ty) == deps->end()) {
      deps->push_back(ty);
    }
  }

  const ValId universe = make_universe(store, level);
  auto region = placement_of(*deps, universe);
  if (!region) {
    return fail(std::move(region.error()));
  }
  return store.intern(
    Node(Pi{def_region, result, std::move(*deps)}, universe, std::move(*region)));
}

Result<ValId> make_lambda(ValueStore & store, const ValId & result, const Region & def_region)
{
  if (auto ok = check_def_region(def_region); !ok) {
    return fail(std::move(ok.error()));
  }
  if (!result.ty()) {
    return fail(ErrorKind::NotAType, "a universe cannot be the body of an abstraction");
  }

  auto ty = make_pi(store, result.ty(), def_region);
  if (!ty) {
    return ty;
  }
  auto deps = collect_free_deps(result, def_region);
  if (!deps) {
    return fail(std::move(deps.error()));
  }
  auto region = placement_of(*deps, *ty);
  if (!region) {
    return fail(std::move(region.error()));
  }
  return store.intern(
    Node(Lambda{def_region, result, std::move(*deps)}, *ty, std::move(*region)));
}

Result<ValId> make_identity(ValueStore & store, const TypeId & ty)
{
  auto region = Region::with(store, {ty}, ty.region());
  if (!region) {
    return fail(std::move(region.error()));
  }
  auto x = param(store, *region, 0);
  if (!x) {
    return x;
  }
  return make_lambda(store, *x, *region);
}

}  // namespace rvir
