// rvir/region/region.cpp - Region tree implementation
#include "rvir/region/region.hpp"

#include <fmt/core.h>

#include <utility>

#include "rvir/basic/hash.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

// ============================================================================
// RegionData
// ============================================================================

RegionData::RegionData(std::vector<TypeId> param_types, Region parent)
: param_types_(std::move(param_types)), parent_(std::move(parent))
{
  depth_ = parent_.depth() + 1;

  hash_ = 0;
  hash_combine(hash_, RegionHash{}(parent_));
  hash_combine(hash_, param_types_.size());
  for (const auto & ty : param_types_) {
    hash_combine(hash_, ValIdHash{}(ty));
  }
}

// ============================================================================
// Region
// ============================================================================

Result<Region> Region::with(ValueStore & store, std::vector<TypeId> param_types, Region parent)
{
  for (size_t i = 0; i < param_types.size(); ++i) {
    const TypeId & ty = param_types[i];
    if (!is_type(ty)) {
      return fail(ErrorKind::NotAType, fmt::format("region parameter #{} is not a type", i));
    }
    if (!ty.region().is_ancestor_or_self_of(parent)) {
      return fail(
        ErrorKind::IncomparableRegions,
        fmt::format(
          "type of region parameter #{} lives at depth {}, outside the enclosing scope", i,
          ty.depth()));
    }
  }
  return store.intern_region(RegionData(std::move(param_types), std::move(parent)));
}

size_t Region::depth() const noexcept { return data_ ? data_->depth() : 0; }

Region Region::parent() const { return data_ ? data_->parent() : Region{}; }

gsl::span<const TypeId> Region::param_types() const noexcept
{
  if (!data_) {
    return {};
  }
  return gsl::span<const TypeId>(data_->param_types());
}

Region Region::ancestor_at(size_t depth) const
{
  if (depth > this->depth()) {
    return {};
  }
  Region current = *this;
  while (current.depth() > depth) {
    current = current.parent();
  }
  return current;
}

bool Region::is_ancestor_or_self_of(const Region & other) const
{
  if (is_null()) {
    return true;
  }
  if (depth() > other.depth()) {
    return false;
  }
  return other.ancestor_at(depth()) == *this;
}

// ============================================================================
// Partial Order
// ============================================================================

RegionOrdering compare(const Region & a, const Region & b)
{
  const size_t da = a.depth();
  const size_t db = b.depth();
  if (da == db) {
    return a == b ? RegionOrdering::Equal : RegionOrdering::Incomparable;
  }
  if (da < db) {
    return b.ancestor_at(da) == a ? RegionOrdering::Ancestor : RegionOrdering::Incomparable;
  }
  return a.ancestor_at(db) == b ? RegionOrdering::Descendant : RegionOrdering::Incomparable;
}

Result<Region> least_common(const Region & a, const Region & b)
{
  switch (compare(a, b)) {
    case RegionOrdering::Ancestor:
      return b;
    case RegionOrdering::Descendant:
    case RegionOrdering::Equal:
      return a;
    case RegionOrdering::Incomparable:
      break;
  }
  return fail(
    ErrorKind::IncomparableRegions,
    fmt::format("regions at depths {} and {} do not share a scope chain", a.depth(), b.depth()));
}

Result<Region> least_common(gsl::span<const Region> regions)
{
  Region result;
  for (const auto & region : regions) {
    if (region.is_null()) {
      continue;
    }
    auto lcr = least_common(result, region);
    if (!lcr) {
      return lcr;
    }
    result = std::move(*lcr);
  }
  return result;
}

}  // namespace rvir
