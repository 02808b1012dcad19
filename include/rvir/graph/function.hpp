// rvir/graph/function.hpp - Abstractions and dependent function types
//
// A Lambda or Pi binds the parameters of its defining region. The node
// itself lives at the least common region of the body's free dependencies,
// which is always strictly above the defining region.
//
#pragma once

#include <vector>

#include "rvir/basic/error.hpp"
#include "rvir/graph/valid.hpp"
#include "rvir/region/region.hpp"

namespace rvir
{

class ValueStore;

/**
 * Free dependencies of a body defined over `def_region`.
 *
 * Walks the body DAG (dependencies and types) from `result` and collects
 * every node placed above `def_region`, without descending into it. A result
 * placed above `def_region` is its own only free dependency.
 *
 * @return The dependencies in discovery order, or IncomparableRegions when
 *         `result` lives outside `def_region`'s scope
 */
[[nodiscard]] Result<std::vector<ValId>> collect_free_deps(
  const ValId & result, const Region & def_region);

/**
 * Dependent function type from `def_region`'s parameters to `result`.
 *
 * @return The Pi type, or NotAType / IncomparableRegions
 */
[[nodiscard]] Result<TypeId> make_pi(
  ValueStore & store, const TypeId & result, const Region & def_region);

/**
 * Abstraction of `result` over `def_region`.
 *
 * Its type is make_pi(result's type, def_region).
 */
[[nodiscard]] Result<ValId> make_lambda(
  ValueStore & store, const ValId & result, const Region & def_region);

/// Identity function over `ty`
[[nodiscard]] Result<ValId> make_identity(ValueStore & store, const TypeId & ty);

}  // namespace rvir
