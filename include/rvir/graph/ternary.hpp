// rvir/graph/ternary.hpp - Boolean selector
#pragma once

#include "rvir/basic/error.hpp"
#include "rvir/graph/valid.hpp"
#include "rvir/region/region.hpp"

namespace rvir
{

class ValueStore;

/**
 * Unary boolean region a selector over `high` and `low` abstracts over.
 *
 * Its parent is the least common region of the two branches.
 */
[[nodiscard]] Result<Region> selector_region(
  ValueStore & store, const ValId & high, const ValId & low);

/**
 * Selector returning `high` on true and `low` on false.
 *
 * Typed Pi(bool) -> T where T is the common branch type. Equal branches
 * normalize to the constant Lambda over selector_region().
 *
 * @return The selector, or TypeMismatch / IncomparableRegions
 */
[[nodiscard]] Result<ValId> make_ternary(ValueStore & store, const ValId & high, const ValId & low);

}  // namespace rvir
