// rvir/graph/tuple.hpp - Tuples and product types
#pragma once

#include <vector>

#include "rvir/basic/error.hpp"
#include "rvir/graph/valid.hpp"

namespace rvir
{

class ValueStore;

/**
 * Product of the given types; lives in the universe of its largest element.
 *
 * @return The product, or NotAType / IncomparableRegions
 */
[[nodiscard]] Result<TypeId> make_product(ValueStore & store, std::vector<TypeId> elements);

/**
 * Tuple of the given values, typed by the product of their types.
 *
 * Applying a tuple to an Index of Finite(size) projects an element.
 */
[[nodiscard]] Result<ValId> make_tuple(ValueStore & store, std::vector<ValId> elements);

/// The empty tuple
[[nodiscard]] ValId make_unit(ValueStore & store);

}  // namespace rvir
