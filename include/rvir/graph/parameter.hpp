// rvir/graph/parameter.hpp - Region parameters
#pragma once

#include <cstddef>
#include <vector>

#include "rvir/basic/error.hpp"
#include "rvir/graph/valid.hpp"
#include "rvir/region/region.hpp"

namespace rvir
{

class ValueStore;

/**
 * Parameter `index` of `region`.
 *
 * The parameter is typed by the region's declared type at `index` and
 * placed in the region itself.
 *
 * @return The parameter, or ParameterOutOfRange (also for the null region)
 */
[[nodiscard]] Result<ValId> param(ValueStore & store, const Region & region, size_t index);

/// All parameters of `region`, in order
[[nodiscard]] std::vector<ValId> params(ValueStore & store, const Region & region);

}  // namespace rvir
