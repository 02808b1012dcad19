// rvir/graph/parameter.cpp - Region parameters
#include "rvir/graph/parameter.hpp"

#include <fmt/core.h>

#include "rvir/graph/node.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

Result<ValId> param(ValueStore & store, const Region & region, size_t index)
{
  if (index >= region.size()) {
    return fail(
      ErrorKind::ParameterOutOfRange,
      fmt::format("parameter #{} of a region with {} parameter(s)", index, region.size()));
  }
  const TypeId & ty = region.param_types()[index];
  return store.intern(Node(Parameter{region, index}, ty, region));
}

std::vector<ValId> params(ValueStore & store, const Region & region)
{
  std::vector<ValId> result;
  result.reserve(region.size());
  for (size_t i = 0; i < region.size(); ++i) {
    const TypeId & ty = region.param_types()[i];
    result.push_back(store.intern(Node(Parameter{region, i}, ty, region)));
  }
  return result;
}

}  // namespace rvir
