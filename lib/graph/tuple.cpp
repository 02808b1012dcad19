// rvir/graph/tuple.cpp - Tuples and product types
#include "rvir/graph/tuple.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

#include "rvir/graph/node.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

Result<TypeId> make_product(ValueStore & store, std::vector<TypeId> elements)
{
  uint32_t level = 0;
  std::vector<Region> regions;
  regions.reserve(elements.size());
  for (size_t i = 0; i < elements.size(); ++i) {
    if (!is_type(elements[i])) {
      return fail(ErrorKind::NotAType, fmt::format("product element #{} is not a type", i));
    }
    level = std::max(level, universe_level(elements[i]));
    regions.push_back(elements[i].region());
  }
  auto region = least_common(gsl::span<const Region>(regions));
  if (!region) {
    return fail(std::move(region.error()));
  }
  return store.intern(
    Node(Product{std::move(elements)}, make_universe(store, level), std::move(*region)));
}

Result<ValId> make_tuple(ValueStore & store, std::vector<ValId> elements)
{
  std::vector<TypeId> types;
  types.reserve(elements.size());
  for (size_t i = 0; i < elements.size(); ++i) {
    if (!elements[i].ty()) {
      return fail(ErrorKind::NotAType, fmt::format("tuple element #{} is an untyped universe", i));
    }
    types.push_back(elements[i].ty());
  }
  auto product = make_product(store, std::move(types));
  if (!product) {
    return product;
  }

  std::vector<Region> regions;
  regions.reserve(elements.size() + 1);
  for (const auto & e : elements) {
    regions.push_back(e.region());
  }
  regions.push_back(product->region());
  auto region = least_common(gsl::span<const Region>(regions));
  if (!region) {
    return fail(std::move(region.error()));
  }
  return store.intern(Node(Tuple{std::move(elements)}, *product, std::move(*region)));
}

ValId make_unit(ValueStore & store)
{
  // An empty tuple has no element to fail on
  return make_tuple(store, {}).value();
}

}  // namespace rvir
