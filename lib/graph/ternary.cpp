// rvir/graph/ternary.cpp - Boolean selector
#include "rvir/graph/ternary.hpp"

#include <utility>

#include "rvir/graph/function.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

Result<Region> selector_region(ValueStore & store, const ValId & high, const ValId & low)
{
  auto base = least_common(high.region(), low.region());
  if (!base) {
    return base;
  }
  return Region::with(store, {make_bool_type(store)}, *base);
}

Result<ValId> make_ternary(ValueStore & store, const ValId & high, const ValId & low)
{
  if (!high.ty() || high.ty() != low.ty()) {
    return fail(Error::type_mismatch(high.ty(), low.ty(), "selector branches differ in type"));
  }
  auto selector = selector_region(store, high, low);
  if (!selector) {
    return fail(std::move(selector.error()));
  }
  if (high == low) {
    return make_lambda(store, high, *selector);
  }

  auto ty = make_pi(store, high.ty(), *selector);
  if (!ty) {
    return ty;
  }
  const Region regions[] = {high.region(), low.region(), ty->region()};
  auto region = least_common(gsl::span<const Region>(regions));
  if (!region) {
    return fail(std::move(region.error()));
  }
  return store.intern(Node(Ternary{{high, low}}, *ty, std::move(*region)));
}

}  // namespace rvir
