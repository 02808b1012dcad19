// tests/unit/graph/test_tuple_ternary.cpp - Unit tests for tuples and selectors
//
// Tests product types, tuple projection and the boolean selector, including
// compression of equal branches.
//

#include <gtest/gtest.h>

#include "rvir/graph/application.hpp"
#include "rvir/graph/function.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/graph/parameter.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/graph/ternary.hpp"
#include "rvir/graph/tuple.hpp"
#include "rvir/store/value_store.hpp"

using namespace rvir;

// ============================================================================
// Tuples
// ============================================================================

TEST(GraphTuple, UnitIsTheEmptyTuple)
{
  ValueStore store;
  const ValId unit = make_unit(store);
  ASSERT_TRUE(unit->is<Tuple>());
  EXPECT_TRUE(unit->as<Tuple>()->elements.empty());
  EXPECT_EQ(unit.ty(), make_product(store, {}).value());
}

TEST(GraphTuple, TypedByProductOfElementTypes)
{
  ValueStore store;
  const ValId t = make_bool(store, true);
  const ValId ix = make_index(store, 3, 1).value();
  auto tuple = make_tuple(store, {t, ix});
  ASSERT_TRUE(tuple.has_value());
  const TypeId expected =
    make_product(store, {make_bool_type(store), make_finite(store, 3)}).value();
  EXPECT_EQ(tuple->ty(), expected);
  EXPECT_EQ((*tuple)->dep_count(), 2u);
}

TEST(GraphTuple, ProductRejectsValues)
{
  ValueStore store;
  auto product = make_product(store, {make_bool(store, true)});
  ASSERT_FALSE(product.has_value());
  EXPECT_EQ(product.error().kind, ErrorKind::NotAType);
}

TEST(GraphTuple, ProjectionByConstantIndex)
{
  ValueStore store;
  const ValId t = make_bool(store, true);
  const ValId ix = make_index(store, 3, 1).value();
  const ValId tuple = make_tuple(store, {t, ix}).value();

  EXPECT_EQ(make_application(store, {tuple, make_index(store, 2, 0).value()}).value(), t);
  EXPECT_EQ(make_application(store, {tuple, make_index(store, 2, 1).value()}).value(), ix);
}

TEST(GraphTuple, ProjectionRejectsForeignIndex)
{
  ValueStore store;
  const ValId tuple = make_tuple(store, {make_bool(store, true), make_bool(store, false)}).value();
  auto projected = make_application(store, {tuple, make_index(store, 3, 0).value()});
  ASSERT_FALSE(projected.has_value());
  EXPECT_EQ(projected.error().kind, ErrorKind::TypeMismatch);
  EXPECT_EQ(projected.error().expected, make_finite(store, 2));
}

TEST(GraphTuple, SymbolicProjectionOfHomogeneousTuple)
{
  ValueStore store;
  const ValId tuple = make_tuple(store, {make_bool(store, true), make_bool(store, false)}).value();
  const Region r = Region::with(store, {make_finite(store, 2)}).value();
  const ValId i = param(store, r, 0).value();

  auto projected = make_application(store, {tuple, i});
  ASSERT_TRUE(projected.has_value()) << projected.error().message();
  EXPECT_TRUE((*projected)->is<Application>());
  EXPECT_EQ(projected->ty(), make_bool_type(store));
  EXPECT_EQ(projected->region(), r);
}

TEST(GraphTuple, SymbolicProjectionOfHeterogeneousTupleIsUnimplemented)
{
  ValueStore store;
  const ValId tuple =
    make_tuple(store, {make_bool(store, true), make_index(store, 3, 0).value()}).value();
  const Region r = Region::with(store, {make_finite(store, 2)}).value();

  auto projected = make_application(store, {tuple, param(store, r, 0).value()});
  ASSERT_FALSE(projected.has_value());
  EXPECT_EQ(projected.error().kind, ErrorKind::Unimplemented);
}

// ============================================================================
// Ternary
// ============================================================================

TEST(GraphTernary, SelectsByConstant)
{
  ValueStore store;
  const ValId one = make_index(store, 4, 1).value();
  const ValId two = make_index(store, 4, 2).value();
  auto select = make_ternary(store, one, two);
  ASSERT_TRUE(select.has_value());
  ASSERT_TRUE((*select)->is<Ternary>());

  const auto * pi = select->ty()->as<Pi>();
  ASSERT_NE(pi, nullptr);
  EXPECT_EQ(pi->result, make_finite(store, 4));
  EXPECT_EQ(pi->def_region.param_types()[0], make_bool_type(store));

  EXPECT_EQ(make_application(store, {*select, make_bool(store, true)}).value(), one);
  EXPECT_EQ(make_application(store, {*select, make_bool(store, false)}).value(), two);
}

TEST(GraphTernary, EqualBranchesCompressToConstantLambda)
{
  ValueStore store;
  const ValId one = make_index(store, 4, 1).value();
  auto same = make_ternary(store, one, one);
  ASSERT_TRUE(same.has_value());
  EXPECT_TRUE((*same)->is<Lambda>());

  const Region selector = selector_region(store, one, one).value();
  EXPECT_EQ(*same, make_lambda(store, one, selector).value());
  EXPECT_EQ(make_application(store, {*same, make_bool(store, false)}).value(), one);
}

TEST(GraphTernary, BranchesMustAgreeInType)
{
  ValueStore store;
  auto select = make_ternary(store, make_bool(store, true), make_index(store, 2, 0).value());
  ASSERT_FALSE(select.has_value());
  EXPECT_EQ(select.error().kind, ErrorKind::TypeMismatch);
}

TEST(GraphTernary, SelectorMustBeBool)
{
  ValueStore store;
  const ValId select = make_ternary(store, make_bool(store, true), make_bool(store, false)).value();
  auto applied = make_application(store, {select, make_index(store, 2, 0).value()});
  ASSERT_FALSE(applied.has_value());
  EXPECT_EQ(applied.error().kind, ErrorKind::TypeMismatch);
}

TEST(GraphTernary, SymbolicSelectorIsStuck)
{
  ValueStore store;
  const ValId select = make_ternary(store, make_bool(store, true), make_bool(store, false)).value();
  const Region r = Region::with(store, {make_bool_type(store)}).value();
  const ValId s = param(store, r, 0).value();

  auto applied = make_application(store, {select, s});
  ASSERT_TRUE(applied.has_value()) << applied.error().message();
  EXPECT_TRUE((*applied)->is<Application>());
  EXPECT_EQ(applied->ty(), make_bool_type(store));
  EXPECT_EQ(applied->region(), r);
}
