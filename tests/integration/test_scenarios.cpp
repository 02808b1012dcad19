// tests/integration/test_scenarios.cpp - End-to-end construction and evaluation
//
// Builds complete programs through the public constructors and checks the
// reduced results, context rollback and store behaviour under threads.
//

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "rvir/eval/apply.hpp"
#include "rvir/graph/application.hpp"
#include "rvir/graph/function.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/graph/parameter.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/graph/ternary.hpp"
#include "rvir/store/value_store.hpp"

using namespace rvir;

namespace
{

/// |s, h, l: bool| (s and h) or (not s and l)
ValId build_mux(ValueStore & store)
{
  const TypeId b = make_bool_type(store);
  const Region r = Region::with(store, {b, b, b}).value();
  const auto ps = params(store, r);
  const ValId and_op = make_logical(store, LogicalOp::And);

  const ValId high = make_application(store, {and_op, ps[0], ps[1]}).value();
  const ValId not_s =
    make_application(store, {make_logical(store, LogicalOp::Not), ps[0]}).value();
  const ValId low = make_application(store, {and_op, not_s, ps[2]}).value();
  const ValId body =
    make_application(store, {make_logical(store, LogicalOp::Or), high, low}).value();
  return make_lambda(store, body, r).value();
}

}  // namespace

// ============================================================================
// Reduction
// ============================================================================

TEST(Scenario, MultiplexerOverAllInputs)
{
  ValueStore store;
  const ValId mux = build_mux(store);
  EXPECT_TRUE(mux.region().is_null());

  for (unsigned bits = 0; bits < 8; ++bits) {
    const bool s = (bits & 4U) != 0;
    const bool h = (bits & 2U) != 0;
    const bool l = (bits & 1U) != 0;
    auto out = make_application(
      store, {mux, make_bool(store, s), make_bool(store, h), make_bool(store, l)});
    ASSERT_TRUE(out.has_value()) << out.error().message();
    EXPECT_EQ(*out, make_bool(store, s ? h : l)) << "s=" << s << " h=" << h << " l=" << l;
  }
}

TEST(Scenario, MultiplexerWithSymbolicBranchesStaysStuck)
{
  ValueStore store;
  const ValId mux = build_mux(store);
  const TypeId b = make_bool_type(store);
  const Region r = Region::with(store, {b, b}).value();
  const auto ps = params(store, r);

  auto out = make_application(store, {mux, make_bool(store, true), ps[0], ps[1]});
  ASSERT_TRUE(out.has_value()) << out.error().message();
  EXPECT_TRUE((*out)->is<Application>());
  EXPECT_EQ(out->ty(), b);
  EXPECT_EQ(out->region(), r);
}

TEST(Scenario, IdentityOverFiniteTypes)
{
  ValueStore store;
  for (const uint64_t n : {uint64_t{1}, uint64_t{2}, uint64_t{16}}) {
    const ValId id = make_identity(store, make_finite(store, n)).value();
    for (uint64_t i = 0; i < n; ++i) {
      const ValId ix = make_index(store, n, i).value();
      EXPECT_EQ(make_application(store, {id, ix}).value(), ix) << "n=" << n << " i=" << i;
    }
  }
}

TEST(Scenario, IdentityOverBool)
{
  ValueStore store;
  const ValId id = make_identity(store, make_bool_type(store)).value();
  for (const bool v : {false, true}) {
    EXPECT_EQ(make_application(store, {id, make_bool(store, v)}).value(), make_bool(store, v));
  }
}

TEST(Scenario, CurryingEquivalence)
{
  ValueStore store;
  const TypeId b = make_bool_type(store);
  const Region r = Region::with(store, {b, b}).value();
  const auto ps = params(store, r);
  const ValId body =
    make_application(store, {make_logical(store, LogicalOp::Iff), ps[0], ps[1]}).value();
  const ValId f = make_lambda(store, body, r).value();

  for (const bool x : {false, true}) {
    const ValId partial = make_application(store, {f, make_bool(store, x)}).value();
    for (const bool y : {false, true}) {
      const ValId full = make_application(store, {f, make_bool(store, x), make_bool(store, y)})
                           .value();
      const ValId stepwise = make_application(store, {partial, make_bool(store, y)}).value();
      EXPECT_EQ(stepwise, full);
      EXPECT_EQ(full, make_bool(store, x == y));
    }
  }
}

TEST(Scenario, PolymorphicIdentityInstantiation)
{
  ValueStore store;
  const TypeId b = make_bool_type(store);
  const Region outer = Region::with(store, {make_universe(store)}).value();
  const ValId t = param(store, outer, 0).value();
  const Region inner = Region::with(store, {t}, outer).value();
  const ValId inner_id = make_lambda(store, param(store, inner, 0).value(), inner).value();
  const ValId poly = make_lambda(store, inner_id, outer).value();

  EXPECT_EQ(make_application(store, {poly, b}).value(), make_identity(store, b).value());
  EXPECT_EQ(
    make_application(store, {poly, make_finite(store, 2)}).value(),
    make_identity(store, make_finite(store, 2)).value());
  EXPECT_EQ(
    make_application(store, {poly, b, make_bool(store, false)}).value(), make_bool(store, false));
}

TEST(Scenario, EtaExpansionUnderWiderBinderAgrees)
{
  ValueStore store;
  const TypeId b = make_bool_type(store);
  const TypeId f2 = make_finite(store, 2);

  // f = |x: bool| |y: bool| x iff y
  const Region outer = Region::with(store, {b}).value();
  const Region inner = Region::with(store, {b}, outer).value();
  const ValId body = make_application(
                       store, {make_logical(store, LogicalOp::Iff), param(store, outer, 0).value(),
                               param(store, inner, 0).value()})
                       .value();
  const ValId f = make_lambda(store, make_lambda(store, body, inner).value(), outer).value();

  // g = |p: bool, k: #finite(2)| f p
  const Region wide = Region::with(store, {b, f2}).value();
  const ValId g =
    make_lambda(store, make_application(store, {f, param(store, wide, 0).value()}).value(), wide)
      .value();

  for (const bool x : {false, true}) {
    for (const bool y : {false, true}) {
      const ValId vx = make_bool(store, x);
      const ValId vy = make_bool(store, y);
      for (uint64_t k = 0; k < 2; ++k) {
        auto out = make_application(store, {g, vx, make_index(store, 2, k).value(), vy});
        ASSERT_TRUE(out.has_value()) << out.error().message();
        EXPECT_EQ(*out, make_application(store, {f, vx, vy}).value());
        EXPECT_EQ(*out, make_bool(store, x == y)) << "x=" << x << " y=" << y;
      }
    }
  }
}

TEST(Scenario, PolymorphicIdentityInsideGenericFunction)
{
  ValueStore store;
  const TypeId b = make_bool_type(store);
  const Region outer = Region::with(store, {make_universe(store)}).value();
  const Region inner = Region::with(store, {param(store, outer, 0).value()}, outer).value();
  const ValId poly = make_lambda(
                       store, make_lambda(store, param(store, inner, 0).value(), inner).value(),
                       outer)
                       .value();

  // gen = |S: U0, flag: bool| |z: S| poly S z
  const Region generic = Region::with(store, {make_universe(store), b}).value();
  const ValId s = param(store, generic, 0).value();
  const Region value = Region::with(store, {s}, generic).value();
  const ValId z = param(store, value, 0).value();
  auto body = make_application(store, {poly, s, z});
  ASSERT_TRUE(body.has_value()) << body.error().message();
  EXPECT_EQ(*body, z);
  const ValId gen = make_lambda(store, make_lambda(store, *body, value).value(), generic).value();

  EXPECT_EQ(
    make_application(store, {gen, b, make_bool(store, false), make_bool(store, true)}).value(),
    make_bool(store, true));
  const ValId ix = make_index(store, 2, 1).value();
  EXPECT_EQ(
    make_application(store, {gen, make_finite(store, 2), make_bool(store, true), ix}).value(), ix);
}

TEST(Scenario, TernaryCompression)
{
  ValueStore store;
  const ValId v = make_index(store, 16, 9).value();
  const ValId compressed = make_ternary(store, v, v).value();
  const Region selector = selector_region(store, v, v).value();
  EXPECT_EQ(compressed, make_lambda(store, v, selector).value());
}

// ============================================================================
// Rollback
// ============================================================================

TEST(Scenario, FailedApplicationLeavesContextIntact)
{
  ValueStore store;
  EvalCtx ctx(store);
  const TypeId b = make_bool_type(store);
  const ValId mux = build_mux(store);

  for (size_t bad = 0; bad < 3; ++bad) {
    std::vector<ValId> args(3, make_bool(store, true));
    args[bad] = make_index(store, 2, 1).value();

    auto out = apply(ctx, mux, args);
    ASSERT_FALSE(out.has_value()) << "argument " << bad;
    EXPECT_EQ(out.error().kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(out.error().expected, b);
    EXPECT_EQ(ctx.scope_depth(), 0u);
    EXPECT_EQ(ctx.cache_size(), 0u);
    EXPECT_EQ(ctx.minimum_depth(), EvalCtx::k_untouched);
  }

  // The same context still evaluates correctly afterwards
  const std::vector<ValId> good{make_bool(store, false), make_bool(store, false),
                                make_bool(store, true)};
  auto out = apply(ctx, mux, good);
  ASSERT_TRUE(out.has_value()) << out.error().message();
  EXPECT_EQ(out->value(), make_bool(store, true));
}

// ============================================================================
// Store
// ============================================================================

TEST(Scenario, ConcurrentConstructionSharesNodes)
{
  ValueStore store(StoreOptions{8});
  constexpr int k_threads = 6;
  std::vector<ValId> muxes(k_threads);
  std::atomic<int> failures{0};

  std::vector<std::thread> workers;
  for (int i = 0; i < k_threads; ++i) {
    workers.emplace_back([&store, &muxes, &failures, i] {
      muxes[i] = build_mux(store);
      for (unsigned bits = 0; bits < 8; ++bits) {
        const bool s = (bits & 4U) != 0;
        const bool h = (bits & 2U) != 0;
        const bool l = (bits & 1U) != 0;
        auto out = make_application(
          store, {muxes[i], make_bool(store, s), make_bool(store, h), make_bool(store, l)});
        if (!out || *out != make_bool(store, s ? h : l)) {
          ++failures;
        }
      }
    });
  }
  for (auto & w : workers) {
    w.join();
  }

  EXPECT_EQ(failures.load(), 0);
  for (int i = 1; i < k_threads; ++i) {
    EXPECT_EQ(muxes[i], muxes[0]);
  }
}

TEST(Scenario, CollectionAfterEvaluationReleasesEverything)
{
  ValueStore store;
  {
    const ValId mux = build_mux(store);
    const auto out = make_application(
      store, {mux, make_bool(store, true), make_bool(store, false), make_bool(store, true)});
    ASSERT_TRUE(out.has_value());
  }
  EXPECT_GT(store.collect(), 0u);
  EXPECT_TRUE(store.empty());
  EXPECT_EQ(store.region_count(), 0u);
  EXPECT_EQ(store.collect(), 0u);
}
