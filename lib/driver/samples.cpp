// rvir/driver/samples.cpp - Reference programs built and evaluated by the tool
#include "rvir/driver/samples.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <array>
#include <string_view>
#include <utility>

#include "rvir/graph/application.hpp"
#include "rvir/graph/describe.hpp"
#include "rvir/graph/function.hpp"
#include "rvir/graph/parameter.hpp"
#include "rvir/graph/primitive.hpp"
#include "rvir/graph/ternary.hpp"

namespace rvir
{

namespace
{

// ============================================================================
// Helpers
// ============================================================================

/// Record one evaluated case; keeps the first mismatch as the detail
void expect_value(SampleResult & r, const ValId & got, const ValId & want, std::string_view what)
{
  ++r.cases;
  if (got == want) {
    return;
  }
  if (r.passed) {
    r.detail = fmt::format("{}: got {}, expected {}", what, describe(got), describe(want));
  }
  r.passed = false;
}

SampleResult start(std::string name)
{
  SampleResult r;
  r.name = std::move(name);
  r.passed = true;
  return r;
}

// ============================================================================
// Samples
// ============================================================================

/// mux(s, h, l) = (s and h) or (not s and l), over all eight inputs
Result<SampleResult> sample_mux(ValueStore & store)
{
  SampleResult r = start("mux");
  const TypeId b = make_bool_type(store);

  auto region = Region::with(store, {b, b, b});
  if (!region) return fail(std::move(region.error()));
  const auto ps = params(store, *region);

  const ValId and_op = make_logical(store, LogicalOp::And);
  auto high = make_application(store, {and_op, ps[0], ps[1]});
  if (!high) return fail(std::move(high.error()));
  auto not_s = make_application(store, {make_logical(store, LogicalOp::Not), ps[0]});
  if (!not_s) return fail(std::move(not_s.error()));
  auto low = make_application(store, {and_op, *not_s, ps[2]});
  if (!low) return fail(std::move(low.error()));
  auto body = make_application(store, {make_logical(store, LogicalOp::Or), *high, *low});
  if (!body) return fail(std::move(body.error()));
  auto mux = make_lambda(store, *body, *region);
  if (!mux) return fail(std::move(mux.error()));
  r.program = *mux;

  for (unsigned bits = 0; bits < 8; ++bits) {
    const bool s = (bits & 4U) != 0;
    const bool h = (bits & 2U) != 0;
    const bool l = (bits & 1U) != 0;
    auto out = make_application(
      store, {*mux, make_bool(store, s), make_bool(store, h), make_bool(store, l)});
    if (!out) return fail(std::move(out.error()));
    expect_value(r, *out, make_bool(store, s ? h : l), fmt::format("mux({}, {}, {})", s, h, l));
  }
  return r;
}

/// Identity functions over bool and Finite(n), applied to every inhabitant
Result<SampleResult> sample_identity(ValueStore & store)
{
  SampleResult r = start("identity");

  auto id_bool = make_identity(store, make_bool_type(store));
  if (!id_bool) return fail(std::move(id_bool.error()));
  for (const bool v : {false, true}) {
    auto out = make_application(store, {*id_bool, make_bool(store, v)});
    if (!out) return fail(std::move(out.error()));
    expect_value(r, *out, make_bool(store, v), fmt::format("id_bool({})", v));
  }

  for (const uint64_t n : {uint64_t{1}, uint64_t{2}, uint64_t{16}}) {
    auto id = make_identity(store, make_finite(store, n));
    if (!id) return fail(std::move(id.error()));
    r.program = *id;
    for (uint64_t i = 0; i < n; ++i) {
      auto ix = make_index(store, n, i);
      if (!ix) return fail(std::move(ix.error()));
      auto out = make_application(store, {*id, *ix});
      if (!out) return fail(std::move(out.error()));
      expect_value(r, *out, *ix, fmt::format("id_finite{}({})", n, i));
    }
  }
  return r;
}

/// f a b == (f a) b for f = |a, b| a xor b
Result<SampleResult> sample_currying(ValueStore & store)
{
  SampleResult r = start("currying");
  const TypeId b = make_bool_type(store);

  auto region = Region::with(store, {b, b});
  if (!region) return fail(std::move(region.error()));
  const auto ps = params(store, *region);
  auto body = make_application(store, {make_logical(store, LogicalOp::Xor), ps[0], ps[1]});
  if (!body) return fail(std::move(body.error()));
  auto f = make_lambda(store, *body, *region);
  if (!f) return fail(std::move(f.error()));
  r.program = *f;

  for (const bool x : {false, true}) {
    auto partial = make_application(store, {*f, make_bool(store, x)});
    if (!partial) return fail(std::move(partial.error()));
    for (const bool y : {false, true}) {
      auto full = make_application(store, {*f, make_bool(store, x), make_bool(store, y)});
      if (!full) return fail(std::move(full.error()));
      auto stepwise = make_application(store, {*partial, make_bool(store, y)});
      if (!stepwise) return fail(std::move(stepwise.error()));
      expect_value(r, *stepwise, *full, fmt::format("(f {}) {}", x, y));
      expect_value(r, *full, make_bool(store, x != y), fmt::format("f {} {}", x, y));
    }
  }
  return r;
}

/// Selector over Finite(4) and compression of equal branches
Result<SampleResult> sample_ternary(ValueStore & store)
{
  SampleResult r = start("ternary");

  auto one = make_index(store, 4, 1);
  auto two = make_index(store, 4, 2);
  if (!one) return fail(std::move(one.error()));
  if (!two) return fail(std::move(two.error()));
  auto select = make_ternary(store, *one, *two);
  if (!select) return fail(std::move(select.error()));
  r.program = *select;

  for (const bool v : {false, true}) {
    auto out = make_application(store, {*select, make_bool(store, v)});
    if (!out) return fail(std::move(out.error()));
    expect_value(r, *out, v ? *one : *two, fmt::format("select({})", v));
  }

  auto same = make_ternary(store, *one, *one);
  if (!same) return fail(std::move(same.error()));
  auto selector = selector_region(store, *one, *one);
  if (!selector) return fail(std::move(selector.error()));
  auto constant = make_lambda(store, *one, *selector);
  if (!constant) return fail(std::move(constant.error()));
  expect_value(r, *same, *constant, "ternary(x, x)");
  return r;
}

/// |T: U0| |x: T| x instantiated at bool
Result<SampleResult> sample_polymorphic(ValueStore & store)
{
  SampleResult r = start("polymorphic");
  const TypeId b = make_bool_type(store);

  auto outer = Region::with(store, {make_universe(store)});
  if (!outer) return fail(std::move(outer.error()));
  auto t = param(store, *outer, 0);
  if (!t) return fail(std::move(t.error()));
  auto inner = Region::with(store, {*t}, *outer);
  if (!inner) return fail(std::move(inner.error()));
  auto x = param(store, *inner, 0);
  if (!x) return fail(std::move(x.error()));
  auto inner_id = make_lambda(store, *x, *inner);
  if (!inner_id) return fail(std::move(inner_id.error()));
  auto poly = make_lambda(store, *inner_id, *outer);
  if (!poly) return fail(std::move(poly.error()));
  r.program = *poly;

  auto id_bool = make_identity(store, b);
  if (!id_bool) return fail(std::move(id_bool.error()));
  auto instantiated = make_application(store, {*poly, b});
  if (!instantiated) return fail(std::move(instantiated.error()));
  expect_value(r, *instantiated, *id_bool, "poly(bool)");

  auto applied = make_application(store, {*poly, b, make_bool(store, true)});
  if (!applied) return fail(std::move(applied.error()));
  expect_value(r, *applied, make_bool(store, true), "poly(bool, true)");
  return r;
}

using SampleFn = Result<SampleResult> (*)(ValueStore &);

constexpr std::array<std::pair<std::string_view, SampleFn>, 5> k_samples = {{
  {"mux", &sample_mux},
  {"identity", &sample_identity},
  {"currying", &sample_currying},
  {"ternary", &sample_ternary},
  {"polymorphic", &sample_polymorphic},
}};

}  // namespace

std::vector<std::string> sample_names()
{
  std::vector<std::string> names;
  names.reserve(k_samples.size());
  for (const auto & [name, fn] : k_samples) {
    names.emplace_back(name);
  }
  return names;
}

SampleResult run_sample(const std::string & name, ValueStore & store, DiagnosticBag & diags)
{
  for (const auto & [sample_name, fn] : k_samples) {
    if (sample_name != name) {
      continue;
    }
    auto result = fn(store);
    if (result) {
      return std::move(*result);
    }
    diags.report(result.error()).with_note(fmt::format("while running sample '{}'", name));
    SampleResult failed;
    failed.name = name;
    failed.detail = result.error().message();
    return failed;
  }

  diags.report_error(fmt::format("unknown sample '{}'", name))
    .with_help(fmt::format("available samples: {}", fmt::join(sample_names(), ", ")));
  SampleResult unknown;
  unknown.name = name;
  unknown.detail = "unknown sample";
  return unknown;
}

std::vector<SampleResult> run_samples(ValueStore & store, DiagnosticBag & diags)
{
  std::vector<SampleResult> results;
  for (const auto & name : sample_names()) {
    results.push_back(run_sample(name, store, diags));
  }
  return results;
}

}  // namespace rvir
