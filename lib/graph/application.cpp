// rvir/graph/application.cpp - Application nodes
#include "rvir/graph/application.hpp"

#include <fmt/core.h>

#include <iterator>
#include <utility>

#include "rvir/eval/apply.hpp"
#include "rvir/eval/eval_ctx.hpp"
#include "rvir/graph/node.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

Result<ValId> make_application(EvalCtx & ctx, std::vector<ValId> args)
{
  if (args.empty()) {
    return fail(ErrorKind::NotAFunction, "application without a function");
  }
  if (args.size() == 1) {
    return args.front();
  }
  if (const auto * head = args.front()->as<Application>()) {
    std::vector<ValId> flat = head->args;
    flat.insert(
      flat.end(), std::make_move_iterator(args.begin() + 1), std::make_move_iterator(args.end()));
    args = std::move(flat);
  }

  auto outcome = curried(ctx, args.front(), gsl::span<const ValId>(args).subspan(1));
  if (!outcome) {
    return fail(std::move(outcome.error()));
  }
  if (outcome->is_success()) {
    if (!outcome->rest().empty()) {
      return fail(
        ErrorKind::TooManyArgs,
        fmt::format("{} argument(s) could not be consumed", outcome->rest().size()));
    }
    return outcome->value();
  }

  std::vector<Region> regions;
  regions.reserve(args.size() + 1);
  for (const auto & a : args) {
    regions.push_back(a.region());
  }
  regions.push_back(outcome->type().region());
  auto region = least_common(gsl::span<const Region>(regions));
  if (!region) {
    return fail(std::move(region.error()));
  }
  return ctx.store().intern(
    Node(Application{std::move(args)}, outcome->type(), std::move(*region)));
}

Result<ValId> make_application(ValueStore & store, std::vector<ValId> args)
{
  EvalCtx ctx(store);
  return make_application(ctx, std::move(args));
}

}  // namespace rvir
