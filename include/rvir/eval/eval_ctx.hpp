// rvir/eval/eval_ctx.hpp - Region-scoped substitution context
//
// An EvalCtx maps input nodes to their substituted images while a binder
// region is being instantiated. It is private to one evaluation call tree.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <limits>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "rvir/basic/error.hpp"
#include "rvir/graph/valid.hpp"
#include "rvir/region/region.hpp"

namespace rvir
{

class ValueStore;

/**
 * Substitution context.
 *
 * The context is a stack of scope frames. Each frame records the region
 * being instantiated, the region its image is placed under, the shallowest
 * depth it has touched and two copy-on-write maps (node images and region
 * images). Nodes shallower than the minimum depth cannot mention a bound
 * parameter and evaluate to themselves.
 */
class EvalCtx
{
public:
  using ValueMap = std::unordered_map<ValId, ValId, ValIdHash>;
  using RegionMap = std::unordered_map<Region, Region, RegionHash>;

  static constexpr size_t k_untouched = std::numeric_limits<size_t>::max();

  struct Frame
  {
    Region active;
    Region target;
    size_t minimum_depth = k_untouched;
    std::shared_ptr<ValueMap> values;
    std::shared_ptr<RegionMap> regions;
  };

  /// Complete, cheap-to-copy image of the context state
  struct Snapshot
  {
    Frame top;
    std::vector<Frame> parents;
  };

  explicit EvalCtx(ValueStore & store);

  [[nodiscard]] ValueStore & store() const noexcept { return store_; }

  // ===== Scope stack =====

  /// Open a fresh frame for `region`, keeping the current one underneath
  void push(Region region);

  /// Drop the innermost frame; returns false when no frame was pushed
  bool pop();

  /// Pop frames until exactly `scope_depth` pushed frames remain
  void pop_to(size_t scope_depth);

  [[nodiscard]] Snapshot save() const { return Snapshot{top_, parents_}; }
  void restore(Snapshot snapshot) noexcept;

  /// Number of frames pushed over the root frame
  [[nodiscard]] size_t scope_depth() const noexcept { return parents_.size(); }
  [[nodiscard]] size_t minimum_depth() const noexcept { return top_.minimum_depth; }
  [[nodiscard]] const Region & active_region() const noexcept { return top_.active; }
  [[nodiscard]] const Region & target_region() const noexcept { return top_.target; }

  /// Number of memoized node images in the innermost frame
  [[nodiscard]] size_t cache_size() const noexcept;

  // ===== Binding =====

  /**
   * Record `rhs` as the image of `lhs` in the innermost frame.
   *
   * @param check When true, `rhs` must have the (substituted) type of `lhs`
   * @return TypeMismatch if the check fails
   */
  Result<void> substitute(const ValId & lhs, ValId rhs, bool check);

  /**
   * Bind the leading parameters of `region` to `args`.
   *
   * Binds min(args.size(), region.size()) parameters in order. The target
   * region is the least common region of the (substituted) parent and of
   * every bound argument. With every parameter bound the region's image is
   * the target; with fewer, the image is a new region under the target over
   * the remaining, substituted parameter types. Binders nested in `region`
   * are rebuilt under the image, so they never coincide with a region an
   * argument lives in.
   *
   * @return The region's image, or IncomparableRegions when the arguments
   *         do not share a scope chain
   */
  Result<Region> substitute_region(const Region & region, gsl::span<const ValId> args);

  /**
   * Push a frame for `region` and bind `args`. On failure the context is
   * restored to its state before the call.
   */
  Result<Region> push_region(const Region & region, gsl::span<const ValId> args);

  // ===== Evaluation =====

  /// Image of `value` if already known (memoized, or invariant by depth)
  [[nodiscard]] std::optional<ValId> try_evaluate(const ValId & value) const;

  /// Image of `value` under the current bindings, memoized
  Result<ValId> evaluate(const ValId & value);

  /// Image of `region` under the current bindings, memoized
  Result<Region> evaluate_region(const Region & region);

private:
  ValueMap & mutable_values();
  RegionMap & mutable_regions();

  ValueStore & store_;
  Frame top_;
  std::vector<Frame> parents_;
};

/**
 * RAII scope: restores the context to its state at construction, on every
 * exit path.
 */
class ScopeGuard
{
public:
  explicit ScopeGuard(EvalCtx & ctx) : ctx_(ctx), snapshot_(ctx.save()) {}
  ~ScopeGuard() { ctx_.restore(std::move(snapshot_)); }

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard & operator=(const ScopeGuard &) = delete;

private:
  EvalCtx & ctx_;
  EvalCtx::Snapshot snapshot_;
};

}  // namespace rvir
