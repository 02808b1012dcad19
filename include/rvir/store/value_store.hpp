// rvir/store/value_store.hpp - Hash-consing store for nodes and regions
//
// The ValueStore owns the canonical copy of every live node and region.
// It is an ordinary object: tests and tools create as many independent
// stores as they need.
//
#pragma once

#include <cstddef>

#include "rvir/graph/node.hpp"
#include "rvir/region/region.hpp"
#include "rvir/store/concurrent_cache.hpp"

namespace rvir
{

struct StoreOptions
{
  /// Shards per table (rounded up to a power of two)
  size_t shard_count = k_default_shard_count;
};

/**
 * Interning service for nodes and regions.
 *
 * Thread-safe: any number of threads may intern and collect concurrently.
 */
class ValueStore
{
public:
  ValueStore();
  explicit ValueStore(StoreOptions options);

  ValueStore(const ValueStore &) = delete;
  ValueStore & operator=(const ValueStore &) = delete;

  /// Canonical handle for a node payload; never fails
  [[nodiscard]] ValId intern(Node node);

  /// Canonical handle for a region payload; never fails
  [[nodiscard]] Region intern_region(RegionData data);

  /**
   * Evict every node and region no longer referenced outside the store.
   *
   * Repeats until a pass evicts nothing, so chains of otherwise unreferenced
   * dependencies are released in one call. Handles held by callers are never
   * invalidated.
   *
   * @return Total number of evicted entries
   */
  size_t collect();

  /// Number of resident nodes
  [[nodiscard]] size_t size() const { return nodes_.size(); }
  [[nodiscard]] bool empty() const { return nodes_.empty(); }

  /// Number of resident regions
  [[nodiscard]] size_t region_count() const { return regions_.size(); }

  [[nodiscard]] const StoreOptions & options() const noexcept { return options_; }

private:
  StoreOptions options_;
  ConcurrentCache<Node, NodeHash> nodes_;
  ConcurrentCache<RegionData, RegionDataHash> regions_;
};

}  // namespace rvir
