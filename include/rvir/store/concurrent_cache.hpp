// rvir/store/concurrent_cache.hpp - Sharded hash-consing cache
//
// Maps structurally equal immutable payloads to one shared allocation.
// Each shard is a hash set guarded by its own reader/writer lock; only the
// shard a payload hashes to is ever locked.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rvir
{

inline constexpr size_t k_default_shard_count = 16;
inline constexpr size_t k_max_shard_count = 1024;

/**
 * Concurrent interning cache.
 *
 * @tparam T Immutable payload type (equality comparable)
 * @tparam Hash Structural hash of T
 */
template <typename T, typename Hash>
class ConcurrentCache
{
public:
  using Handle = std::shared_ptr<const T>;

  /**
   * @param shard_count Number of shards, rounded up to a power of two and
   *                    clamped to k_max_shard_count
   */
  explicit ConcurrentCache(size_t shard_count = k_default_shard_count)
  {
    const size_t wanted = std::min(shard_count, k_max_shard_count);
    size_t count = 1;
    while (count < wanted) {
      count <<= 1;
    }
    shards_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      shards_.push_back(std::make_unique<Shard>());
    }
    mask_ = count - 1;
  }

  ConcurrentCache(const ConcurrentCache &) = delete;
  ConcurrentCache & operator=(const ConcurrentCache &) = delete;

  /**
   * Return the resident handle equal to `value`, inserting it if absent.
   */
  [[nodiscard]] Handle intern(T && value)
  {
    Shard & shard = shard_for(Hash{}(value));
    {
      std::shared_lock lock(shard.mutex);
      if (auto it = shard.entries.find(value); it != shard.entries.end()) {
        return *it;
      }
    }
    std::unique_lock lock(shard.mutex);
    if (auto it = shard.entries.find(value); it != shard.entries.end()) {
      return *it;
    }
    auto handle = std::make_shared<const T>(std::move(value));
    shard.entries.insert(handle);
    return handle;
  }

  /**
   * Evict every entry held by nobody but the cache (single pass).
   *
   * Destroying an evicted payload only decrements the counts of its
   * children; they are picked up by a later pass.
   *
   * @return Number of evicted entries
   */
  size_t collect_once()
  {
    size_t evicted = 0;
    for (auto & shard : shards_) {
      std::unique_lock lock(shard->mutex);
      evicted += std::erase_if(
        shard->entries, [](const Handle & handle) { return handle.use_count() == 1; });
    }
    return evicted;
  }

  [[nodiscard]] size_t size() const
  {
    size_t total = 0;
    for (const auto & shard : shards_) {
      std::shared_lock lock(shard->mutex);
      total += shard->entries.size();
    }
    return total;
  }

  [[nodiscard]] bool empty() const { return size() == 0; }

  [[nodiscard]] size_t shard_count() const noexcept { return shards_.size(); }

private:
  struct HandleHash
  {
    using is_transparent = void;
    size_t operator()(const Handle & handle) const noexcept { return Hash{}(*handle); }
    size_t operator()(const T & value) const noexcept { return Hash{}(value); }
  };

  struct HandleEqual
  {
    using is_transparent = void;
    bool operator()(const Handle & a, const Handle & b) const noexcept { return *a == *b; }
    bool operator()(const Handle & a, const T & b) const noexcept { return *a == b; }
    bool operator()(const T & a, const Handle & b) const noexcept { return a == *b; }
  };

  struct Shard
  {
    mutable std::shared_mutex mutex;
    std::unordered_set<Handle, HandleHash, HandleEqual> entries;
  };

  Shard & shard_for(size_t hash) noexcept { return *shards_[(hash ^ (hash >> 29)) & mask_]; }

  std::vector<std::unique_ptr<Shard>> shards_;
  size_t mask_ = 0;
};

}  // namespace rvir
