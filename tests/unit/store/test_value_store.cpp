// tests/unit/store/test_value_store.cpp - Unit tests for hash-consing
//
// Tests interning identity, concurrent interning and collection.
//

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "rvir/graph/primitive.hpp"
#include "rvir/store/concurrent_cache.hpp"
#include "rvir/store/value_store.hpp"

using namespace rvir;

// ============================================================================
// Interning
// ============================================================================

TEST(StoreIntern, EqualPayloadsShareOneHandle)
{
  ValueStore store;
  const ValId a = make_bool(store, true);
  const ValId b = make_bool(store, true);
  EXPECT_EQ(a, b);
  EXPECT_EQ(a.get(), b.get());
}

TEST(StoreIntern, DistinctPayloadsGetDistinctHandles)
{
  ValueStore store;
  EXPECT_NE(make_bool(store, true), make_bool(store, false));
  EXPECT_NE(make_finite(store, 2), make_finite(store, 3));
  EXPECT_NE(make_universe(store, 0), make_universe(store, 1));
}

TEST(StoreIntern, SameSizeDifferentKindIsDistinct)
{
  ValueStore store;
  // Finite(2) and Index(2, 0) both carry the number 2
  EXPECT_NE(make_finite(store, 2), make_index(store, 2, 0).value());
}

TEST(StoreIntern, IndependentStoresDoNotShare)
{
  ValueStore a;
  ValueStore b;
  EXPECT_NE(make_bool(a, true), make_bool(b, true));
}

TEST(StoreIntern, SizeCountsResidentNodes)
{
  ValueStore store;
  EXPECT_TRUE(store.empty());

  const ValId t = make_bool(store, true);
  // universe, bool type, true
  EXPECT_EQ(store.size(), 3u);

  const ValId f = make_bool(store, false);
  EXPECT_EQ(store.size(), 4u);
}

TEST(StoreIntern, ConcurrentInterningYieldsOneHandlePerPayload)
{
  ValueStore store(StoreOptions{4});
  constexpr int k_threads = 8;
  constexpr uint64_t k_payloads = 64;

  std::vector<std::vector<ValId>> seen(k_threads);
  std::vector<std::thread> workers;
  for (int t = 0; t < k_threads; ++t) {
    workers.emplace_back([&store, &seen, t] {
      for (uint64_t n = 0; n < k_payloads; ++n) {
        seen[t].push_back(make_finite(store, n));
      }
    });
  }
  for (auto & w : workers) {
    w.join();
  }

  for (int t = 1; t < k_threads; ++t) {
    ASSERT_EQ(seen[t].size(), k_payloads);
    for (uint64_t n = 0; n < k_payloads; ++n) {
      EXPECT_EQ(seen[t][n], seen[0][n]) << "payload " << n << " from thread " << t;
    }
  }
  // 64 finite types plus universe 0
  EXPECT_EQ(store.size(), k_payloads + 1);
}

// ============================================================================
// Collection
// ============================================================================

TEST(StoreCollect, EvictsOnlyUnreferencedEntries)
{
  ValueStore store;
  const ValId universe = make_universe(store);
  {
    const ValId dropped = make_finite(store, 7);
    EXPECT_EQ(store.size(), 2u);
  }

  EXPECT_EQ(store.collect(), 1u);
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(make_universe(store), universe);
}

TEST(StoreCollect, ReleasesDependencyChains)
{
  ValueStore store;
  {
    const ValId t = make_bool(store, true);
  }
  EXPECT_EQ(store.collect(), 3u);
  EXPECT_TRUE(store.empty());
}

TEST(StoreCollect, HeldHandlesStayCanonical)
{
  ValueStore store;
  const ValId t = make_bool(store, true);
  EXPECT_EQ(store.collect(), 0u);
  EXPECT_EQ(make_bool(store, true), t);
}

TEST(StoreCollect, ReleasesRegions)
{
  ValueStore store;
  {
    auto region = Region::with(store, {make_bool_type(store)});
    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(store.region_count(), 1u);
  }
  store.collect();
  EXPECT_EQ(store.region_count(), 0u);
  EXPECT_TRUE(store.empty());
}

// ============================================================================
// ConcurrentCache
// ============================================================================

TEST(StoreConcurrentCache, ShardCountRoundsUpToPowerOfTwo)
{
  ConcurrentCache<std::string, std::hash<std::string>> cache(5);
  EXPECT_EQ(cache.shard_count(), 8u);

  ConcurrentCache<std::string, std::hash<std::string>> single(1);
  EXPECT_EQ(single.shard_count(), 1u);
}

TEST(StoreConcurrentCache, ShardCountIsClamped)
{
  ConcurrentCache<std::string, std::hash<std::string>> cache(size_t{1} << 30);
  EXPECT_EQ(cache.shard_count(), k_max_shard_count);
}

TEST(StoreConcurrentCache, InternAndCollectOnce)
{
  ConcurrentCache<std::string, std::hash<std::string>> cache;
  auto a = cache.intern(std::string("alpha"));
  auto b = cache.intern(std::string("alpha"));
  EXPECT_EQ(a.get(), b.get());
  {
    auto c = cache.intern(std::string("beta"));
    EXPECT_EQ(cache.size(), 2u);
  }
  EXPECT_EQ(cache.collect_once(), 1u);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(*a, "alpha");
}

TEST(StoreOptions, ShardCountFromOptions)
{
  ValueStore store(StoreOptions{32});
  EXPECT_EQ(store.options().shard_count, 32u);
}
