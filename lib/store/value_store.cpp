// rvir/store/value_store.cpp - Hash-consing store implementation
#include "rvir/store/value_store.hpp"

#include <utility>

namespace rvir
{

ValueStore::ValueStore() : ValueStore(StoreOptions{}) {}

ValueStore::ValueStore(StoreOptions options)
: options_(options), nodes_(options.shard_count), regions_(options.shard_count)
{
}

ValId ValueStore::intern(Node node) { return ValId(nodes_.intern(std::move(node))); }

Region ValueStore::intern_region(RegionData data)
{
  return Region(regions_.intern(std::move(data)));
}

size_t ValueStore::collect()
{
  size_t total = 0;
  while (true) {
    // Nodes first: a dropped node may release the last use of its region,
    // and a dropped region releases its parameter types.
    const size_t evicted = nodes_.collect_once() + regions_.collect_once();
    if (evicted == 0) {
      break;
    }
    total += evicted;
  }
  return total;
}

}  // namespace rvir
