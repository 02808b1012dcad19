// rvir/basic/hash.hpp - Hash combination helpers
//
// Structural hashes of node payloads are built from the identity hashes of
// their (already canonical) dependencies.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace rvir
{

/// Mix `value` into `seed` (boost::hash_combine constant, 64-bit variant)
inline void hash_combine(size_t & seed, size_t value) noexcept
{
  seed ^= value + size_t{0x9e3779b97f4a7c15ULL} + (seed << 6) + (seed >> 2);
}

template <typename T>
inline void hash_append(size_t & seed, const T & value) noexcept
{
  hash_combine(seed, std::hash<T>{}(value));
}

}  // namespace rvir
