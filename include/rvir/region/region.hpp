// rvir/region/region.hpp - Region tree (lexical scopes)
//
// A region is an immutable, hash-consed scope: an ordered list of parameter
// types plus a parent link. The null region is the global scope (depth 0).
// Regions are partially ordered by ancestry.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <memory>
#include <vector>

#include "rvir/basic/error.hpp"
#include "rvir/graph/valid.hpp"

namespace rvir
{

class RegionData;
class ValueStore;

// ============================================================================
// Region Handle
// ============================================================================

/**
 * Canonical handle to a region.
 *
 * Regions from the same store compare by identity. A default-constructed
 * Region is the null (global) region.
 */
class Region
{
public:
  Region() = default;

  /**
   * Build (or find) the canonical region with the given parameter types.
   *
   * @param store Store the region is interned in
   * @param param_types Declared parameter types, in order
   * @param parent Enclosing region (null for a top-level region)
   * @return The region, or NotAType / IncomparableRegions if a parameter type
   *         is not a type or does not live at-or-above `parent`
   */
  [[nodiscard]] static Result<Region> with(
    ValueStore & store, std::vector<TypeId> param_types, Region parent = {});

  [[nodiscard]] bool is_null() const noexcept { return data_ == nullptr; }
  explicit operator bool() const noexcept { return data_ != nullptr; }

  [[nodiscard]] size_t depth() const noexcept;
  [[nodiscard]] Region parent() const;
  [[nodiscard]] gsl::span<const TypeId> param_types() const noexcept;
  [[nodiscard]] size_t size() const noexcept { return param_types().size(); }

  /// Ancestor at the given depth (self when `depth == this->depth()`)
  [[nodiscard]] Region ancestor_at(size_t depth) const;

  [[nodiscard]] bool is_ancestor_or_self_of(const Region & other) const;

  [[nodiscard]] const RegionData * get() const noexcept { return data_.get(); }

  friend bool operator==(const Region & a, const Region & b) noexcept { return a.data_ == b.data_; }

private:
  friend class ValueStore;
  explicit Region(std::shared_ptr<const RegionData> data) noexcept : data_(std::move(data)) {}

  std::shared_ptr<const RegionData> data_;
};

struct RegionHash
{
  size_t operator()(const Region & r) const noexcept
  {
    return std::hash<const RegionData *>{}(r.get());
  }
};

// ============================================================================
// Region Payload
// ============================================================================

/**
 * Interned region payload. Equality is structural over parameter type
 * identities and parent identity.
 */
class RegionData
{
public:
  RegionData(std::vector<TypeId> param_types, Region parent);

  [[nodiscard]] const std::vector<TypeId> & param_types() const noexcept { return param_types_; }
  [[nodiscard]] const Region & parent() const noexcept { return parent_; }
  [[nodiscard]] size_t depth() const noexcept { return depth_; }
  [[nodiscard]] size_t hash() const noexcept { return hash_; }

  friend bool operator==(const RegionData & a, const RegionData & b) noexcept
  {
    return a.hash_ == b.hash_ && a.parent_ == b.parent_ && a.param_types_ == b.param_types_;
  }

private:
  std::vector<TypeId> param_types_;
  Region parent_;
  size_t depth_;
  size_t hash_;
};

struct RegionDataHash
{
  size_t operator()(const RegionData & data) const noexcept { return data.hash(); }
};

// ============================================================================
// Partial Order
// ============================================================================

/// Relation of `a` to `b`: Ancestor means `a` strictly encloses `b`
enum class RegionOrdering : uint8_t {
  Ancestor,
  Descendant,
  Equal,
  Incomparable,
};

[[nodiscard]] RegionOrdering compare(const Region & a, const Region & b);

/**
 * Least common region of two regions: the deeper of the two when they are
 * comparable, i.e. the innermost scope that sees both.
 *
 * @return The region, or IncomparableRegions
 */
[[nodiscard]] Result<Region> least_common(const Region & a, const Region & b);

/// Pairwise reduction of least_common; null regions are skipped
[[nodiscard]] Result<Region> least_common(gsl::span<const Region> regions);

}  // namespace rvir
