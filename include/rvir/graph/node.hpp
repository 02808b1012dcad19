// rvir/graph/node.hpp - IR node payloads
//
// A Node is an immutable, hash-consed value: a closed variant of payload
// kinds plus the cached type and placement region computed by the typed
// constructors. Nodes are only created through the constructors declared in
// the other rvir/graph headers.
//
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <variant>
#include <vector>

#include "rvir/graph/valid.hpp"
#include "rvir/region/region.hpp"

namespace rvir
{

// ============================================================================
// Payload Kinds
// ============================================================================

/// Parameter `index` of a binder region
struct Parameter
{
  Region region;
  size_t index = 0;

  friend bool operator==(const Parameter &, const Parameter &) = default;
};

/// Stuck application; `args[0]` is the applied function
struct Application
{
  std::vector<ValId> args;

  friend bool operator==(const Application &, const Application &) = default;
};

/**
 * Abstraction over `def_region`.
 *
 * `free_deps` are the body nodes living above `def_region`; they are derived
 * from `result` and do not take part in equality.
 */
struct Lambda
{
  Region def_region;
  ValId result;
  std::vector<ValId> free_deps;

  friend bool operator==(const Lambda & a, const Lambda & b) noexcept
  {
    return a.def_region == b.def_region && a.result == b.result;
  }
};

/// Dependent function type over `def_region`
struct Pi
{
  Region def_region;
  TypeId result;
  std::vector<ValId> free_deps;

  friend bool operator==(const Pi & a, const Pi & b) noexcept
  {
    return a.def_region == b.def_region && a.result == b.result;
  }
};

struct Tuple
{
  std::vector<ValId> elements;

  friend bool operator==(const Tuple &, const Tuple &) = default;
};

struct Product
{
  std::vector<TypeId> elements;

  friend bool operator==(const Product &, const Product &) = default;
};

/// Boolean selector: applied to `true` gives `high`, to `false` gives `low`
struct Ternary
{
  std::array<ValId, 2> branches;  // {high, low}

  [[nodiscard]] const ValId & high() const noexcept { return branches[0]; }
  [[nodiscard]] const ValId & low() const noexcept { return branches[1]; }

  friend bool operator==(const Ternary &, const Ternary &) = default;
};

struct BoolType
{
  friend bool operator==(const BoolType &, const BoolType &) = default;
};

struct Bool
{
  bool value = false;

  friend bool operator==(const Bool &, const Bool &) = default;
};

/// Finite type with `size` inhabitants
struct Finite
{
  uint64_t size = 0;

  friend bool operator==(const Finite &, const Finite &) = default;
};

/// Inhabitant `index` of a finite type
struct Index
{
  uint64_t size = 0;
  uint64_t index = 0;

  friend bool operator==(const Index &, const Index &) = default;
};

/**
 * Boolean operator of `arity` arguments given as a truth table.
 *
 * Bit `i` of `table` is the result for the argument vector whose bits spell
 * `i`, the first argument being the most significant bit.
 */
struct Logical
{
  uint8_t arity = 0;
  uint64_t table = 0;

  friend bool operator==(const Logical &, const Logical &) = default;
};

/// Type universe; universes are the only untyped nodes
struct Universe
{
  uint32_t level = 0;

  friend bool operator==(const Universe &, const Universe &) = default;
};

using NodeData = std::variant<
  Parameter, Application, Lambda, Pi, Tuple, Product, Ternary, BoolType, Bool, Finite, Index,
  Logical, Universe>;

/// Kind tags, in NodeData alternative order
enum class NodeKind : uint8_t {
  Parameter,
  Application,
  Lambda,
  Pi,
  Tuple,
  Product,
  Ternary,
  BoolType,
  Bool,
  Finite,
  Index,
  Logical,
  Universe,
};

[[nodiscard]] const char * to_string(NodeKind kind) noexcept;

// ============================================================================
// Node
// ============================================================================

class Node
{
public:
  Node(NodeData data, TypeId type, Region region);

  [[nodiscard]] NodeKind kind() const noexcept { return static_cast<NodeKind>(data_.index()); }
  [[nodiscard]] const NodeData & data() const noexcept { return data_; }

  template <typename T>
  [[nodiscard]] bool is() const noexcept
  {
    return std::holds_alternative<T>(data_);
  }

  template <typename T>
  [[nodiscard]] const T * as() const noexcept
  {
    return std::get_if<T>(&data_);
  }

  [[nodiscard]] const TypeId & type() const noexcept { return type_; }
  [[nodiscard]] const Region & region() const noexcept { return region_; }
  [[nodiscard]] size_t depth() const noexcept { return region_.depth(); }

  /// Ordered dependency list
  [[nodiscard]] gsl::span<const ValId> deps() const noexcept;
  [[nodiscard]] size_t dep_count() const noexcept { return deps().size(); }
  [[nodiscard]] const ValId & dep_at(size_t index) const;

  [[nodiscard]] size_t hash() const noexcept { return hash_; }

  friend bool operator==(const Node & a, const Node & b) noexcept
  {
    return a.hash_ == b.hash_ && a.data_ == b.data_;
  }

private:
  NodeData data_;
  TypeId type_;
  Region region_;
  size_t hash_;
};

struct NodeHash
{
  size_t operator()(const Node & node) const noexcept { return node.hash(); }
};

// ============================================================================
// Queries
// ============================================================================

[[nodiscard]] inline const TypeId & type_of(const ValId & v) noexcept { return v.ty(); }

/// True for universes and for values whose type is a universe
[[nodiscard]] bool is_type(const ValId & v) noexcept;

/// Level of the universe a type lives in
[[nodiscard]] uint32_t universe_level(const TypeId & ty) noexcept;

}  // namespace rvir
