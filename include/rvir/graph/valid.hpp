// rvir/graph/valid.hpp - Canonical value handles
//
// A ValId is a reference-counted pointer to a hash-consed Node. Handles
// obtained from the same ValueStore compare and hash by identity.
//
#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace rvir
{

class Node;
class Region;

/**
 * Canonical handle to an immutable IR node.
 *
 * A default-constructed ValId is empty. Universes are the only nodes whose
 * type handle is empty.
 */
class ValId
{
public:
  ValId() = default;
  explicit ValId(std::shared_ptr<const Node> node) noexcept : node_(std::move(node)) {}

  [[nodiscard]] const Node * get() const noexcept { return node_.get(); }
  const Node & operator*() const noexcept { return *node_; }
  const Node * operator->() const noexcept { return node_.get(); }

  explicit operator bool() const noexcept { return node_ != nullptr; }

  /// Type of the referenced node (empty for universes)
  [[nodiscard]] const ValId & ty() const noexcept;

  /// Region the referenced node is placed in (null region for constants)
  [[nodiscard]] const Region & region() const noexcept;

  /// Depth of the node's region
  [[nodiscard]] size_t depth() const noexcept;

  /// Number of live handles to this node, including the store's own
  [[nodiscard]] long use_count() const noexcept { return node_.use_count(); }

  friend bool operator==(const ValId & a, const ValId & b) noexcept { return a.node_ == b.node_; }

private:
  std::shared_ptr<const Node> node_;
};

/// Handles used in type position are ordinary value handles
using TypeId = ValId;

struct ValIdHash
{
  size_t operator()(const ValId & v) const noexcept { return std::hash<const Node *>{}(v.get()); }
};

}  // namespace rvir

template <>
struct std::hash<rvir::ValId>
{
  size_t operator()(const rvir::ValId & v) const noexcept { return rvir::ValIdHash{}(v); }
};
