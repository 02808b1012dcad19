// rvir/graph/traversal.hpp - Dependency-ordered graph traversal
#pragma once

#include <cstdint>
#include <vector>

#include "rvir/graph/valid.hpp"

namespace rvir
{

enum class Traversal : uint8_t {
  /// Follow Node::deps() only
  Dependencies,
  /// Also follow types, binder results and binder parameter types
  Full,
};

/**
 * Every node reachable from `root`, each listed after all of the nodes it
 * reaches (root last). Shared sub-graphs are listed once.
 */
[[nodiscard]] std::vector<ValId> topological_order(
  const ValId & root, Traversal mode = Traversal::Dependencies);

}  // namespace rvir
