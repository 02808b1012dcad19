// rvir/graph/traversal.cpp - Dependency-ordered graph traversal
#include "rvir/graph/traversal.hpp"

#include <unordered_set>
#include <utility>

#include "rvir/graph/node.hpp"

namespace rvir
{

namespace
{

std::vector<ValId> children_of(const ValId & v, Traversal mode)
{
  const auto deps = v->deps();
  std::vector<ValId> children(deps.begin(), deps.end());
  if (mode == Traversal::Dependencies) {
    return children;
  }

  const Region * def_region = nullptr;
  if (const auto * lambda = v->as<Lambda>()) {
    children.push_back(lambda->result);
    def_region = &lambda->def_region;
  } else if (const auto * pi = v->as<Pi>()) {
    children.push_back(pi->result);
    def_region = &pi->def_region;
  }
  if (def_region != nullptr) {
    for (const auto & ty : def_region->param_types()) {
      children.push_back(ty);
    }
  }
  if (v.ty()) {
    children.push_back(v.ty());
  }
  return children;
}

}  // namespace

std::vector<ValId> topological_order(const ValId & root, Traversal mode)
{
  std::vector<ValId> order;
  if (!root) {
    return order;
  }

  struct Entry
  {
    ValId value;
    std::vector<ValId> children;
    size_t next = 0;
  };

  std::unordered_set<ValId, ValIdHash> seen{root};
  std::vector<Entry> stack;
  stack.push_back(Entry{root, children_of(root, mode)});

  while (!stack.empty()) {
    Entry & top = stack.back();
    if (top.next < top.children.size()) {
      ValId child = top.children[top.next++];
      if (seen.insert(child).second) {
        auto grandchildren = children_of(child, mode);
        stack.push_back(Entry{std::move(child), std::move(grandchildren)});
      }
      continue;
    }
    order.push_back(std::move(top.value));
    stack.pop_back();
  }
  return order;
}

}  // namespace rvir
