// rvir/graph/json_dump.cpp - JSON serialization of value graphs
#include "rvir/graph/json_dump.hpp"

#include <unordered_map>

#include "rvir/graph/node.hpp"
#include "rvir/graph/traversal.hpp"

namespace rvir
{

namespace
{

using nlohmann::json;
using IdMap = std::unordered_map<ValId, size_t, ValIdHash>;

json j_ref(const IdMap & ids, const ValId & v)
{
  if (!v) return nullptr;
  auto it = ids.find(v);
  return it == ids.end() ? json(nullptr) : json(it->second);
}

json j_region(const IdMap & ids, const Region & r)
{
  if (r.is_null()) return nullptr;
  json params = json::array();
  for (const auto & ty : r.param_types()) {
    params.push_back(j_ref(ids, ty));
  }
  return json{{"depth", r.depth()}, {"params", params}};
}

// ============================================================================
// Payload serialization
// ============================================================================

class PayloadWriter
{
public:
  PayloadWriter(const IdMap & ids, json & out) : ids_(ids), out_(out) {}

  void operator()(const Parameter & p)
  {
    out_["index"] = p.index;
    out_["binder"] = j_region(ids_, p.region);
  }
  void operator()(const Application &) {}
  void operator()(const Lambda & l)
  {
    out_["result"] = j_ref(ids_, l.result);
    out_["def_region"] = j_region(ids_, l.def_region);
  }
  void operator()(const Pi & p)
  {
    out_["result"] = j_ref(ids_, p.result);
    out_["def_region"] = j_region(ids_, p.def_region);
  }
  void operator()(const Tuple &) {}
  void operator()(const Product &) {}
  void operator()(const Ternary &) {}
  void operator()(const BoolType &) {}
  void operator()(const Bool & b) { out_["value"] = b.value; }
  void operator()(const Finite & f) { out_["size"] = f.size; }
  void operator()(const Index & ix)
  {
    out_["size"] = ix.size;
    out_["index"] = ix.index;
  }
  void operator()(const Logical & l)
  {
    out_["arity"] = l.arity;
    out_["table"] = l.table;
  }
  void operator()(const Universe & u) { out_["level"] = u.level; }

private:
  const IdMap & ids_;
  json & out_;
};

}  // namespace

nlohmann::json to_json(const ValId & root)
{
  if (!root) return json{{"root", nullptr}, {"nodes", json::array()}};

  const auto order = topological_order(root, Traversal::Full);
  IdMap ids;
  ids.reserve(order.size());
  for (size_t i = 0; i < order.size(); ++i) {
    ids.emplace(order[i], i);
  }

  json nodes = json::array();
  for (size_t i = 0; i < order.size(); ++i) {
    const ValId & v = order[i];
    json deps = json::array();
    for (const auto & d : v->deps()) {
      deps.push_back(j_ref(ids, d));
    }
    json node{
      {"id", i},
      {"kind", to_string(v->kind())},
      {"depth", v.depth()},
      {"type", j_ref(ids, v.ty())},
      {"deps", deps}};
    std::visit(PayloadWriter(ids, node), v->data());
    nodes.push_back(std::move(node));
  }
  return json{{"root", ids.at(root)}, {"nodes", nodes}};
}

}  // namespace rvir
