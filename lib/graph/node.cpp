// rvir/graph/node.cpp - Node payload hashing and dependency views
#include "rvir/graph/node.hpp"

#include <stdexcept>
#include <utility>

#include "rvir/basic/hash.hpp"

namespace rvir
{

namespace
{

void hash_values(size_t & seed, const std::vector<ValId> & values)
{
  hash_combine(seed, values.size());
  for (const auto & v : values) {
    hash_combine(seed, ValIdHash{}(v));
  }
}

size_t payload_hash(const Parameter & p)
{
  size_t seed = RegionHash{}(p.region);
  hash_combine(seed, p.index);
  return seed;
}

size_t payload_hash(const Application & a)
{
  size_t seed = 0;
  hash_values(seed, a.args);
  return seed;
}

size_t payload_hash(const Lambda & l)
{
  size_t seed = RegionHash{}(l.def_region);
  hash_combine(seed, ValIdHash{}(l.result));
  return seed;
}

size_t payload_hash(const Pi & p)
{
  size_t seed = RegionHash{}(p.def_region);
  hash_combine(seed, ValIdHash{}(p.result));
  return seed;
}

size_t payload_hash(const Tuple & t)
{
  size_t seed = 0;
  hash_values(seed, t.elements);
  return seed;
}

size_t payload_hash(const Product & p)
{
  size_t seed = 0;
  hash_values(seed, p.elements);
  return seed;
}

size_t payload_hash(const Ternary & t)
{
  size_t seed = ValIdHash{}(t.high());
  hash_combine(seed, ValIdHash{}(t.low()));
  return seed;
}

size_t payload_hash(const BoolType &) { return 0; }

size_t payload_hash(const Bool & b) { return b.value ? 1 : 0; }

size_t payload_hash(const Finite & f) { return std::hash<uint64_t>{}(f.size); }

size_t payload_hash(const Index & ix)
{
  size_t seed = std::hash<uint64_t>{}(ix.size);
  hash_append(seed, ix.index);
  return seed;
}

size_t payload_hash(const Logical & l)
{
  size_t seed = l.arity;
  hash_append(seed, l.table);
  return seed;
}

size_t payload_hash(const Universe & u) { return u.level; }

}  // namespace

const char * to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::Parameter:
      return "parameter";
    case NodeKind::Application:
      return "application";
    case NodeKind::Lambda:
      return "lambda";
    case NodeKind::Pi:
      return "pi";
    case NodeKind::Tuple:
      return "tuple";
    case NodeKind::Product:
      return "product";
    case NodeKind::Ternary:
      return "ternary";
    case NodeKind::BoolType:
      return "bool_type";
    case NodeKind::Bool:
      return "bool";
    case NodeKind::Finite:
      return "finite";
    case NodeKind::Index:
      return "index";
    case NodeKind::Logical:
      return "logical";
    case NodeKind::Universe:
      return "universe";
  }
  return "unknown";
}

// ============================================================================
// Node
// ============================================================================

Node::Node(NodeData data, TypeId type, Region region)
: data_(std::move(data)), type_(std::move(type)), region_(std::move(region))
{
  hash_ = data_.index();
  hash_combine(
    hash_, std::visit([](const auto & payload) { return payload_hash(payload); }, data_));
}

gsl::span<const ValId> Node::deps() const noexcept
{
  if (const auto * app = as<Application>()) {
    return gsl::span<const ValId>(app->args);
  }
  if (const auto * lambda = as<Lambda>()) {
    return gsl::span<const ValId>(lambda->free_deps);
  }
  if (const auto * pi = as<Pi>()) {
    return gsl::span<const ValId>(pi->free_deps);
  }
  if (const auto * tuple = as<Tuple>()) {
    return gsl::span<const ValId>(tuple->elements);
  }
  if (const auto * product = as<Product>()) {
    return gsl::span<const ValId>(product->elements);
  }
  if (const auto * ternary = as<Ternary>()) {
    return gsl::span<const ValId>(ternary->branches);
  }
  return {};
}

const ValId & Node::dep_at(size_t index) const
{
  const auto d = deps();
  if (index >= d.size()) {
    throw std::out_of_range("Node::dep_at: dependency index out of range");
  }
  return d[index];
}

// ============================================================================
// ValId accessors
// ============================================================================

const ValId & ValId::ty() const noexcept { return node_->type(); }

const Region & ValId::region() const noexcept { return node_->region(); }

size_t ValId::depth() const noexcept { return node_ ? node_->depth() : 0; }

// ============================================================================
// Queries
// ============================================================================

bool is_type(const ValId & v) noexcept
{
  if (!v) {
    return false;
  }
  if (v->is<Universe>()) {
    return true;
  }
  return v.ty() && v.ty()->is<Universe>();
}

uint32_t universe_level(const TypeId & ty) noexcept
{
  if (const auto * u = ty->as<Universe>()) {
    return u->level + 1;
  }
  if (ty.ty()) {
    if (const auto * u = ty.ty()->as<Universe>()) {
      return u->level;
    }
  }
  return 0;
}

}  // namespace rvir
