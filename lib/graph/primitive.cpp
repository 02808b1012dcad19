// rvir/graph/primitive.cpp - Leaf primitives
#include "rvir/graph/primitive.hpp"

#include <fmt/core.h>

#include <vector>

#include "rvir/graph/function.hpp"
#include "rvir/store/value_store.hpp"

namespace rvir
{

// ============================================================================
// Universes and types
// ============================================================================

ValId make_universe(ValueStore & store, uint32_t level)
{
  return store.intern(Node(Universe{level}, TypeId{}, Region{}));
}

TypeId make_bool_type(ValueStore & store)
{
  return store.intern(Node(BoolType{}, make_universe(store), Region{}));
}

TypeId make_finite(ValueStore & store, uint64_t size)
{
  return store.intern(Node(Finite{size}, make_universe(store), Region{}));
}

// ============================================================================
// Constants
// ============================================================================

ValId make_bool(ValueStore & store, bool value)
{
  return store.intern(Node(Bool{value}, make_bool_type(store), Region{}));
}

Result<ValId> make_index(ValueStore & store, uint64_t size, uint64_t index)
{
  if (index >= size) {
    return fail(
      ErrorKind::InvalidIndex, fmt::format("index {} into finite type of size {}", index, size));
  }
  return store.intern(Node(Index{size, index}, make_finite(store, size), Region{}));
}

// ============================================================================
// Logical operators
// ============================================================================

uint64_t logical_mask(uint8_t arity) noexcept
{
  if (arity >= k_max_logical_arity) {
    return ~uint64_t{0};
  }
  return (uint64_t{1} << (uint64_t{1} << arity)) - 1;
}

Logical logical_apply(const Logical & l, bool arg) noexcept
{
  const auto rest = static_cast<uint8_t>(l.arity - 1);
  const uint64_t half = uint64_t{1} << rest;
  const uint64_t table = arg ? (l.table >> half) : l.table;
  return Logical{rest, table & logical_mask(rest)};
}

Logical logical_table(LogicalOp op) noexcept
{
  switch (op) {
    case LogicalOp::Id:
      return Logical{1, 0b10};
    case LogicalOp::Not:
      return Logical{1, 0b01};
    case LogicalOp::And:
      return Logical{2, 0b1000};
    case LogicalOp::Or:
      return Logical{2, 0b1110};
    case LogicalOp::Xor:
      return Logical{2, 0b0110};
    case LogicalOp::Nand:
      return Logical{2, 0b0111};
    case LogicalOp::Nor:
      return Logical{2, 0b0001};
    case LogicalOp::Iff:
      return Logical{2, 0b1001};
  }
  return Logical{1, 0b10};
}

Result<TypeId> logical_type(ValueStore & store, uint8_t arity)
{
  const TypeId bool_ty = make_bool_type(store);
  auto region = Region::with(store, std::vector<TypeId>(arity, bool_ty));
  if (!region) {
    return fail(std::move(region.error()));
  }
  return make_pi(store, bool_ty, *region);
}

Result<ValId> make_logical(ValueStore & store, uint8_t arity, uint64_t table)
{
  if (arity == 0 || arity > k_max_logical_arity) {
    return fail(
      ErrorKind::InvalidLogical,
      fmt::format("arity {} outside 1..{}", arity, k_max_logical_arity));
  }
  if ((table & ~logical_mask(arity)) != 0) {
    return fail(
      ErrorKind::InvalidLogical,
      fmt::format("truth table {:#x} has bits beyond arity {}", table, arity));
  }
  auto ty = logical_type(store, arity);
  if (!ty) {
    return ty;
  }
  return store.intern(Node(Logical{arity, table}, *ty, Region{}));
}

ValId make_logical(ValueStore & store, LogicalOp op)
{
  const Logical l = logical_table(op);
  // Named tables are always valid
  return make_logical(store, l.arity, l.table).value();
}

}  // namespace rvir
