// rvir/graph/primitive.hpp - Leaf primitives (universes, booleans, finite types)
//
// Leaf constants live in the global region. Applicable leaves (logical
// operators) fold on constant arguments and otherwise stay symbolic.
//
#pragma once

#include <cstdint>

#include "rvir/basic/error.hpp"
#include "rvir/graph/node.hpp"

namespace rvir
{

class ValueStore;

// ============================================================================
// Universes and types
// ============================================================================

[[nodiscard]] ValId make_universe(ValueStore & store, uint32_t level = 0);

[[nodiscard]] TypeId make_bool_type(ValueStore & store);

/// Finite type with `size` inhabitants (`size == 0` is the empty type)
[[nodiscard]] TypeId make_finite(ValueStore & store, uint64_t size);

// ============================================================================
// Constants
// ============================================================================

[[nodiscard]] ValId make_bool(ValueStore & store, bool value);

/**
 * Inhabitant `index` of Finite(`size`).
 *
 * @return The index, or InvalidIndex when `index >= size`
 */
[[nodiscard]] Result<ValId> make_index(ValueStore & store, uint64_t size, uint64_t index);

// ============================================================================
// Logical operators
// ============================================================================

inline constexpr uint8_t k_max_logical_arity = 6;

enum class LogicalOp : uint8_t {
  Id,
  Not,
  And,
  Or,
  Xor,
  Nand,
  Nor,
  Iff,
};

/// Truth table of a named operator
[[nodiscard]] Logical logical_table(LogicalOp op) noexcept;

/**
 * Logical operator from a truth table.
 *
 * @param arity Number of boolean arguments, 1 to k_max_logical_arity
 * @param table Truth table; bits beyond 2^arity must be clear
 * @return The operator, or InvalidLogical
 */
[[nodiscard]] Result<ValId> make_logical(ValueStore & store, uint8_t arity, uint64_t table);

[[nodiscard]] ValId make_logical(ValueStore & store, LogicalOp op);

/// Type of a logical operator of the given arity: Pi(bool^arity) -> bool
[[nodiscard]] Result<TypeId> logical_type(ValueStore & store, uint8_t arity);

/// Bit mask covering a truth table of the given arity
[[nodiscard]] uint64_t logical_mask(uint8_t arity) noexcept;

/**
 * Fix the first argument of a truth table.
 *
 * The result has arity `l.arity - 1`; at arity 0 bit 0 holds the value.
 */
[[nodiscard]] Logical logical_apply(const Logical & l, bool arg) noexcept;

}  // namespace rvir
