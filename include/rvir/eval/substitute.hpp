// rvir/eval/substitute.hpp - Per-kind substitution
#pragma once

#include "rvir/basic/error.hpp"
#include "rvir/eval/eval_ctx.hpp"
#include "rvir/graph/valid.hpp"

namespace rvir
{

/**
 * Rebuild `value` with its dependencies replaced by their images in `ctx`.
 *
 * Called by EvalCtx::evaluate on cache misses; does not memoize `value`
 * itself. Rebuilt nodes go through the ordinary constructors, so
 * applications whose function became known are reduced on the way.
 */
[[nodiscard]] Result<ValId> substitute_node(EvalCtx & ctx, const ValId & value);

}  // namespace rvir
