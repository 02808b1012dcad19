// rvir/graph/application.hpp - Application nodes
#pragma once

#include <vector>

#include "rvir/basic/error.hpp"
#include "rvir/graph/valid.hpp"

namespace rvir
{

class EvalCtx;
class ValueStore;

/**
 * Apply `args[0]` to `args[1..]`.
 *
 * Runs the curried application protocol. A reduced application returns its
 * value; a stuck one interns an Application node typed by the symbolic
 * result. Applications of stuck applications are flattened, so
 * `(f a) b` and `f a b` are the same node.
 *
 * @return The value, or the first error raised while applying
 */
[[nodiscard]] Result<ValId> make_application(EvalCtx & ctx, std::vector<ValId> args);

/// make_application() with a fresh evaluation context
[[nodiscard]] Result<ValId> make_application(ValueStore & store, std::vector<ValId> args);

}  // namespace rvir
