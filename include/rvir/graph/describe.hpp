// rvir/graph/describe.hpp - Short textual descriptions of values
//
// Used in diagnostics and tool output. Not a pretty-printer: nested values
// are elided past a fixed nesting limit.
//
#pragma once

#include <string>

#include "rvir/graph/valid.hpp"

namespace rvir
{

/**
 * One-line description of `value`, e.g. `#pi(#bool) -> #bool` or
 * `(#and %1.0 #true)`.
 *
 * @param max_nesting Nesting level past which sub-values print as `...`
 */
[[nodiscard]] std::string describe(const ValId & value, int max_nesting = 3);

}  // namespace rvir
