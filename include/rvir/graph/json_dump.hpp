// rvir/graph/json_dump.hpp - JSON serialization of value graphs
//
// Produces a flat, dependency-ordered node table. Node ids are positions in
// the table; every reference points to an earlier entry.
//
#pragma once

#include <nlohmann/json.hpp>

#include "rvir/graph/valid.hpp"

namespace rvir
{

/**
 * Serialize the graph reachable from `root` (types and binder bodies
 * included).
 *
 * @param root Root value
 * @return {"root": <id>, "nodes": [...]}
 */
[[nodiscard]] nlohmann::json to_json(const ValId & root);

}  // namespace rvir
