/* Breadth-first augmenting path search over residual capacities. */
#pragma once

#include <optional>

#include "corridorflow/core/flow_state.hpp"
#include "corridorflow/core/types.hpp"

namespace corridorflow::core {

// Returns a fewest-hop path from src to dst whose every edge has strictly
// positive residual in fs, or std::nullopt when none exists. Neighbours are
// scanned in ascending node order, so ties between equal-length paths go to
// the lowest index at each branching point. Each node is expanded at most once.
// Out-of-range ids and src == dst yield std::nullopt.
[[nodiscard]] std::optional<Path>
find_augmenting_path(const FlowState& fs, NodeId src, NodeId dst);

} // namespace corridorflow::core
