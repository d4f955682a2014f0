/* Multi-source/multi-sink reduction to a single super-source and super-sink. */
#pragma once

#include <span>
#include <vector>

#include "corridorflow/core/capacity_matrix.hpp"
#include "corridorflow/core/types.hpp"

namespace corridorflow::core {

// Result of collapsing terminal sets.
//
// Layout of `matrix` (size M = N - |S| - |T| + 2):
//   index 0      super-source; edge to i is the sum of capacity[s][interior] over s in S
//   index 1..M-2 interior nodes in ascending original order
//   index M-1    super-sink; edge from i is the sum of capacity[interior][t] over t in T
// The super-sink row is all zero. Sources and sinks do not appear otherwise.
struct ReducedGraph {
  CapacityMatrix matrix;
  // Capacity on direct source->sink edges. Excluded from `matrix`; the caller adds it back.
  Flow bypass_flow {0};
  // interior_nodes[i - 1] is the original id of reduced node i.
  std::vector<NodeId> interior_nodes;

  [[nodiscard]] NodeId source() const noexcept { return 0; }
  [[nodiscard]] NodeId sink() const noexcept { return matrix.num_nodes() - 1; }

  friend bool operator==(const ReducedGraph& a, const ReducedGraph& b) noexcept {
    return a.bypass_flow == b.bypass_flow && a.matrix == b.matrix &&
           a.interior_nodes == b.interior_nodes;
  }
};

// Checks the entry-point preconditions: at least two nodes, non-empty and
// disjoint terminal sets, all ids within [0, N). Throws InvalidInput.
void validate_terminals(const CapacityMatrix& capacity,
                        std::span<const NodeId> sources,
                        std::span<const NodeId> sinks);

// Collapses sources and sinks. Terminal sets are treated as sets; either may be
// empty (the corresponding synthetic node then has no edges). Throws InvalidInput
// for out-of-range ids, ids present in both sets, or capacity sums overflowing Flow.
[[nodiscard]] ReducedGraph reduce_terminals(const CapacityMatrix& capacity,
                                            std::span<const NodeId> sources,
                                            std::span<const NodeId> sinks);

} // namespace corridorflow::core
