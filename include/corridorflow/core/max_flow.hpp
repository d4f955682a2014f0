/* Max-flow APIs: single-pair engine, multi-terminal solve, batch evaluation. */
#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "corridorflow/core/capacity_matrix.hpp"
#include "corridorflow/core/flow_state.hpp"
#include "corridorflow/core/options.hpp"
#include "corridorflow/core/types.hpp"

namespace corridorflow::core {

struct FlowSummary {
  Flow total_flow {0};
  // Direct source->sink capacity (multi-terminal solves only).
  Flow bypass_flow {0};
  // Flow found by augmenting paths.
  Flow network_flow {0};
  // Number of augmenting paths applied.
  std::int64_t iterations {0};
  // Optional outputs; populated only when requested via MaxFlowOptions.
  // For multi-terminal solves, flow_matrix is over the reduced graph while
  // min_cut and reachable_nodes use the caller's node ids.
  std::vector<Flow> flow_matrix;             // N*N row-major
  MinCut min_cut {};
  std::vector<std::uint8_t> reachable_nodes; // 0/1 flags
};

// One (sources, sinks) problem in a batch.
struct TerminalSets {
  std::vector<NodeId> sources;
  std::vector<NodeId> sinks;
};

// Edmonds-Karp between two nodes of g. Returns zero flow when src == dst or
// either id is out of range.
[[nodiscard]] std::pair<Flow, FlowSummary>
calc_max_flow(const CapacityMatrix& g, NodeId src, NodeId dst,
              const MaxFlowOptions& opts = {});

// Maximum flow from any of `sources` to any of `sinks`. Throws InvalidInput
// when preconditions are violated.
[[nodiscard]] Flow max_flow(std::span<const NodeId> sources,
                            std::span<const NodeId> sinks,
                            const CapacityMatrix& capacity);

[[nodiscard]] std::pair<Flow, FlowSummary>
solve_max_flow(std::span<const NodeId> sources,
               std::span<const NodeId> sinks,
               const CapacityMatrix& capacity,
               const MaxFlowOptions& opts = {});

[[nodiscard]] std::vector<FlowSummary>
batch_max_flow(const CapacityMatrix& capacity,
               const std::vector<TerminalSets>& problems,
               const MaxFlowOptions& opts = {});

} // namespace corridorflow::core
