/* Per-call options for max-flow entry points. */
#pragma once

namespace corridorflow::core {

struct MaxFlowOptions {
  // Copy the final flow matrix of the solved graph into FlowSummary::flow_matrix.
  bool with_flow_matrix {false};
  // Derive a minimum cut from the final residual graph.
  bool with_min_cut {false};
  // Report source-side reachability in the final residual graph.
  bool with_reachable {false};
};

} // namespace corridorflow::core
