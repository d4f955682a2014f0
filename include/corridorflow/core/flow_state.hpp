/*
  FlowState — skew-symmetric flow matrix over a CapacityMatrix.
  Tracks residual capacity and applies augmentations along paths.
*/
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "corridorflow/core/capacity_matrix.hpp"
#include "corridorflow/core/types.hpp"

namespace corridorflow::core {

struct MinCut { std::vector<Edge> edges; };

// FlowState owns the per-solve flow matrix for an immutable CapacityMatrix.
// Invariants: flow(u,v) == -flow(v,u) and residual(u,v) >= 0 for all pairs.
// The matrix must outlive the state.
class FlowState {
public:
  explicit FlowState(const CapacityMatrix& g);
  FlowState(CapacityMatrix&&) = delete;
  ~FlowState() noexcept = default;

  [[nodiscard]] const CapacityMatrix& capacity() const noexcept { return *g_; }
  [[nodiscard]] std::int32_t num_nodes() const noexcept { return g_->num_nodes(); }

  [[nodiscard]] Flow flow(NodeId u, NodeId v) const noexcept { return flow_[index(u, v)]; }
  [[nodiscard]] Cap residual(NodeId u, NodeId v) const noexcept {
    return g_->at(u, v) - flow_[index(u, v)];
  }

  // Row-major N*N view of net flow.
  [[nodiscard]] std::span<const Flow> flow_view() const noexcept { return flow_; }

  // Minimum residual over consecutive edges of path; 0 for paths shorter than two nodes.
  [[nodiscard]] Flow bottleneck(std::span<const NodeId> path) const;

  // Push the path's bottleneck along it, updating both directions of every
  // edge. Returns the amount pushed. Throws std::invalid_argument if the path
  // names a node outside [0, N).
  Flow augment(std::span<const NodeId> path);

  // Nodes reachable from src over edges with positive residual (0/1 flags).
  [[nodiscard]] std::vector<std::uint8_t> reachable_from(NodeId src) const;

  // Edges leaving the residual-reachable side of src with positive capacity.
  // After a maximum flow these are saturated and their capacities sum to the flow value.
  [[nodiscard]] MinCut compute_min_cut(NodeId src) const;

private:
  void check_path(std::span<const NodeId> path) const;
  [[nodiscard]] std::size_t index(NodeId u, NodeId v) const noexcept {
    return static_cast<std::size_t>(u) * static_cast<std::size_t>(g_->num_nodes()) + static_cast<std::size_t>(v);
  }

  const CapacityMatrix* g_ {nullptr};
  std::vector<Flow> flow_;
};

} // namespace corridorflow::core
