/*
  FlowState — flow matrix bookkeeping for augmenting-path max-flow.

  Augmentation pushes the path bottleneck forward and subtracts it from the
  reverse direction, keeping the matrix skew-symmetric so later paths can
  cancel earlier flow. Residual reachability drives min-cut extraction.
*/
#include "corridorflow/core/flow_state.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <stdexcept>
#include <string>

namespace corridorflow::core {

FlowState::FlowState(const CapacityMatrix& g)
  : g_(&g),
    flow_(static_cast<std::size_t>(g.num_nodes()) * static_cast<std::size_t>(g.num_nodes()), 0) {}

void FlowState::check_path(std::span<const NodeId> path) const {
  const auto N = g_->num_nodes();
  for (auto v : path) {
    if (v < 0 || v >= N) {
      throw std::invalid_argument("FlowState: path node " + std::to_string(v) +
                                  " out of range [0, " + std::to_string(N) + ")");
    }
  }
}

Flow FlowState::bottleneck(std::span<const NodeId> path) const {
  if (path.size() < 2) return 0;
  check_path(path);
  Flow b = std::numeric_limits<Flow>::max();
  for (std::size_t i = 1; i < path.size(); ++i) {
    b = std::min(b, residual(path[i - 1], path[i]));
  }
  return b;
}

Flow FlowState::augment(std::span<const NodeId> path) {
  const Flow b = bottleneck(path);
  if (b <= 0) return 0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    const auto u = path[i - 1];
    const auto v = path[i];
    flow_[index(u, v)] += b;
    flow_[index(v, u)] -= b;
  }
  return b;
}

std::vector<std::uint8_t> FlowState::reachable_from(NodeId src) const {
  const auto N = g_->num_nodes();
  std::vector<std::uint8_t> visited(static_cast<std::size_t>(N), 0);
  if (src < 0 || src >= N) return visited;
  std::queue<NodeId> q;
  visited[static_cast<std::size_t>(src)] = 1;
  q.push(src);
  while (!q.empty()) {
    auto u = q.front(); q.pop();
    for (NodeId v = 0; v < N; ++v) {
      if (visited[static_cast<std::size_t>(v)]) continue;
      if (residual(u, v) > 0) {
        visited[static_cast<std::size_t>(v)] = 1;
        q.push(v);
      }
    }
  }
  return visited;
}

MinCut FlowState::compute_min_cut(NodeId src) const {
  MinCut out;
  const auto N = g_->num_nodes();
  auto visited = reachable_from(src);
  for (NodeId u = 0; u < N; ++u) {
    if (!visited[static_cast<std::size_t>(u)]) continue;
    for (NodeId v = 0; v < N; ++v) {
      if (visited[static_cast<std::size_t>(v)]) continue;
      if (g_->at(u, v) > 0) out.edges.push_back(Edge{u, v});
    }
  }
  return out;
}

} // namespace corridorflow::core
