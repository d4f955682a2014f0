/*
  calc_max_flow — Edmonds-Karp over a dense capacity matrix.

  Repeatedly finds a fewest-hop augmenting path in the residual graph and
  pushes its bottleneck until the sink is unreachable. The result is the net
  flow entering the sink, accumulated one bottleneck at a time; the running
  total never exceeds the source's out-capacity, which CapacityMatrix keeps
  within Flow. Multi-terminal entry points validate, reduce to a
  single super-source/super-sink pair, solve, and add the bypass capacity back.
*/
#include "corridorflow/core/max_flow.hpp"
#include "corridorflow/core/augmenting_path.hpp"
#include "corridorflow/core/graph_reducer.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/log/log.h"

namespace corridorflow::core {

namespace {

// Lifts reachability on the reduced graph back to original ids. Sources sit on
// the source side; sinks never do once no augmenting path remains.
std::vector<std::uint8_t> lift_reachable(const CapacityMatrix& capacity,
                                         const ReducedGraph& reduced,
                                         std::span<const NodeId> sources,
                                         const std::vector<std::uint8_t>& reduced_reach) {
  std::vector<std::uint8_t> out(static_cast<std::size_t>(capacity.num_nodes()), 0);
  for (auto s : sources) out[static_cast<std::size_t>(s)] = 1;
  for (std::size_t i = 0; i < reduced.interior_nodes.size(); ++i) {
    out[static_cast<std::size_t>(reduced.interior_nodes[i])] = reduced_reach[i + 1];
  }
  return out;
}

MinCut cut_from_reachable(const CapacityMatrix& capacity, const std::vector<std::uint8_t>& reach) {
  MinCut out;
  const auto N = capacity.num_nodes();
  for (NodeId u = 0; u < N; ++u) {
    if (!reach[static_cast<std::size_t>(u)]) continue;
    for (NodeId v = 0; v < N; ++v) {
      if (reach[static_cast<std::size_t>(v)]) continue;
      if (capacity.at(u, v) > 0) out.edges.push_back(Edge{u, v});
    }
  }
  return out;
}

} // namespace

std::pair<Flow, FlowSummary>
calc_max_flow(const CapacityMatrix& g, NodeId src, NodeId dst, const MaxFlowOptions& opts) {
  FlowSummary summary;
  const auto N = g.num_nodes();
  if (src < 0 || src >= N || dst < 0 || dst >= N || src == dst) {
    return {0, std::move(summary)};
  }
  FlowState fs(g);
  while (true) {
    auto path = find_augmenting_path(fs, src, dst);
    if (!path) break;
    Flow pushed = fs.augment(*path);
    summary.network_flow += pushed;
    ++summary.iterations;
    VLOG(2) << "augmenting path #" << summary.iterations << ": " << path->size() - 1
            << " hops, bottleneck " << pushed;
  }

  summary.total_flow = summary.network_flow;
  if (opts.with_flow_matrix) {
    auto fv = fs.flow_view();
    summary.flow_matrix.assign(fv.begin(), fv.end());
  }
  if (opts.with_min_cut) summary.min_cut = fs.compute_min_cut(src);
  if (opts.with_reachable) summary.reachable_nodes = fs.reachable_from(src);
  VLOG(1) << "calc_max_flow: nodes=" << N << " src=" << src << " dst=" << dst
          << " iterations=" << summary.iterations << " flow=" << summary.total_flow;
  return {summary.total_flow, std::move(summary)};
}

std::pair<Flow, FlowSummary>
solve_max_flow(std::span<const NodeId> sources,
               std::span<const NodeId> sinks,
               const CapacityMatrix& capacity,
               const MaxFlowOptions& opts) {
  validate_terminals(capacity, sources, sinks);
  auto reduced = reduce_terminals(capacity, sources, sinks);

  // Min-cut and reachability are lifted from the reduced graph's residual reachability.
  MaxFlowOptions inner = opts;
  inner.with_min_cut = false;
  inner.with_reachable = opts.with_min_cut || opts.with_reachable;
  auto [network, summary] = calc_max_flow(reduced.matrix, reduced.source(), reduced.sink(), inner);

  summary.bypass_flow = reduced.bypass_flow;
  summary.network_flow = network;
  summary.total_flow = reduced.bypass_flow + network;
  if (inner.with_reachable) {
    auto reach = lift_reachable(capacity, reduced, sources, summary.reachable_nodes);
    if (opts.with_min_cut) summary.min_cut = cut_from_reachable(capacity, reach);
    if (opts.with_reachable) {
      summary.reachable_nodes = std::move(reach);
    } else {
      summary.reachable_nodes.clear();
    }
  }
  VLOG(1) << "solve_max_flow: nodes=" << capacity.num_nodes() << " sources=" << sources.size()
          << " sinks=" << sinks.size() << " reduced=" << reduced.matrix.num_nodes()
          << " bypass=" << summary.bypass_flow << " network=" << summary.network_flow;
  return {summary.total_flow, std::move(summary)};
}

Flow max_flow(std::span<const NodeId> sources,
              std::span<const NodeId> sinks,
              const CapacityMatrix& capacity) {
  return solve_max_flow(sources, sinks, capacity).first;
}

std::vector<FlowSummary>
batch_max_flow(const CapacityMatrix& capacity,
               const std::vector<TerminalSets>& problems,
               const MaxFlowOptions& opts) {
  std::vector<FlowSummary> out;
  out.reserve(problems.size());
  for (const auto& p : problems) {
    auto [val, summary] = solve_max_flow(p.sources, p.sinks, capacity, opts);
    out.push_back(std::move(summary));
  }
  return out;
}

} // namespace corridorflow::core
