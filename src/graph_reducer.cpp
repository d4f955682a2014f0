/*
  reduce_terminals — collapse terminal sets into a super-source and super-sink.

  Sources and sinks are removed from the reduced matrix outright. Their
  capacity towards interior nodes is folded into the synthetic rows/columns
  and direct source->sink capacity is reported separately as bypass flow, so
  no unit of capacity is counted twice.
*/
#include "corridorflow/core/graph_reducer.hpp"
#include "corridorflow/core/error.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

namespace corridorflow::core {

namespace {

// Sorted, de-duplicated copy of a terminal set after range checks.
std::vector<NodeId> normalize_terminals(std::span<const NodeId> ids, std::int32_t n,
                                        const char* what) {
  std::vector<NodeId> out(ids.begin(), ids.end());
  for (auto id : out) {
    if (id < 0 || id >= n) {
      throw InvalidInput(std::string(what) + " index " + std::to_string(id) +
                         " out of range [0, " + std::to_string(n) + ")");
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

Flow checked_add(Flow a, Flow b) {
  if (b > std::numeric_limits<Flow>::max() - a) {
    throw InvalidInput("capacity sum overflows 64-bit flow");
  }
  return a + b;
}

} // namespace

void validate_terminals(const CapacityMatrix& capacity,
                        std::span<const NodeId> sources,
                        std::span<const NodeId> sinks) {
  const auto n = capacity.num_nodes();
  if (n < 2) {
    throw InvalidInput("capacity matrix must have at least 2 nodes, got " + std::to_string(n));
  }
  if (sources.empty()) throw InvalidInput("sources must be non-empty");
  if (sinks.empty()) throw InvalidInput("sinks must be non-empty");
  auto src = normalize_terminals(sources, n, "source");
  auto dst = normalize_terminals(sinks, n, "sink");
  std::vector<NodeId> both;
  std::set_intersection(src.begin(), src.end(), dst.begin(), dst.end(), std::back_inserter(both));
  if (!both.empty()) {
    throw InvalidInput("node " + std::to_string(both.front()) + " is both a source and a sink");
  }
  // Bounds bypass flow, network flow and their sum.
  Flow source_capacity = 0;
  for (auto s : src) source_capacity = checked_add(source_capacity, capacity.out_capacity(s));
}

ReducedGraph reduce_terminals(const CapacityMatrix& capacity,
                              std::span<const NodeId> sources,
                              std::span<const NodeId> sinks) {
  const auto n = capacity.num_nodes();
  auto src = normalize_terminals(sources, n, "source");
  auto dst = normalize_terminals(sinks, n, "sink");

  // Role per original node: 0 interior, 1 source, 2 sink
  std::vector<std::uint8_t> role(static_cast<std::size_t>(n), 0);
  for (auto s : src) role[static_cast<std::size_t>(s)] = 1;
  for (auto t : dst) {
    if (role[static_cast<std::size_t>(t)] == 1) {
      throw InvalidInput("node " + std::to_string(t) + " is both a source and a sink");
    }
    role[static_cast<std::size_t>(t)] = 2;
  }

  ReducedGraph out;
  for (NodeId v = 0; v < n; ++v) {
    if (role[static_cast<std::size_t>(v)] == 0) out.interior_nodes.push_back(v);
  }

  for (auto s : src) {
    for (auto t : dst) out.bypass_flow = checked_add(out.bypass_flow, capacity.at(s, t));
  }

  const auto k = out.interior_nodes.size();
  const std::size_t m = k + 2;
  std::vector<Cap> values(m * m, 0);
  auto cell = [m](std::size_t i, std::size_t j) -> std::size_t { return i * m + j; };
  Flow super_source_out = 0;
  for (std::size_t i = 0; i < k; ++i) {
    const NodeId u = out.interior_nodes[i];
    Cap from_sources = 0;
    for (auto s : src) from_sources = checked_add(from_sources, capacity.at(s, u));
    values[cell(0, i + 1)] = from_sources;
    super_source_out = checked_add(super_source_out, from_sources);

    Cap to_sinks = 0;
    for (auto t : dst) to_sinks = checked_add(to_sinks, capacity.at(u, t));
    values[cell(i + 1, m - 1)] = to_sinks;

    for (std::size_t j = 0; j < k; ++j) {
      values[cell(i + 1, j + 1)] = capacity.at(u, out.interior_nodes[j]);
    }
  }
  out.matrix = CapacityMatrix::from_dense(static_cast<std::int32_t>(m), values);
  return out;
}

} // namespace corridorflow::core
