/*
  find_augmenting_path — breadth-first search over positive residual edges.

  The frontier is an arena of (node, parent record) entries appended in BFS
  order, so the arena doubles as the queue. A per-search visited flag keeps
  every node expanded at most once; the path is walked back through parent
  records only after the sink is discovered.
*/
#include "corridorflow/core/augmenting_path.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace corridorflow::core {

namespace {
struct PathRecord {
  NodeId node;
  std::int32_t parent; // index into the arena, -1 for the root
};

Path unwind(const std::vector<PathRecord>& arena, std::int32_t leaf) {
  Path path;
  for (auto r = leaf; r >= 0; r = arena[static_cast<std::size_t>(r)].parent) {
    path.push_back(arena[static_cast<std::size_t>(r)].node);
  }
  std::reverse(path.begin(), path.end());
  return path;
}
} // namespace

std::optional<Path> find_augmenting_path(const FlowState& fs, NodeId src, NodeId dst) {
  const auto N = fs.num_nodes();
  if (src < 0 || src >= N || dst < 0 || dst >= N || src == dst) return std::nullopt;

  std::vector<PathRecord> arena;
  arena.reserve(static_cast<std::size_t>(N));
  std::vector<std::uint8_t> visited(static_cast<std::size_t>(N), 0);
  arena.push_back(PathRecord{src, -1});
  visited[static_cast<std::size_t>(src)] = 1;

  for (std::size_t head = 0; head < arena.size(); ++head) {
    const NodeId u = arena[head].node;
    for (NodeId v = 0; v < N; ++v) {
      if (visited[static_cast<std::size_t>(v)]) continue;
      if (fs.residual(u, v) <= 0) continue;
      visited[static_cast<std::size_t>(v)] = 1;
      arena.push_back(PathRecord{v, static_cast<std::int32_t>(head)});
      if (v == dst) return unwind(arena, static_cast<std::int32_t>(arena.size() - 1));
    }
  }
  return std::nullopt;
}

} // namespace corridorflow::core
