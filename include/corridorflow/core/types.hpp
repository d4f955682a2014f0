/* Core type aliases.
 *
 * For Python developers:
 * - NodeId: int32 (matches np.int32)
 * - Cap/Flow: int64 (matches np.int64); capacities are whole units per tick
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <vector>

namespace corridorflow::core {

// Nodes are dense indices 0..N-1 into a capacity matrix.
using NodeId = std::int32_t;
using Cap    = std::int64_t;  // Edge capacity (integer units)
using Flow   = std::int64_t;  // Flow amount (same unit as capacity)

// Ordered node sequence from a source to a sink; nodes are distinct.
using Path = std::vector<NodeId>;

// Directed edge (u, v) addressed by its endpoints.
struct Edge {
  NodeId u;
  NodeId v;
  friend bool operator==(const Edge& a, const Edge& b) noexcept {
    return a.u == b.u && a.v == b.v;
  }
};

} // namespace corridorflow::core
