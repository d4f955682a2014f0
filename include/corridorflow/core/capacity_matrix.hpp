/* Immutable dense capacity matrix (row-major). */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "corridorflow/core/types.hpp"

namespace corridorflow::core {

// CapacityMatrix holds capacity[u][v] for every ordered node pair of an N-node
// graph. Construction validates shape and non-negativity, and that every row
// sum and every capacity[u][v] + capacity[v][u] fits in Flow; instances are
// immutable afterwards and may be shared across concurrent solves.
class CapacityMatrix {
public:
  CapacityMatrix() = default;

  // Build from nested rows. Every row must have rows.size() entries.
  [[nodiscard]] static CapacityMatrix from_rows(const std::vector<std::vector<Cap>>& rows);

  // Build from a row-major buffer of num_nodes * num_nodes entries.
  [[nodiscard]] static CapacityMatrix from_dense(std::int32_t num_nodes,
                                                 std::span<const Cap> values);

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }

  // Unchecked element access; callers guarantee 0 <= u, v < num_nodes().
  [[nodiscard]] Cap at(NodeId u, NodeId v) const noexcept {
    return values_[index(u, v)];
  }

  [[nodiscard]] std::span<const Cap> row(NodeId u) const noexcept {
    return std::span<const Cap>(values_).subspan(index(u, 0), static_cast<std::size_t>(num_nodes_));
  }

  [[nodiscard]] std::span<const Cap> data_view() const noexcept { return values_; }

  // Sum of capacities leaving u (self-loop excluded). Never overflows.
  [[nodiscard]] Cap out_capacity(NodeId u) const noexcept;

  friend bool operator==(const CapacityMatrix& a, const CapacityMatrix& b) noexcept {
    return a.num_nodes_ == b.num_nodes_ && a.values_ == b.values_;
  }

private:
  [[nodiscard]] std::size_t index(NodeId u, NodeId v) const noexcept {
    return static_cast<std::size_t>(u) * static_cast<std::size_t>(num_nodes_) + static_cast<std::size_t>(v);
  }

  std::int32_t num_nodes_ {0};
  std::vector<Cap> values_ {};
};

} // namespace corridorflow::core
