/*
  CapacityMatrix — dense row-major storage with validation on construction.

  Rejects non-square input and negative capacities, naming the offending
  row/column so callers can locate the bad entry. Also rejects matrices whose
  row sums or opposing-pair sums overflow Flow: row sums bound every flow
  value and pair sums bound every residual a solve can produce.
*/
#include "corridorflow/core/capacity_matrix.hpp"
#include "corridorflow/core/error.hpp"

#include <limits>
#include <string>

namespace corridorflow::core {

namespace {
void check_entry(Cap value, std::size_t u, std::size_t v) {
  if (value < 0) {
    throw InvalidInput("capacity[" + std::to_string(u) + "][" + std::to_string(v) +
                       "] must be >= 0, got " + std::to_string(value));
  }
}

bool add_overflows(Cap a, Cap b) noexcept {
  return b > std::numeric_limits<Cap>::max() - a;
}

// Self-loops never carry flow and are excluded from every sum.
void check_sums(std::span<const Cap> values, std::size_t n) {
  for (std::size_t u = 0; u < n; ++u) {
    Cap row_sum = 0;
    for (std::size_t v = 0; v < n; ++v) {
      if (u == v) continue;
      const Cap out = values[u * n + v];
      const Cap in = values[v * n + u];
      if (add_overflows(row_sum, out)) {
        throw InvalidInput("capacity row " + std::to_string(u) + " sum overflows 64-bit flow");
      }
      if (u < v && add_overflows(out, in)) {
        throw InvalidInput("capacity[" + std::to_string(u) + "][" + std::to_string(v) +
                           "] + capacity[" + std::to_string(v) + "][" + std::to_string(u) +
                           "] overflows 64-bit flow");
      }
      row_sum += out;
    }
  }
}
} // namespace

CapacityMatrix CapacityMatrix::from_rows(const std::vector<std::vector<Cap>>& rows) {
  const std::size_t n = rows.size();
  if (n > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
    throw InvalidInput("capacity matrix has too many rows: " + std::to_string(n));
  }
  CapacityMatrix g;
  g.num_nodes_ = static_cast<std::int32_t>(n);
  g.values_.reserve(n * n);
  for (std::size_t u = 0; u < n; ++u) {
    if (rows[u].size() != n) {
      throw InvalidInput("capacity matrix must be square: row " + std::to_string(u) +
                         " has " + std::to_string(rows[u].size()) + " entries, expected " +
                         std::to_string(n));
    }
    for (std::size_t v = 0; v < n; ++v) {
      check_entry(rows[u][v], u, v);
      g.values_.push_back(rows[u][v]);
    }
  }
  check_sums(g.values_, n);
  return g;
}

CapacityMatrix CapacityMatrix::from_dense(std::int32_t num_nodes, std::span<const Cap> values) {
  if (num_nodes < 0) {
    throw InvalidInput("num_nodes must be >= 0, got " + std::to_string(num_nodes));
  }
  const auto n = static_cast<std::size_t>(num_nodes);
  if (values.size() != n * n) {
    throw InvalidInput("capacity matrix must be square: expected " + std::to_string(n * n) +
                       " values for " + std::to_string(n) + " nodes, got " +
                       std::to_string(values.size()));
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    check_entry(values[i], i / n, i % n);
  }
  check_sums(values, n);
  CapacityMatrix g;
  g.num_nodes_ = num_nodes;
  g.values_.assign(values.begin(), values.end());
  return g;
}

Cap CapacityMatrix::out_capacity(NodeId u) const noexcept {
  Cap total = 0;
  auto r = row(u);
  for (std::size_t v = 0; v < r.size(); ++v) {
    if (static_cast<NodeId>(v) == u) continue;
    total += r[v];
  }
  return total;
}

} // namespace corridorflow::core
