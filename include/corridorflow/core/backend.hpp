/*
  Backend interface — abstracts max-flow implementations.

  The default CPU backend delegates to the in-process Edmonds-Karp engine.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual: method can be overridden in subclasses (like Python's inheritance)
  - = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "corridorflow/core/capacity_matrix.hpp"
#include "corridorflow/core/max_flow.hpp"
#include "corridorflow/core/options.hpp"

namespace corridorflow::core {

class Backend {
public:
  virtual ~Backend() noexcept = default;

  [[nodiscard]] virtual std::pair<Flow, FlowSummary> max_flow(
      const CapacityMatrix& g,
      std::span<const NodeId> sources,
      std::span<const NodeId> sinks,
      const MaxFlowOptions& opts) = 0;

  [[nodiscard]] virtual std::vector<FlowSummary> batch_max_flow(
      const CapacityMatrix& g,
      const std::vector<TerminalSets>& problems,
      const MaxFlowOptions& opts) = 0;
};

using BackendPtr = std::shared_ptr<Backend>;

[[nodiscard]] BackendPtr make_cpu_backend();

} // namespace corridorflow::core
