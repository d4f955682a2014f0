/*
  CPU Backend — thin adapter that delegates to in-process algorithms.
*/
#include "corridorflow/core/backend.hpp"
#include "corridorflow/core/max_flow.hpp"

namespace corridorflow::core {

namespace {
class CpuBackend final : public Backend {
public:
  std::pair<Flow, FlowSummary> max_flow(
      const CapacityMatrix& g,
      std::span<const NodeId> sources,
      std::span<const NodeId> sinks,
      const MaxFlowOptions& opts) override {
    return corridorflow::core::solve_max_flow(sources, sinks, g, opts);
  }

  std::vector<FlowSummary> batch_max_flow(
      const CapacityMatrix& g,
      const std::vector<TerminalSets>& problems,
      const MaxFlowOptions& opts) override {
    return corridorflow::core::batch_max_flow(g, problems, opts);
  }
};
} // namespace

BackendPtr make_cpu_backend() {
  return std::make_shared<CpuBackend>();
}

} // namespace corridorflow::core
