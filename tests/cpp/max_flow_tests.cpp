/**
 * Tests for the max-flow engine and its multi-terminal entry points.
 *
 * Coverage:
 * - Reference scenarios (single pair, two-by-two terminals, bypass only)
 * - Single-pair engine: bottlenecks, disjoint paths, large capacities
 * - Optional outputs: flow matrix, min-cut, reachability
 * - Input validation, batch evaluation, backend dispatch
 */

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>
#include "corridorflow/core/backend.hpp"
#include "corridorflow/core/capacity_matrix.hpp"
#include "corridorflow/core/error.hpp"
#include "corridorflow/core/max_flow.hpp"
#include "test_utils.hpp"

using namespace corridorflow::core;
using namespace corridorflow::core::test;

namespace {
CapacityMatrix scenario_one() {
  return CapacityMatrix::from_rows({
    {0, 7, 0, 0},
    {0, 0, 6, 0},
    {0, 0, 0, 8},
    {9, 0, 0, 0},
  });
}

CapacityMatrix scenario_two() {
  return CapacityMatrix::from_rows({
    {0, 0, 4, 6, 0, 0},
    {0, 0, 5, 2, 0, 0},
    {0, 0, 0, 0, 4, 4},
    {0, 0, 0, 0, 6, 6},
    {0, 0, 0, 0, 0, 0},
    {0, 0, 0, 0, 0, 0},
  });
}
} // namespace

//=============================================================================
// SECTION 1: REFERENCE SCENARIOS
//=============================================================================

TEST(MaxFlow, ScenarioSingleSourceSingleSink) {
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{3};
  EXPECT_EQ(max_flow(sources, sinks, scenario_one()), 6);
}

TEST(MaxFlow, ScenarioTwoSourcesTwoSinks) {
  std::vector<NodeId> sources{0, 1};
  std::vector<NodeId> sinks{4, 5};
  EXPECT_EQ(max_flow(sources, sinks, scenario_two()), 16);
}

TEST(MaxFlow, ScenarioBypassOnly) {
  auto g = CapacityMatrix::from_rows({{0, 5}, {0, 0}});
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{1};
  auto [total, summary] = solve_max_flow(sources, sinks, g);
  EXPECT_EQ(total, 5);
  EXPECT_EQ(summary.bypass_flow, 5);
  EXPECT_EQ(summary.network_flow, 0);
  EXPECT_EQ(summary.iterations, 0);
}

TEST(MaxFlow, BypassAndNetworkFlowAdd) {
  // 0->2 directly (3) plus 0->1->2 (min(4, 2) = 2)
  auto g = CapacityMatrix::from_rows({
    {0, 4, 3},
    {0, 0, 2},
    {0, 0, 0},
  });
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{2};
  auto [total, summary] = solve_max_flow(sources, sinks, g);
  EXPECT_EQ(summary.bypass_flow, 3);
  EXPECT_EQ(summary.network_flow, 2);
  EXPECT_EQ(total, 5);
  EXPECT_EQ(summary.total_flow, 5);
}

TEST(MaxFlow, SinksAsSourcesOrder) {
  // Terminal roles are not tied to matrix position.
  auto g = CapacityMatrix::from_rows({
    {0, 0, 0},
    {3, 0, 0},
    {0, 4, 0},
  });
  std::vector<NodeId> sources{2};
  std::vector<NodeId> sinks{0};
  EXPECT_EQ(max_flow(sources, sinks, g), 3);
}

TEST(MaxFlow, SelfLoopsHaveNoEffect) {
  auto g = CapacityMatrix::from_rows({
    {100, 7, 0, 0},
    {0, 100, 6, 0},
    {0, 0, 100, 8},
    {9, 0, 0, 100},
  });
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{3};
  EXPECT_EQ(max_flow(sources, sinks, g), 6);
}

TEST(MaxFlow, DisconnectedSinkGivesZero) {
  auto g = CapacityMatrix::from_rows({
    {0, 5, 0},
    {5, 0, 0},
    {0, 0, 0},
  });
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{2};
  auto [total, summary] = solve_max_flow(sources, sinks, g);
  EXPECT_EQ(total, 0);
  EXPECT_EQ(summary.iterations, 0);
}

//=============================================================================
// SECTION 2: SINGLE-PAIR ENGINE
//=============================================================================

TEST(CalcMaxFlow, BottleneckIdentification) {
  auto g = CapacityMatrix::from_rows({
    {0, 10, 0, 0},
    {0, 0, 2, 0},
    {0, 0, 0, 10},
    {0, 0, 0, 0},
  });
  auto [total, summary] = calc_max_flow(g, 0, 3);
  EXPECT_EQ(total, 2);
  EXPECT_EQ(summary.iterations, 1);
}

TEST(CalcMaxFlow, DisjointPathsAddUp) {
  auto g = make_n_disjoint_paths(4, 7);
  auto [total, summary] = calc_max_flow(g, 0, 5);
  EXPECT_EQ(total, 28);
  EXPECT_EQ(summary.iterations, 4);
}

TEST(CalcMaxFlow, LargeCapacitiesNeedFewIterations) {
  // Classic worst case for arbitrary path choice: with fewest-hop paths the
  // unit cross link is never used.
  const Cap big = 1'000'000'000'000;
  auto g = make_cross_diamond(big, 1);
  auto [total, summary] = calc_max_flow(g, 0, 3);
  EXPECT_EQ(total, 2 * big);
  EXPECT_EQ(summary.iterations, 2);
}

TEST(CalcMaxFlow, SourceEqualsSinkIsZero) {
  auto g = make_line_matrix(3, 5);
  auto [total, summary] = calc_max_flow(g, 1, 1);
  EXPECT_EQ(total, 0);
  EXPECT_EQ(summary.iterations, 0);
}

TEST(CalcMaxFlow, OutOfRangeEndpointsAreZero) {
  auto g = make_line_matrix(3, 5);
  EXPECT_EQ(calc_max_flow(g, 0, 9).first, 0);
  EXPECT_EQ(calc_max_flow(g, -2, 1).first, 0);
}

TEST(CalcMaxFlow, FlowMatrixIsConservedAndBounded) {
  auto g = make_random_matrix(8, 25, 0.45, 11);
  MaxFlowOptions opts;
  opts.with_flow_matrix = true;
  auto [total, summary] = calc_max_flow(g, 0, 7, opts);
  ASSERT_EQ(summary.flow_matrix.size(), 64u);
  expect_flow_conservation(summary.flow_matrix, 8, 0, 7);
  for (NodeId u = 0; u < 8; ++u) {
    for (NodeId v = 0; v < 8; ++v) {
      EXPECT_LE(summary.flow_matrix[static_cast<std::size_t>(u * 8 + v)], g.at(u, v));
    }
  }
  Flow into_sink = 0;
  for (NodeId n = 0; n < 8; ++n) into_sink += summary.flow_matrix[static_cast<std::size_t>(n * 8 + 7)];
  EXPECT_EQ(into_sink, total);
}

TEST(CalcMaxFlow, OptionalOutputsOffByDefault) {
  auto g = make_line_matrix(3, 5);
  auto [total, summary] = calc_max_flow(g, 0, 2);
  EXPECT_EQ(total, 5);
  EXPECT_TRUE(summary.flow_matrix.empty());
  EXPECT_TRUE(summary.min_cut.edges.empty());
  EXPECT_TRUE(summary.reachable_nodes.empty());
}

//=============================================================================
// SECTION 3: MIN-CUT AND REACHABILITY
//=============================================================================

TEST(MinCut, ScenarioOneCutIsSingleCorridor) {
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{3};
  MaxFlowOptions opts;
  opts.with_min_cut = true;
  opts.with_reachable = true;
  auto g = scenario_one();
  auto [total, summary] = solve_max_flow(sources, sinks, g, opts);
  ASSERT_EQ(summary.min_cut.edges.size(), 1u);
  EXPECT_EQ(summary.min_cut.edges[0], (Edge{1, 2}));
  EXPECT_EQ(summary.reachable_nodes, (std::vector<std::uint8_t>{1, 1, 0, 0}));
  EXPECT_EQ(cut_capacity(g, summary.min_cut), total);
}

TEST(MinCut, ScenarioTwoCutUsesOriginalIds) {
  std::vector<NodeId> sources{0, 1};
  std::vector<NodeId> sinks{4, 5};
  MaxFlowOptions opts;
  opts.with_min_cut = true;
  auto g = scenario_two();
  auto [total, summary] = solve_max_flow(sources, sinks, g, opts);
  EXPECT_EQ(total, 16);
  std::vector<Edge> expected{{0, 3}, {1, 3}, {2, 4}, {2, 5}};
  EXPECT_EQ(summary.min_cut.edges, expected);
  EXPECT_EQ(cut_capacity(g, summary.min_cut), 16);
  // Reachability was not requested.
  EXPECT_TRUE(summary.reachable_nodes.empty());
}

TEST(MinCut, BypassEdgesAreAlwaysCut) {
  auto g = CapacityMatrix::from_rows({
    {0, 4, 3},
    {0, 0, 2},
    {0, 0, 0},
  });
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{2};
  MaxFlowOptions opts;
  opts.with_min_cut = true;
  auto [total, summary] = solve_max_flow(sources, sinks, g, opts);
  std::vector<Edge> expected{{0, 2}, {1, 2}};
  EXPECT_EQ(summary.min_cut.edges, expected);
  EXPECT_EQ(cut_capacity(g, summary.min_cut), total);
}

TEST(MinCut, SinglePairCutMatchesFlow) {
  auto g = make_random_matrix(9, 40, 0.4, 3);
  MaxFlowOptions opts;
  opts.with_min_cut = true;
  opts.with_reachable = true;
  auto [total, summary] = calc_max_flow(g, 0, 8, opts);
  EXPECT_EQ(cut_capacity(g, summary.min_cut), total);
  ASSERT_EQ(summary.reachable_nodes.size(), 9u);
  EXPECT_EQ(summary.reachable_nodes[0], 1);
  EXPECT_EQ(summary.reachable_nodes[8], 0);
}

//=============================================================================
// SECTION 4: VALIDATION
//=============================================================================

TEST(MaxFlowValidation, RejectsEmptyTerminalSets) {
  std::vector<NodeId> none{};
  std::vector<NodeId> sinks{3};
  EXPECT_THROW((void)max_flow(none, sinks, scenario_one()), InvalidInput);
  EXPECT_THROW((void)max_flow(sinks, none, scenario_one()), InvalidInput);
}

TEST(MaxFlowValidation, RejectsOverlappingTerminals) {
  std::vector<NodeId> sources{0, 2};
  std::vector<NodeId> sinks{2, 3};
  EXPECT_THROW((void)max_flow(sources, sinks, scenario_one()), InvalidInput);
}

TEST(MaxFlowValidation, RejectsOutOfRangeTerminals) {
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{4};
  EXPECT_THROW((void)max_flow(sources, sinks, scenario_one()), InvalidInput);
}

TEST(MaxFlowValidation, RejectsSingleNodeMatrix) {
  auto g = CapacityMatrix::from_rows({{0}});
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{0};
  EXPECT_THROW((void)max_flow(sources, sinks, g), InvalidInput);
}

TEST(MaxFlowValidation, SingleRouteAtFlowLimit) {
  const Cap M = std::numeric_limits<Cap>::max();
  auto g = CapacityMatrix::from_rows({{0, M, 0}, {0, 0, M}, {0, 0, 0}});
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks{2};
  EXPECT_EQ(max_flow(sources, sinks, g), M);
}

TEST(MaxFlowValidation, RejectsParallelRoutesBeyondFlowLimit) {
  const Cap M = std::numeric_limits<Cap>::max();
  std::vector<NodeId> sources{0};
  std::vector<NodeId> sinks_a{3};
  std::vector<NodeId> sinks_b{2};
  // Two full-width routes out of one room.
  EXPECT_THROW((void)max_flow(sources, sinks_a, CapacityMatrix::from_rows({
    {0, M, M, 0}, {0, 0, 0, M}, {0, 0, 0, M}, {0, 0, 0, 0}})), InvalidInput);
  // Full-width bypass plus a full-width route.
  EXPECT_THROW((void)max_flow(sources, sinks_b, CapacityMatrix::from_rows({
    {0, M, M}, {0, 0, M}, {0, 0, 0}})), InvalidInput);
}

TEST(MaxFlowValidation, RejectsCombinedSourceCapacityBeyondFlowLimit) {
  // Every row, column and pair fits; the two sources together do not.
  const Cap M = std::numeric_limits<Cap>::max();
  auto g = CapacityMatrix::from_rows({
    {0, 0, M, 0, 0, 0},
    {0, 0, 0, M, 0, 0},
    {0, 0, 0, 0, M, 0},
    {0, 0, 0, 0, 0, M},
    {0, 0, 0, 0, 0, 0},
    {0, 0, 0, 0, 0, 0},
  });
  std::vector<NodeId> sources{0, 1};
  std::vector<NodeId> sinks{4, 5};
  try {
    (void)max_flow(sources, sinks, g);
    FAIL() << "expected InvalidInput";
  } catch (const InvalidInput& e) {
    EXPECT_NE(std::string(e.what()).find("overflows"), std::string::npos) << e.what();
  }
  // Each source alone is fine.
  std::vector<NodeId> one_source{0};
  EXPECT_EQ(max_flow(one_source, sinks, g), M);
}

//=============================================================================
// SECTION 5: BATCH AND BACKEND
//=============================================================================

TEST(BatchMaxFlow, SolvesEachProblemIndependently) {
  auto g = scenario_two();
  std::vector<TerminalSets> problems{
    {{0, 1}, {4, 5}},
    {{0}, {4}},
    {{2}, {5}},
  };
  auto out = batch_max_flow(g, problems);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].total_flow, 16);
  EXPECT_EQ(out[1].total_flow, 10);  // 0->2->4 (4) + 0->3->4 (6)
  EXPECT_EQ(out[2].total_flow, 4);  // direct corridor only
  EXPECT_EQ(out[2].bypass_flow, 4);
}

TEST(BatchMaxFlow, PropagatesInvalidInput) {
  auto g = scenario_two();
  std::vector<TerminalSets> problems{{{0}, {4}}, {{0}, {0}}};
  EXPECT_THROW((void)batch_max_flow(g, problems), InvalidInput);
}

TEST(Backend, CpuBackendMatchesDirectCall) {
  auto be = make_cpu_backend();
  auto g = scenario_two();
  std::vector<NodeId> sources{0, 1};
  std::vector<NodeId> sinks{4, 5};
  MaxFlowOptions opts;
  opts.with_min_cut = true;
  auto [total, summary] = be->max_flow(g, sources, sinks, opts);
  EXPECT_EQ(total, max_flow(sources, sinks, g));
  EXPECT_EQ(cut_capacity(g, summary.min_cut), total);

  std::vector<TerminalSets> problems{{{0, 1}, {4, 5}}, {{1}, {5}}};
  auto batch = be->batch_max_flow(g, problems, MaxFlowOptions{});
  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch[0].total_flow, 16);
  EXPECT_EQ(batch[1].total_flow, 6);
}
