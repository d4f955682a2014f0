/*
  Pybind11 module exposing CorridorFlow C++ APIs to Python.

  Notes:
    - Capacity matrices accept nested lists or 2-D int64 NumPy arrays
      (C-contiguous).
    - InvalidInput surfaces as ValueError.
    - The GIL is released while solves run.
*/
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>

#include "corridorflow/core/capacity_matrix.hpp"
#include "corridorflow/core/error.hpp"
#include "corridorflow/core/graph_reducer.hpp"
#include "corridorflow/core/max_flow.hpp"
#include "corridorflow/core/options.hpp"
#include "corridorflow/core/types.hpp"

namespace py = pybind11;
using namespace corridorflow::core;

namespace {

CapacityMatrix matrix_from_array(const py::array& arr) {
  if (!py::isinstance<py::array_t<std::int64_t>>(arr)) {
    throw py::type_error("capacity: expected numpy array of dtype int64");
  }
  if (!(arr.flags() & py::array::c_style)) {
    throw py::type_error("capacity: array must be C-contiguous (use np.ascontiguousarray)");
  }
  auto buf = arr.request();
  if (buf.ndim != 2 || buf.shape[0] != buf.shape[1]) {
    throw py::value_error("capacity: expected a square 2-D array");
  }
  std::span<const Cap> values(static_cast<const Cap*>(buf.ptr), static_cast<std::size_t>(buf.size));
  return CapacityMatrix::from_dense(static_cast<std::int32_t>(buf.shape[0]), values);
}

py::array_t<Flow> square_array(const std::vector<Flow>& values) {
  std::size_t n = 0;
  while (n * n < values.size()) ++n;
  py::array_t<Flow> arr({n, n});
  if (!values.empty()) std::memcpy(arr.mutable_data(), values.data(), values.size() * sizeof(Flow));
  return arr;
}

} // namespace

PYBIND11_MODULE(_corridorflow_core, m) {
  m.doc() = "CorridorFlow C++ bindings";

  py::register_exception<InvalidInput>(m, "InvalidInput", PyExc_ValueError);

  py::class_<CapacityMatrix>(m, "CapacityMatrix")
      .def_static("from_rows", &CapacityMatrix::from_rows, py::arg("rows"))
      .def_static("from_array", &matrix_from_array, py::arg("capacity"))
      .def("num_nodes", &CapacityMatrix::num_nodes)
      .def("at", [](const CapacityMatrix& g, NodeId u, NodeId v) {
        if (u < 0 || v < 0 || u >= g.num_nodes() || v >= g.num_nodes()) {
          throw py::index_error("node index out of range");
        }
        return g.at(u, v);
      })
      .def("to_array", [](const CapacityMatrix& g) {
        auto s = g.data_view();
        return square_array(std::vector<Flow>(s.begin(), s.end()));
      })
      .def("__eq__", [](const CapacityMatrix& a, const CapacityMatrix& b) { return a == b; });

  py::class_<ReducedGraph>(m, "ReducedGraph")
      .def_readonly("matrix", &ReducedGraph::matrix)
      .def_readonly("bypass_flow", &ReducedGraph::bypass_flow)
      .def_readonly("interior_nodes", &ReducedGraph::interior_nodes)
      .def_property_readonly("source", &ReducedGraph::source)
      .def_property_readonly("sink", &ReducedGraph::sink);

  py::class_<MaxFlowOptions>(m, "MaxFlowOptions")
      .def(py::init<>())
      .def(py::init([](bool with_flow_matrix, bool with_min_cut, bool with_reachable) {
        MaxFlowOptions o;
        o.with_flow_matrix = with_flow_matrix;
        o.with_min_cut = with_min_cut;
        o.with_reachable = with_reachable;
        return o;
      }),
        py::kw_only(),
        py::arg("with_flow_matrix") = false,
        py::arg("with_min_cut") = false,
        py::arg("with_reachable") = false)
      .def_readwrite("with_flow_matrix", &MaxFlowOptions::with_flow_matrix)
      .def_readwrite("with_min_cut", &MaxFlowOptions::with_min_cut)
      .def_readwrite("with_reachable", &MaxFlowOptions::with_reachable);

  py::class_<FlowSummary>(m, "FlowSummary")
      .def_readonly("total_flow", &FlowSummary::total_flow)
      .def_readonly("bypass_flow", &FlowSummary::bypass_flow)
      .def_readonly("network_flow", &FlowSummary::network_flow)
      .def_readonly("iterations", &FlowSummary::iterations)
      .def_property_readonly("flow_matrix", [](const FlowSummary& s) { return square_array(s.flow_matrix); })
      .def_property_readonly("min_cut", [](const FlowSummary& s) {
        std::vector<std::pair<NodeId, NodeId>> edges;
        edges.reserve(s.min_cut.edges.size());
        for (const auto& e : s.min_cut.edges) edges.emplace_back(e.u, e.v);
        return edges;
      })
      .def_property_readonly("reachable_nodes", [](const FlowSummary& s) {
        py::array_t<bool> arr(s.reachable_nodes.size());
        auto* out = arr.mutable_data();
        for (std::size_t i = 0; i < s.reachable_nodes.size(); ++i) out[i] = s.reachable_nodes[i] != 0;
        return arr;
      });

  py::class_<TerminalSets>(m, "TerminalSets")
      .def(py::init([](std::vector<NodeId> sources, std::vector<NodeId> sinks) {
        return TerminalSets{std::move(sources), std::move(sinks)};
      }), py::arg("sources"), py::arg("sinks"))
      .def_readwrite("sources", &TerminalSets::sources)
      .def_readwrite("sinks", &TerminalSets::sinks);

  m.def("reduce_terminals",
        [](const CapacityMatrix& g, std::vector<NodeId> sources, std::vector<NodeId> sinks) {
          return reduce_terminals(g, sources, sinks);
        }, py::arg("capacity"), py::arg("sources"), py::arg("sinks"));

  m.def("max_flow",
        [](std::vector<NodeId> sources, std::vector<NodeId> sinks, const CapacityMatrix& g) {
          py::gil_scoped_release release;
          return max_flow(sources, sinks, g);
        }, py::arg("sources"), py::arg("sinks"), py::arg("capacity"));

  m.def("solve_max_flow",
        [](std::vector<NodeId> sources, std::vector<NodeId> sinks, const CapacityMatrix& g,
           const MaxFlowOptions& opts) {
          py::gil_scoped_release release;
          return solve_max_flow(sources, sinks, g, opts);
        }, py::arg("sources"), py::arg("sinks"), py::arg("capacity"),
        py::arg("options") = MaxFlowOptions{});

  m.def("batch_max_flow",
        [](const CapacityMatrix& g, const std::vector<TerminalSets>& problems,
           const MaxFlowOptions& opts) {
          py::gil_scoped_release release;
          return batch_max_flow(g, problems, opts);
        }, py::arg("capacity"), py::arg("problems"), py::arg("options") = MaxFlowOptions{});
}
