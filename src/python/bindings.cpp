#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include "../Params.hpp"
#include "../errors.hpp"
#include "../Progress.hpp"
#include "../bewley/engine.h"

namespace py = pybind11;
using namespace Bewley;

namespace {

// Engine plus the sink it reports to; the sink must outlive every solve
struct PyEngine {
    ConsoleProgressSink console;
    std::unique_ptr<BewleyEngine> engine;

    PyEngine(const std::map<std::string, double>& scalars, const std::string& market,
             const std::string& grid_kind, bool verbose)
        : console(std::cout, verbose) {
        BewleyParams params;
        params.scalars = scalars;
        params.market = market;
        params.grid_kind = grid_kind;
        engine = std::make_unique<BewleyEngine>(params, &console);
    }
};

// (n_z, n_a) copy of a flattened iz * n_a + ia field
template <typename T>
py::array_t<T> as_state_array(const std::vector<T>& v, int n_z, int n_a) {
    return py::array_t<T>({n_z, n_a}, v.data());
}

py::array_t<double> as_array(const std::vector<double>& v) {
    return py::array_t<double>(static_cast<py::ssize_t>(v.size()), v.data());
}

} // namespace

PYBIND11_MODULE(bewley_core, m) {
    m.doc() = "Bewley-Huggett-Aiyagari incomplete-markets equilibrium solver";

    // Map C++ exception types onto Python ones
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<InvalidGridError>(m, "InvalidGridError", PyExc_ValueError);
    py::register_exception<DiscretizationError>(m, "DiscretizationError", PyExc_RuntimeError);
    py::register_exception<InvariantViolation>(m, "InvariantViolation", PyExc_RuntimeError);

    py::class_<DistributionStats>(m, "DistributionStats")
        .def_readonly("mean_assets", &DistributionStats::mean_assets)
        .def_readonly("aggregate_consumption", &DistributionStats::aggregate_consumption)
        .def_readonly("share_at_limit", &DistributionStats::share_at_limit)
        .def_readonly("constrained_share", &DistributionStats::constrained_share)
        .def_readonly("gini", &DistributionStats::gini)
        .def_readonly("top10_share", &DistributionStats::top10_share)
        .def_property_readonly("marginal", [](const DistributionStats& s) { return as_array(s.marginal); });

    py::class_<SteadyStateResult>(m, "SteadyStateResult")
        .def_property_readonly("r", [](const SteadyStateResult& ss) { return ss.equilibrium.r; })
        .def_property_readonly("w", [](const SteadyStateResult& ss) { return ss.equilibrium.w; })
        .def_property_readonly("demand", [](const SteadyStateResult& ss) { return ss.equilibrium.demand; })
        .def_property_readonly("supply", [](const SteadyStateResult& ss) { return ss.equilibrium.supply; })
        .def_property_readonly("excess", [](const SteadyStateResult& ss) { return ss.equilibrium.excess; })
        .def_property_readonly("bracket", [](const SteadyStateResult& ss) {
            return py::make_tuple(ss.equilibrium.r_low, ss.equilibrium.r_high);
        })
        .def_property_readonly("status", [](const SteadyStateResult& ss) {
            return std::string(to_string(ss.equilibrium.report.status));
        })
        .def_property_readonly("iterations", [](const SteadyStateResult& ss) { return ss.equilibrium.report.iterations; })
        .def_property_readonly("inner_failures", [](const SteadyStateResult& ss) { return ss.equilibrium.inner_failures; })
        .def_readonly("borrowing_limit", &SteadyStateResult::borrowing_limit)
        .def_readonly("stats", &SteadyStateResult::stats)
        .def_property_readonly("asset_grid", [](const SteadyStateResult& ss) { return as_array(ss.asset_grid); })
        .def_property_readonly("income_levels", [](const SteadyStateResult& ss) { return as_array(ss.income_levels); })
        .def_property_readonly("r_path", [](const SteadyStateResult& ss) { return as_array(ss.equilibrium.r_path); })
        .def_property_readonly("excess_path", [](const SteadyStateResult& ss) { return as_array(ss.equilibrium.excess_path); })
        .def_property_readonly("value", [](const SteadyStateResult& ss) {
            return as_state_array(ss.equilibrium.household.value, ss.n_z, ss.n_a);
        })
        .def_property_readonly("policy_index", [](const SteadyStateResult& ss) {
            return as_state_array(ss.equilibrium.household.policy, ss.n_z, ss.n_a);
        })
        .def_property_readonly("policy", [](const SteadyStateResult& ss) {
            return as_state_array(ss.equilibrium.household.a_pol, ss.n_z, ss.n_a);
        })
        .def_property_readonly("consumption", [](const SteadyStateResult& ss) {
            return as_state_array(ss.equilibrium.household.c_pol, ss.n_z, ss.n_a);
        })
        .def_property_readonly("distribution", [](const SteadyStateResult& ss) {
            return as_state_array(ss.equilibrium.distribution.D, ss.n_z, ss.n_a);
        });

    py::class_<TransitionResult>(m, "TransitionResult")
        .def_readonly("periods", &TransitionResult::periods)
        .def_property_readonly("limits", [](const TransitionResult& p) { return as_array(p.limits); })
        .def_property_readonly("r", [](const TransitionResult& p) { return as_array(p.r); })
        .def_property_readonly("w", [](const TransitionResult& p) { return as_array(p.w); })
        .def_property_readonly("assets", [](const TransitionResult& p) { return as_array(p.assets); })
        .def_property_readonly("supply", [](const TransitionResult& p) { return as_array(p.supply); })
        .def_property_readonly("excess", [](const TransitionResult& p) { return as_array(p.excess); })
        .def_readonly("terminal_gap", &TransitionResult::terminal_gap)
        .def_property_readonly("status", [](const TransitionResult& p) { return std::string(to_string(p.report.status)); })
        .def_property_readonly("iterations", [](const TransitionResult& p) { return p.report.iterations; });

    py::class_<TransitionRun>(m, "TransitionRun")
        .def_readonly("initial", &TransitionRun::initial)
        .def_readonly("terminal", &TransitionRun::terminal)
        .def_readonly("path", &TransitionRun::path);

    py::class_<PyEngine>(m, "BewleyEngine")
        .def(py::init<const std::map<std::string, double>&, const std::string&, const std::string&, bool>(),
             py::arg("params"), py::arg("market") = "huggett",
             py::arg("grid") = "uniform", py::arg("verbose") = false)
        .def("solve_steady_state", [](const PyEngine& e) { return e.engine->solve_steady_state(); })
        .def("solve_steady_state", [](const PyEngine& e, double limit) { return e.engine->solve_steady_state(limit); },
             py::arg("borrowing_limit"))
        .def("solve_transition", [](const PyEngine& e) { return e.engine->solve_transition(); })
        .def_property_readonly("asset_grid", [](const PyEngine& e) { return as_array(e.engine->grid().nodes); })
        .def_property_readonly("income_levels", [](const PyEngine& e) { return as_array(e.engine->income().z_grid); })
        .def_property_readonly("transition_matrix", [](const PyEngine& e) {
            int n = e.engine->income().n_z;
            return py::array_t<double>({n, n}, e.engine->income().Pi_flat.data());
        });
}
