#include "timeroll/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace timeroll {
void init_core_bindings(py::module& m);
void init_statistics_bindings(py::module& m);
void init_aggregate_bindings(py::module& m);
}

/// Main Python module definition
PYBIND11_MODULE(timeroll_cpp, m) {
    m.doc() = "TimeRoll C++ Core Library - Incremental day/week/month/year "
              "statistics rollup";
    
    // Version information
    m.attr("__version__") = timeroll::Version::get_version_string();
    m.def("get_version", &timeroll::Version::get_version_string,
          "Get library version string");
    m.def("get_build_info", &timeroll::Version::get_build_string,
          "Get version and optional components");
    
    // Periods, day records, date keys
    timeroll::init_core_bindings(m);
    
    // NumberStats, extremes
    timeroll::init_statistics_bindings(m);
    
    // Aggregates and the stateful session
    timeroll::init_aggregate_bindings(m);
}
