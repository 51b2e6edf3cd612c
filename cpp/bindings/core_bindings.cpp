/**
 * @file core_bindings.cpp
 * @brief Python bindings for core types and date keys
 * 
 * Exposes:
 * - TimePeriod: Granularity enum
 * - DayRecord: Input record (held by shared_ptr, identity = change signal)
 * - EngineOptions: Logging options
 * - Date key predicates and conversion
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "timeroll/core/date_key.hpp"
#include "timeroll/core/types.hpp"

namespace py = pybind11;

namespace timeroll {

/**
 * @brief Initialize core bindings
 */
void init_core_bindings(py::module& m) {
    // ========================================================================
    // TimePeriod
    // ========================================================================
    py::enum_<TimePeriod>(m, "TimePeriod")
        .value("DAY", TimePeriod::DAY)
        .value("WEEK", TimePeriod::WEEK)
        .value("MONTH", TimePeriod::MONTH)
        .value("YEAR", TimePeriod::YEAR)
        .value("ANYTIME", TimePeriod::ANYTIME)
        .export_values();
    
    m.def("period_name", &period_name, py::arg("period"),
        "Lower-case name of a period");
    
    // ========================================================================
    // DayRecord
    // ========================================================================
    // Python keeps the same object for an unchanged day, which maps 1:1
    // onto handle identity on the C++ side
    py::class_<DayRecord, std::shared_ptr<DayRecord>>(m, "DayRecord",
        "One day of measurements")
        
        .def(py::init<>())
        .def(py::init<std::string, std::vector<double>>(),
            py::arg("date_key"), py::arg("numbers"))
        
        .def_readonly("date_key", &DayRecord::date_key, "Day key (YYYY-MM-DD)")
        .def_readonly("numbers", &DayRecord::numbers, "Measurements in entry order")
        
        .def("__len__", [](const DayRecord& r) { return r.numbers.size(); })
        .def("__repr__", [](const DayRecord& r) {
            return "<DayRecord " + r.date_key + " numbers=" +
                   std::to_string(r.numbers.size()) + ">";
        });
    
    // ========================================================================
    // EngineOptions
    // ========================================================================
    py::class_<EngineOptions>(m, "EngineOptions",
        "Logging options of the aggregate engine")
        
        .def(py::init<>())
        .def_readwrite("verbose", &EngineOptions::verbose,
            "Print a summary line per recompute")
        .def_readwrite("log_warnings", &EngineOptions::log_warnings,
            "Report skipped records and values");
    
    // ========================================================================
    // Date Keys
    // ========================================================================
    m.def("is_day_key", [](const std::string& key) { return is_day_key(key); },
        py::arg("key"), "Check for a valid YYYY-MM-DD key");
    m.def("is_week_key", [](const std::string& key) { return is_week_key(key); },
        py::arg("key"), "Check for a valid YYYY-Www key");
    m.def("is_month_key", [](const std::string& key) { return is_month_key(key); },
        py::arg("key"), "Check for a valid YYYY-MM key");
    m.def("is_year_key", [](const std::string& key) { return is_year_key(key); },
        py::arg("key"), "Check for a valid YYYY key");
    
    m.def("convert_date_key",
        [](const std::string& key, TimePeriod target) {
            return convert_date_key(key, target);
        },
        py::arg("key"), py::arg("target"),
        R"pbdoc(
            Convert a key to a coarser (or the same) granularity.
            
            Returns None for a malformed key. Raises RuntimeError for a finer
            target, for ANYTIME, and for week -> month.
            
            Example:
                >>> convert_date_key("2024-01-01", TimePeriod.WEEK)
                '2024-W01'
        )pbdoc");
}

} // namespace timeroll
