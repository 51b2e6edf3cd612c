/**
 * @file statistics_bindings.cpp
 * @brief Python bindings for number statistics and extremes
 */

#include "timeroll/statistics/arrow_utils.hpp"
#include "timeroll/statistics/extremes.hpp"
#include "timeroll/statistics/number_stats.hpp"
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace timeroll {

void init_statistics_bindings(py::module& m) {
    py::enum_<StatField>(m, "StatField")
        .value("COUNT", StatField::COUNT)
        .value("TOTAL", StatField::TOTAL)
        .value("MEAN", StatField::MEAN)
        .value("MEDIAN", StatField::MEDIAN)
        .value("MIN", StatField::MIN)
        .value("MAX", StatField::MAX)
        .value("FIRST", StatField::FIRST)
        .value("LAST", StatField::LAST)
        .value("RANGE", StatField::RANGE)
        .value("CHANGE", StatField::CHANGE)
        .value("CHANGE_PERCENT", StatField::CHANGE_PERCENT)
        .export_values();
    
    // NumberStats structure
    py::class_<NumberStats>(m, "NumberStats")
        .def(py::init<>())
        .def_readonly("count", &NumberStats::count, "Number of values")
        .def_readonly("total", &NumberStats::total, "Sum of all values")
        .def_readonly("mean", &NumberStats::mean, "Arithmetic mean")
        .def_readonly("median", &NumberStats::median, "Middle value")
        .def_readonly("min", &NumberStats::min, "Lowest value")
        .def_readonly("max", &NumberStats::max, "Highest value")
        .def_readonly("first", &NumberStats::first, "First value in entry order")
        .def_readonly("last", &NumberStats::last, "Last value in entry order")
        .def_readonly("range", &NumberStats::range, "max - min")
        .def_readonly("change", &NumberStats::change, "last - first")
        .def_readonly("change_percent", &NumberStats::change_percent,
                      "change / |first| as a fraction")
        .def("empty", &NumberStats::empty, "True when no values contributed")
        .def("__getitem__", &stat_value, py::arg("field"))
        .def(py::self == py::self)
        .def("__repr__", [](const NumberStats& s) {
            return "<NumberStats count=" + std::to_string(s.count) +
                   " total=" + std::to_string(s.total) +
                   " mean=" + std::to_string(s.mean) +
                   " median=" + std::to_string(s.median) +
                   " min=" + std::to_string(s.min) +
                   " max=" + std::to_string(s.max) +
                   " first=" + std::to_string(s.first) +
                   " last=" + std::to_string(s.last) + ">";
        });
    
    // PercentStats structure (None where the baseline was zero)
    py::class_<PercentStats>(m, "PercentStats")
        .def(py::init<>())
        .def_readonly("count", &PercentStats::count)
        .def_readonly("total", &PercentStats::total)
        .def_readonly("mean", &PercentStats::mean)
        .def_readonly("median", &PercentStats::median)
        .def_readonly("min", &PercentStats::min)
        .def_readonly("max", &PercentStats::max)
        .def_readonly("first", &PercentStats::first)
        .def_readonly("last", &PercentStats::last)
        .def_readonly("range", &PercentStats::range)
        .def_readonly("change", &PercentStats::change)
        .def_readonly("change_percent", &PercentStats::change_percent)
        .def("__getitem__", &percent_value, py::arg("field"));
    
    // StatsExtremes structure
    py::class_<StatsExtremes, std::shared_ptr<StatsExtremes>>(m, "StatsExtremes")
        .def(py::init<>())
        .def_readonly("highest_count", &StatsExtremes::highest_count)
        .def_readonly("lowest_count", &StatsExtremes::lowest_count)
        .def_readonly("highest_total", &StatsExtremes::highest_total)
        .def_readonly("lowest_total", &StatsExtremes::lowest_total)
        .def_readonly("highest_mean", &StatsExtremes::highest_mean)
        .def_readonly("lowest_mean", &StatsExtremes::lowest_mean)
        .def_readonly("highest_median", &StatsExtremes::highest_median)
        .def_readonly("lowest_median", &StatsExtremes::lowest_median)
        .def_readonly("highest_min", &StatsExtremes::highest_min)
        .def_readonly("lowest_min", &StatsExtremes::lowest_min)
        .def_readonly("highest_max", &StatsExtremes::highest_max)
        .def_readonly("lowest_max", &StatsExtremes::lowest_max)
        .def_readonly("highest_first", &StatsExtremes::highest_first)
        .def_readonly("lowest_first", &StatsExtremes::lowest_first)
        .def_readonly("highest_last", &StatsExtremes::highest_last)
        .def_readonly("lowest_last", &StatsExtremes::lowest_last)
        .def_readonly("highest_range", &StatsExtremes::highest_range)
        .def_readonly("lowest_range", &StatsExtremes::lowest_range)
        .def_readonly("highest_change", &StatsExtremes::highest_change)
        .def_readonly("lowest_change", &StatsExtremes::lowest_change)
        .def_readonly("highest_change_percent", &StatsExtremes::highest_change_percent)
        .def_readonly("lowest_change_percent", &StatsExtremes::lowest_change_percent)
        .def("highest", &highest_for, py::arg("field"))
        .def("lowest", &lowest_for, py::arg("field"));
    
    m.def("compute_number_stats", &compute_number_stats, py::arg("numbers"),
        R"pbdoc(
            Compute count, total, mean, median, min and max of a sequence.
            
            An empty sequence yields all-zero stats with count == 0.
            
            Example:
                >>> compute_number_stats([1.0, 2.0, 3.0, 4.0]).median
                2.5
        )pbdoc");
    
    m.def("is_arrow_available", &arrow_utils::is_arrow_available,
        "Check whether the Arrow compute path was built in");
}

} // namespace timeroll
