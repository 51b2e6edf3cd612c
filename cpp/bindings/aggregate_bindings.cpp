/**
 * @file aggregate_bindings.cpp
 * @brief Python bindings for period aggregates and AggregateSession
 * 
 * Aggregates are handed to Python as shared handles, so an unchanged
 * period is the same Python object across updates and can be memoized
 * with `is`.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "timeroll/aggregate/aggregate_session.hpp"
#include "timeroll/aggregate/period_aggregate.hpp"

namespace py = pybind11;

namespace timeroll {

namespace {

// pybind11 holders are non-const; every aggregate field is exposed read-only
std::shared_ptr<PeriodAggregate> to_python(const AggregatePtr& aggregate) {
    return std::const_pointer_cast<PeriodAggregate>(aggregate);
}

py::list to_python(const std::vector<AggregatePtr>& items) {
    py::list out;
    for (const auto& item : items) {
        out.append(to_python(item));
    }
    return out;
}

std::vector<DayRecordPtr> from_python(const std::vector<std::shared_ptr<DayRecord>>& log) {
    return std::vector<DayRecordPtr>(log.begin(), log.end());
}

} // namespace

void init_aggregate_bindings(py::module& m) {
    // ========================================================================
    // MetricSource
    // ========================================================================
    py::enum_<MetricSource>(m, "MetricSource")
        .value("STATS", MetricSource::STATS)
        .value("DELTAS", MetricSource::DELTAS)
        .value("PERCENTS", MetricSource::PERCENTS)
        .value("CUMULATIVES", MetricSource::CUMULATIVES)
        .value("CUMULATIVE_DELTAS", MetricSource::CUMULATIVE_DELTAS)
        .value("CUMULATIVE_PERCENTS", MetricSource::CUMULATIVE_PERCENTS)
        .export_values();
    
    // ========================================================================
    // PeriodAggregate
    // ========================================================================
    py::class_<PeriodAggregate, std::shared_ptr<PeriodAggregate>>(m, "PeriodAggregate",
        "Stats of one period with deltas, cumulatives and extremes")
        
        .def_readonly("date_key", &PeriodAggregate::date_key,
            "Period key (None for ANYTIME)")
        .def_readonly("period", &PeriodAggregate::period)
        .def_readonly("numbers", &PeriodAggregate::numbers)
        .def_readonly("stats", &PeriodAggregate::stats)
        .def_readonly("deltas", &PeriodAggregate::deltas)
        .def_readonly("percents", &PeriodAggregate::percents)
        .def_readonly("cumulatives", &PeriodAggregate::cumulatives)
        .def_readonly("cumulative_deltas", &PeriodAggregate::cumulative_deltas)
        .def_readonly("cumulative_percents", &PeriodAggregate::cumulative_percents)
        .def_property_readonly("extremes",
            [](const PeriodAggregate& a) {
                return std::const_pointer_cast<StatsExtremes>(a.extremes);
            },
            "Extremes over direct children (None for days)")
        
        .def("metric",
            [](const PeriodAggregate& a, MetricSource source, StatField field) {
                return aggregate_metric(a, source, field);
            },
            py::arg("source"), py::arg("field"),
            "Read one metric (None where a percent baseline was zero)")
        .def("__repr__", [](const PeriodAggregate& a) {
            return std::string("<PeriodAggregate ") + period_name(a.period) +
                   " " + (a.date_key ? *a.date_key : std::string("*")) +
                   " count=" + std::to_string(a.stats.count) + ">";
        });
    
    // ========================================================================
    // AllPeriodsAggregate
    // ========================================================================
    py::class_<AllPeriodsAggregate>(m, "AllPeriodsAggregate",
        "Aggregates for every granularity")
        
        .def_readonly("day_keys", &AllPeriodsAggregate::day_keys)
        .def_readonly("week_keys", &AllPeriodsAggregate::week_keys)
        .def_readonly("month_keys", &AllPeriodsAggregate::month_keys)
        .def_readonly("year_keys", &AllPeriodsAggregate::year_keys)
        .def_property_readonly("days",
            [](const AllPeriodsAggregate& a) { return to_python(a.days); })
        .def_property_readonly("weeks",
            [](const AllPeriodsAggregate& a) { return to_python(a.weeks); })
        .def_property_readonly("months",
            [](const AllPeriodsAggregate& a) { return to_python(a.months); })
        .def_property_readonly("years",
            [](const AllPeriodsAggregate& a) { return to_python(a.years); })
        .def_property_readonly("alltime",
            [](const AllPeriodsAggregate& a) { return to_python(a.alltime); });
    
    // ========================================================================
    // RecomputeStats
    // ========================================================================
    py::class_<RecomputeStats>(m, "RecomputeStats",
        "Work done by the last update")
        
        .def(py::init<>())
        .def_readonly("days_reused", &RecomputeStats::days_reused)
        .def_readonly("days_recomputed", &RecomputeStats::days_recomputed)
        .def_readonly("weeks_reused", &RecomputeStats::weeks_reused)
        .def_readonly("weeks_recomputed", &RecomputeStats::weeks_recomputed)
        .def_readonly("months_reused", &RecomputeStats::months_reused)
        .def_readonly("months_recomputed", &RecomputeStats::months_recomputed)
        .def_readonly("years_reused", &RecomputeStats::years_reused)
        .def_readonly("years_recomputed", &RecomputeStats::years_recomputed)
        .def_readonly("alltime_reused", &RecomputeStats::alltime_reused)
        .def_readonly("extremes_reused", &RecomputeStats::extremes_reused)
        .def_readonly("skipped_records", &RecomputeStats::skipped_records)
        .def_readonly("skipped_values", &RecomputeStats::skipped_values)
        .def_readonly("cache_discarded", &RecomputeStats::cache_discarded)
        .def("total_recomputed", &RecomputeStats::total_recomputed);
    
    // ========================================================================
    // AggregateSession
    // ========================================================================
    py::class_<AggregateSession>(m, "AggregateSession",
        "Incremental aggregator that keeps its cache between updates")
        
        .def(py::init<EngineOptions>(), py::arg("options") = EngineOptions())
        
        .def("update",
            [](AggregateSession& s, const std::vector<std::shared_ptr<DayRecord>>& log) {
                return s.update(from_python(log));
            },
            py::arg("log"), py::return_value_policy::copy,
            R"pbdoc(
                Recompute aggregates for a log snapshot.
                
                Pass the same DayRecord objects for unchanged days; a new
                object marks a changed day.
                
                Example:
                    >>> session = AggregateSession()
                    >>> result = session.update([DayRecord("2024-01-01", [1.0, 2.0])])
                    >>> result.alltime.stats.total
                    3.0
            )pbdoc")
        .def("current", &AggregateSession::current, py::return_value_policy::copy,
            "Aggregates of the last update")
        .def("last_stats", &AggregateSession::last_stats, py::return_value_policy::copy,
            "Work counters of the last update")
        .def("update_count", &AggregateSession::update_count)
        .def("reset", &AggregateSession::reset, "Forget the cache");
    
    // ========================================================================
    // Helpers
    // ========================================================================
    m.def("calculate_year_daily_extremes",
        [](const AllPeriodsAggregate& a, int year) {
            return calculate_year_daily_extremes(a.days, year);
        },
        py::arg("aggregates"), py::arg("year"),
        "Extremes across the populated days of one calendar year");
}

} // namespace timeroll
