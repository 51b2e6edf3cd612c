#pragma once

/**
 * @file period_aggregate.hpp
 * @brief Aggregate of one period at one granularity
 * 
 * Aggregates are immutable once published and shared through
 * AggregatePtr. An unchanged period is handed back as the same pointer,
 * so consumers can memoize on identity.
 */

#include "timeroll/core/types.hpp"
#include "timeroll/statistics/derived_stats.hpp"
#include "timeroll/statistics/extremes.hpp"
#include "timeroll/statistics/number_stats.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace timeroll {

/**
 * @brief Stats of one period with its deltas, cumulatives and extremes
 */
struct PeriodAggregate {
    std::optional<std::string> date_key;    ///< Period key; std::nullopt only for ANYTIME
    TimePeriod period;                      ///< Granularity
    std::vector<double> numbers;            ///< Children's numbers, chronological
    NumberStats stats;                      ///< Local stats
    NumberStats deltas;                     ///< stats - preceding sibling's stats
    PercentStats percents;                  ///< deltas / |preceding sibling's stats|
    NumberStats cumulatives;                ///< Stats of the history prefix ending here
    NumberStats cumulative_deltas;          ///< cumulatives - preceding cumulatives
    PercentStats cumulative_percents;       ///< cumulative_deltas / |preceding cumulatives|
    
    /// Extremes over direct children; null for days and childless containers
    std::shared_ptr<const StatsExtremes> extremes;
    
    PeriodAggregate() : period(TimePeriod::DAY) {}
    
    /// Key as a string ("" for ANYTIME)
    const std::string& key() const;
    
    /// Copy every derived field from a DerivedStats
    void assign(const DerivedStats& derived);
    
    /// Value equality over every field (extremes compared by value)
    bool same_values(const PeriodAggregate& other) const;
};

/// Shared, immutable handle to an aggregate
using AggregatePtr = std::shared_ptr<const PeriodAggregate>;

/// Aggregate with empty-convention stats and no numbers
PeriodAggregate create_empty_aggregate(std::optional<std::string> date_key, TimePeriod period);

/**
 * @brief For every position, the closest earlier aggregate that has numbers
 * 
 * Skips periods with no recorded numbers. Entry i is null when no earlier
 * populated aggregate exists.
 */
std::vector<AggregatePtr> build_prior_populated_index(const std::vector<AggregatePtr>& items);

/**
 * @brief Extremes across the day aggregates of one calendar year
 * 
 * Days without numbers are ignored, which makes this suitable for
 * scaling per-day visualizations.
 * 
 * @return std::nullopt when the year has no populated day
 */
std::optional<StatsExtremes> calculate_year_daily_extremes(
    const std::vector<AggregatePtr>& days,
    int year
);

// ============================================================================
// Metric Lookup
// ============================================================================

/// Which family of numbers a metric is read from
enum class MetricSource {
    STATS,
    DELTAS,
    PERCENTS,
    CUMULATIVES,
    CUMULATIVE_DELTAS,
    CUMULATIVE_PERCENTS
};

/// Lower-case source name ("stats", "deltas", ...)
const char* metric_source_name(MetricSource source);

/**
 * @brief Read one metric of an aggregate
 * 
 * Stats, deltas and cumulative sources always yield a finite number;
 * percent sources yield std::nullopt where the baseline was zero.
 */
std::optional<double> aggregate_metric(
    const PeriodAggregate& aggregate,
    MetricSource source,
    StatField field
);

} // namespace timeroll
