#pragma once

/**
 * @file extremes.hpp
 * @brief Highest/lowest value of each statistic among a container's children
 */

#include "timeroll/statistics/number_stats.hpp"
#include <optional>
#include <vector>

namespace timeroll {

/// Per-field maximum and minimum across a set of child stats
struct StatsExtremes {
    double highest_count;
    double lowest_count;
    double highest_total;
    double lowest_total;
    double highest_mean;
    double lowest_mean;
    double highest_median;
    double lowest_median;
    double highest_min;
    double lowest_min;
    double highest_max;
    double lowest_max;
    double highest_first;
    double lowest_first;
    double highest_last;
    double lowest_last;
    double highest_range;
    double lowest_range;
    double highest_change;
    double lowest_change;
    double highest_change_percent;
    double lowest_change_percent;
    
    StatsExtremes()
        : highest_count(0.0), lowest_count(0.0)
        , highest_total(0.0), lowest_total(0.0)
        , highest_mean(0.0), lowest_mean(0.0)
        , highest_median(0.0), lowest_median(0.0)
        , highest_min(0.0), lowest_min(0.0)
        , highest_max(0.0), lowest_max(0.0)
        , highest_first(0.0), lowest_first(0.0)
        , highest_last(0.0), lowest_last(0.0)
        , highest_range(0.0), lowest_range(0.0)
        , highest_change(0.0), lowest_change(0.0)
        , highest_change_percent(0.0), lowest_change_percent(0.0)
    {}
};

/// Field-by-field equality
bool extremes_equal(const StatsExtremes& left, const StatsExtremes& right);

/// Highest observed value of a field
double highest_for(const StatsExtremes& extremes, StatField field);

/// Lowest observed value of a field
double lowest_for(const StatsExtremes& extremes, StatField field);

/**
 * @brief Compute extremes over child stats
 * 
 * @param children Stats of the direct children (non-null pointers)
 * @return std::nullopt for an empty list, extremes otherwise
 */
std::optional<StatsExtremes> calculate_extremes(const std::vector<const NumberStats*>& children);

} // namespace timeroll
