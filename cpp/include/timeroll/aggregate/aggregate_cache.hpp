#pragma once

/**
 * @file aggregate_cache.hpp
 * @brief Output of a recompute and the state threaded into the next one
 * 
 * The engine is a fold: recompute(log, cache) -> (aggregates, cache').
 * The cache holds exactly one previous snapshot and is owned by the
 * caller, which passes it back on the next call (moving it avoids a
 * copy). An empty cache means "no history", and always produces a full
 * rebuild.
 */

#include "timeroll/aggregate/period_aggregate.hpp"
#include "timeroll/core/types.hpp"
#include "timeroll/statistics/prefix_distribution.hpp"
#include <string>
#include <vector>

namespace timeroll {

/**
 * @brief Aggregates for every granularity
 * 
 * Each *_keys vector is index-aligned with its aggregate vector.
 */
struct AllPeriodsAggregate {
    std::vector<std::string> day_keys;
    std::vector<std::string> week_keys;
    std::vector<std::string> month_keys;
    std::vector<std::string> year_keys;
    std::vector<AggregatePtr> days;
    std::vector<AggregatePtr> weeks;
    std::vector<AggregatePtr> months;
    std::vector<AggregatePtr> years;
    AggregatePtr alltime;           ///< Never null after a recompute
};

/**
 * @brief Previous snapshot used for change detection and reuse
 */
struct AggregateCache {
    /// Sanitized log of the previous call, sorted by date key
    std::vector<DayRecordPtr> sorted_days;
    
    /// Aggregates returned by the previous call
    AllPeriodsAggregate aggregates;
    
    /// Every number of aggregates.days, for exact cumulative medians
    PrefixDistribution day_prefix;
    
    /// True when no previous call has populated this cache
    bool empty() const { return sorted_days.empty() && aggregates.alltime == nullptr; }
    
    /// Consistency of the parallel arrays
    bool consistent() const;
    
    void clear();
};

/// Result of a recompute call
struct RecomputeResult {
    AllPeriodsAggregate aggregates;
    AggregateCache cache;           ///< Pass to the next recompute
    RecomputeStats stats;
};

} // namespace timeroll
