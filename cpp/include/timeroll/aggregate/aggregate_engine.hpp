#pragma once

/**
 * @file aggregate_engine.hpp
 * @brief Incremental day -> week -> month -> year -> all-time rollup
 * 
 * AggregateEngine turns a snapshot of the day log into aggregates for
 * every granularity. Given the cache from the previous call it only
 * rebuilds what the change can affect:
 * 
 * 1. Sort the log by day key and find the first record handle that
 *    differs from the cached sorted log.
 * 2. Reuse the cached day aggregates before that index and rebuild the
 *    rest, chaining each day to the previous one.
 * 3. For week, month and year, convert the earliest changed day key to
 *    the level's key, reuse cached aggregates before it and rebuild the
 *    buckets from there on, chaining against the same level.
 * 4. Rebuild all-time from the years, and attach extremes to every
 *    rebuilt container, keeping the previous extremes object when its
 *    values did not change.
 * 
 * Usage:
 * @code
 *   AggregateEngine engine;
 *   AggregateCache cache;
 *   
 *   auto result = engine.recompute(log, std::move(cache));
 *   use(result.aggregates);
 *   cache = std::move(result.cache);    // thread into the next call
 * @endcode
 * 
 * Thread Safety:
 * - recompute() is const and touches no shared state
 * - A cache must not be used by two calls at once
 */

#include "timeroll/aggregate/aggregate_cache.hpp"
#include "timeroll/aggregate/period_aggregate.hpp"
#include "timeroll/core/types.hpp"
#include "timeroll/statistics/prefix_distribution.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace timeroll {

class AggregateEngine {
public:
    /// Returned by find_first_changed_index when both logs match
    static constexpr size_t NO_CHANGE = static_cast<size_t>(-1);
    
    /**
     * @brief Construct engine with options
     * @param options Logging options
     */
    explicit AggregateEngine(EngineOptions options = EngineOptions());
    
    /**
     * @brief Recompute all aggregates for a log snapshot
     * 
     * @param log Day records in any order; null handles and malformed
     *            keys are skipped, non-finite numbers are filtered out
     * @param cache Cache returned by the previous call (or an empty one)
     * @return Aggregates, the cache for the next call and work counters
     */
    RecomputeResult recompute(
        const std::vector<DayRecordPtr>& log,
        AggregateCache cache
    ) const;
    
    /// Get engine options
    const EngineOptions& options() const { return options_; }
    
    // ========================================================================
    // Building Blocks (public for testing)
    // ========================================================================
    
    /**
     * @brief First index where two sorted logs hold different handles
     * 
     * @return NO_CHANGE when both logs hold the same handles; the length
     *         of the shorter log for a pure append or truncation
     */
    static size_t find_first_changed_index(
        const std::vector<DayRecordPtr>& prev,
        const std::vector<DayRecordPtr>& next
    );
    
    /**
     * @brief First position whose key is >= start_key
     * @return keys.size() when start_key is empty or beyond every key
     */
    static size_t find_first_key_index(
        const std::vector<std::string>& keys,
        const std::optional<std::string>& start_key
    );
    
    /// Concatenate numbers of items[begin, end) in order
    static std::vector<double> flatten_numbers(
        const std::vector<AggregatePtr>& items,
        size_t begin,
        size_t end
    );
    
private:
    /// Drop unusable records and sort the rest by day key
    std::vector<DayRecordPtr> sort_day_records(
        const std::vector<DayRecordPtr>& log,
        RecomputeStats& stats
    ) const;
    
    /// Build one day aggregate and push its numbers into the prefix
    AggregatePtr build_day(
        const DayRecord& record,
        const PeriodAggregate* prior,
        PrefixDistribution& prefix,
        RecomputeStats& stats
    ) const;
    
    /**
     * @brief Build one coarser level (week, month or year)
     * 
     * @param period Level being built
     * @param children Final aggregates of the child level
     * @param first_changed_child Children before this index are unchanged
     * @param prev_keys Cached keys of this level
     * @param prev_items Cached aggregates of this level
     * @param boundary_key Earliest affected key at this level (nullopt = no change)
     * @param[out] keys Keys of this level
     * @param[out] items Aggregates of this level
     * @return Number of cached aggregates reused
     */
    size_t build_level(
        TimePeriod period,
        const std::vector<AggregatePtr>& children,
        size_t first_changed_child,
        const std::vector<std::string>& prev_keys,
        const std::vector<AggregatePtr>& prev_items,
        const std::optional<std::string>& boundary_key,
        std::vector<std::string>& keys,
        std::vector<AggregatePtr>& items,
        RecomputeStats& stats
    ) const;
    
    /// Build the all-time aggregate from the years
    AggregatePtr build_alltime(
        const std::vector<AggregatePtr>& years,
        const AggregatePtr& prev_alltime,
        const PrefixDistribution& prefix,
        RecomputeStats& stats
    ) const;
    
    /// Attach extremes, keeping the previous object when values match
    void attach_extremes(
        PeriodAggregate& aggregate,
        const std::vector<const NumberStats*>& children,
        const PeriodAggregate* previous,
        RecomputeStats& stats
    ) const;
    
    void log_warning(const std::string& message) const;
    void log_info(const std::string& message) const;
    
    EngineOptions options_;
};

} // namespace timeroll
