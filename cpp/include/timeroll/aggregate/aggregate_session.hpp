#pragma once

/**
 * @file aggregate_session.hpp
 * @brief Stateful wrapper that keeps the engine cache between updates
 * 
 * Usage:
 * @code
 *   AggregateSession session;
 *   
 *   const auto& aggregates = session.update(log);
 *   // ... append a record to log ...
 *   session.update(log);    // only the tail is recomputed
 * @endcode
 * 
 * Not thread-safe: one session per log, calls serialized by the owner.
 */

#include "timeroll/aggregate/aggregate_cache.hpp"
#include "timeroll/aggregate/aggregate_engine.hpp"
#include "timeroll/core/types.hpp"
#include <vector>

namespace timeroll {

class AggregateSession {
public:
    explicit AggregateSession(EngineOptions options = EngineOptions());
    
    /**
     * @brief Recompute aggregates for a new log snapshot
     * @return Aggregates valid until the next update() or reset()
     */
    const AllPeriodsAggregate& update(const std::vector<DayRecordPtr>& log);
    
    /// Aggregates of the last update (empty before the first one)
    const AllPeriodsAggregate& current() const { return current_; }
    
    /// Work counters of the last update
    const RecomputeStats& last_stats() const { return last_stats_; }
    
    /// Number of update() calls since construction or reset()
    size_t update_count() const { return update_count_; }
    
    /// Forget the cache; the next update rebuilds everything
    void reset();
    
    const AggregateEngine& engine() const { return engine_; }
    
private:
    AggregateEngine engine_;
    AggregateCache cache_;
    AllPeriodsAggregate current_;
    RecomputeStats last_stats_;
    size_t update_count_ = 0;
};

} // namespace timeroll
