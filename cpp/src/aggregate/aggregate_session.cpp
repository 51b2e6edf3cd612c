#include "timeroll/aggregate/aggregate_session.hpp"
#include <utility>

namespace timeroll {

AggregateSession::AggregateSession(EngineOptions options)
    : engine_(options)
{
}

const AllPeriodsAggregate& AggregateSession::update(const std::vector<DayRecordPtr>& log) {
    RecomputeResult result = engine_.recompute(log, std::move(cache_));
    
    cache_ = std::move(result.cache);
    current_ = std::move(result.aggregates);
    last_stats_ = result.stats;
    ++update_count_;
    return current_;
}

void AggregateSession::reset() {
    cache_.clear();
    current_ = AllPeriodsAggregate();
    last_stats_ = RecomputeStats();
    update_count_ = 0;
}

} // namespace timeroll
