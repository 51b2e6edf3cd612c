#include "timeroll/aggregate/aggregate_cache.hpp"

namespace timeroll {

bool AggregateCache::consistent() const {
    const AllPeriodsAggregate& a = aggregates;
    if (a.days.size() != sorted_days.size() ||
        a.day_keys.size() != a.days.size() ||
        a.week_keys.size() != a.weeks.size() ||
        a.month_keys.size() != a.months.size() ||
        a.year_keys.size() != a.years.size()) {
        return false;
    }
    
    // All-time numbers are every day's numbers, as is the prefix
    const size_t alltime_numbers = a.alltime ? a.alltime->numbers.size() : 0;
    return alltime_numbers == day_prefix.size();
}

void AggregateCache::clear() {
    sorted_days.clear();
    aggregates = AllPeriodsAggregate();
    day_prefix.clear();
}

} // namespace timeroll
