#include "timeroll/aggregate/period_aggregate.hpp"
#include "timeroll/core/date_key.hpp"

namespace timeroll {

const std::string& PeriodAggregate::key() const {
    static const std::string empty_key;
    return date_key ? *date_key : empty_key;
}

void PeriodAggregate::assign(const DerivedStats& derived) {
    stats = derived.stats;
    deltas = derived.deltas;
    percents = derived.percents;
    cumulatives = derived.cumulatives;
    cumulative_deltas = derived.cumulative_deltas;
    cumulative_percents = derived.cumulative_percents;
}

bool PeriodAggregate::same_values(const PeriodAggregate& other) const {
    if (date_key != other.date_key || period != other.period ||
        numbers != other.numbers ||
        stats != other.stats || deltas != other.deltas ||
        percents != other.percents || cumulatives != other.cumulatives ||
        cumulative_deltas != other.cumulative_deltas ||
        cumulative_percents != other.cumulative_percents) {
        return false;
    }
    if (!extremes || !other.extremes) {
        return !extremes && !other.extremes;
    }
    return extremes_equal(*extremes, *other.extremes);
}

PeriodAggregate create_empty_aggregate(std::optional<std::string> date_key, TimePeriod period) {
    PeriodAggregate aggregate;
    aggregate.date_key = std::move(date_key);
    aggregate.period = period;
    return aggregate;
}

std::vector<AggregatePtr> build_prior_populated_index(const std::vector<AggregatePtr>& items) {
    std::vector<AggregatePtr> result;
    result.reserve(items.size());
    
    AggregatePtr last_populated;
    for (const auto& item : items) {
        result.push_back(last_populated);
        if (item && !item->numbers.empty()) {
            last_populated = item;
        }
    }
    return result;
}

std::optional<StatsExtremes> calculate_year_daily_extremes(
    const std::vector<AggregatePtr>& days,
    int year
) {
    const std::string year_key = to_year_key(year);
    
    std::vector<const NumberStats*> populated;
    for (const auto& day : days) {
        if (!day || day->period != TimePeriod::DAY || day->stats.empty()) {
            continue;
        }
        if (convert_date_key(day->key(), TimePeriod::YEAR) == year_key) {
            populated.push_back(&day->stats);
        }
    }
    return calculate_extremes(populated);
}

const char* metric_source_name(MetricSource source) {
    switch (source) {
        case MetricSource::STATS: return "stats";
        case MetricSource::DELTAS: return "deltas";
        case MetricSource::PERCENTS: return "percents";
        case MetricSource::CUMULATIVES: return "cumulatives";
        case MetricSource::CUMULATIVE_DELTAS: return "cumulative_deltas";
        case MetricSource::CUMULATIVE_PERCENTS: return "cumulative_percents";
    }
    return "unknown";
}

std::optional<double> aggregate_metric(
    const PeriodAggregate& aggregate,
    MetricSource source,
    StatField field
) {
    switch (source) {
        case MetricSource::STATS:
            return stat_value(aggregate.stats, field);
        case MetricSource::DELTAS:
            return stat_value(aggregate.deltas, field);
        case MetricSource::PERCENTS:
            return percent_value(aggregate.percents, field);
        case MetricSource::CUMULATIVES:
            return stat_value(aggregate.cumulatives, field);
        case MetricSource::CUMULATIVE_DELTAS:
            return stat_value(aggregate.cumulative_deltas, field);
        case MetricSource::CUMULATIVE_PERCENTS:
            return percent_value(aggregate.cumulative_percents, field);
    }
    return std::nullopt;
}

} // namespace timeroll
