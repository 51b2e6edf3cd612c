#include "timeroll/statistics/derived_stats.hpp"
#include <algorithm>
#include <cmath>

namespace timeroll {

NumberStats compute_stats_deltas(const NumberStats& current, const NumberStats* prior) {
    NumberStats deltas;
    for (StatField field : ALL_STAT_FIELDS) {
        const double baseline = prior ? stat_value(*prior, field) : 0.0;
        set_stat_value(deltas, field, stat_value(current, field) - baseline);
    }
    return deltas;
}

PercentStats compute_stats_percents(const NumberStats& current, const NumberStats* prior) {
    PercentStats percents;
    if (!prior) {
        return percents;
    }
    for (StatField field : ALL_STAT_FIELDS) {
        const double baseline = stat_value(*prior, field);
        if (baseline == 0.0) {
            continue;
        }
        const double delta = stat_value(current, field) - baseline;
        set_percent_value(percents, field, delta / std::abs(baseline));
    }
    return percents;
}

NumberStats compute_cumulatives(
    const NumberStats& stats,
    const NumberStats* prior_cumulatives,
    double cumulative_median
) {
    if (!prior_cumulatives || prior_cumulatives->empty()) {
        NumberStats result = stats;
        result.median = stats.empty() ? 0.0 : cumulative_median;
        return result;
    }
    
    if (stats.empty()) {
        NumberStats result = *prior_cumulatives;
        result.median = cumulative_median;
        return result;
    }
    
    NumberStats result;
    result.count = prior_cumulatives->count + stats.count;
    result.total = prior_cumulatives->total + stats.total;
    result.mean = result.total / result.count;
    result.median = cumulative_median;
    result.min = std::min(prior_cumulatives->min, stats.min);
    result.max = std::max(prior_cumulatives->max, stats.max);
    result.first = prior_cumulatives->first;
    result.last = stats.last;
    update_spread_fields(result);
    return result;
}

DerivedStats compute_period_derived_stats(
    const std::vector<double>& numbers,
    const NumberStats* prior_stats,
    const NumberStats* prior_cumulatives,
    double cumulative_median
) {
    return compute_period_derived_stats(
        compute_number_stats(numbers), prior_stats, prior_cumulatives, cumulative_median);
}

DerivedStats compute_period_derived_stats(
    const NumberStats& stats,
    const NumberStats* prior_stats,
    const NumberStats* prior_cumulatives,
    double cumulative_median
) {
    DerivedStats derived;
    derived.stats = stats;
    derived.deltas = compute_stats_deltas(derived.stats, prior_stats);
    derived.percents = compute_stats_percents(derived.stats, prior_stats);
    derived.cumulatives = compute_cumulatives(derived.stats, prior_cumulatives, cumulative_median);
    
    // First cumulatives of a chain have no baseline: deltas stay empty
    if (prior_cumulatives) {
        derived.cumulative_deltas = compute_stats_deltas(derived.cumulatives, prior_cumulatives);
        derived.cumulative_percents = compute_stats_percents(derived.cumulatives, prior_cumulatives);
    }
    return derived;
}

} // namespace timeroll
