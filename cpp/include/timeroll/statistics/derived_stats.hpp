#pragma once

/**
 * @file derived_stats.hpp
 * @brief Stats of a period chained against its preceding sibling
 * 
 * Given a period's numbers and the previous sibling's stats and
 * cumulatives, produces the local stats, deltas, percents, cumulatives
 * and the deltas/percents between consecutive cumulatives.
 * 
 * First period of a chain: the baseline is zero, so deltas equal stats
 * and no percent is defined. Without prior cumulatives there is nothing
 * to compare the cumulatives against, so cumulative_deltas stay empty.
 */

#include "timeroll/statistics/number_stats.hpp"
#include <vector>

namespace timeroll {

/// Everything derived for one period
struct DerivedStats {
    NumberStats stats;              ///< Local stats of the period's numbers
    NumberStats deltas;             ///< stats - prior stats, field-wise
    PercentStats percents;          ///< deltas / |prior stats|
    NumberStats cumulatives;        ///< Stats of the history prefix ending here
    NumberStats cumulative_deltas;  ///< cumulatives - prior cumulatives
    PercentStats cumulative_percents; ///< cumulative_deltas / |prior cumulatives|
};

/**
 * @brief Field-wise current - prior
 * @param prior Baseline; nullptr means a zero baseline
 */
NumberStats compute_stats_deltas(const NumberStats& current, const NumberStats* prior);

/**
 * @brief Field-wise (current - prior) / |prior|
 * 
 * A field is absent when there is no prior or the prior field is zero.
 */
PercentStats compute_stats_percents(const NumberStats& current, const NumberStats* prior);

/**
 * @brief Fold a period into the running cumulatives
 * 
 * count and total add up; min/max take the running extreme over
 * non-empty operands; first comes from the earliest non-empty period and
 * last from the latest; mean is total / count; median is supplied by the
 * caller because it cannot be derived from the prior cumulatives.
 * 
 * @param stats Local stats of this period
 * @param prior_cumulatives Cumulatives up to the previous period, or nullptr
 * @param cumulative_median Exact median of the whole prefix, this period included
 */
NumberStats compute_cumulatives(
    const NumberStats& stats,
    const NumberStats* prior_cumulatives,
    double cumulative_median
);

/**
 * @brief Compute all derived stats for a period
 * 
 * @param numbers Finite values of this period
 * @param prior_stats Stats of the preceding sibling, or nullptr for the first period
 * @param prior_cumulatives Cumulatives of the preceding sibling, or nullptr
 * @param cumulative_median Exact median of the history prefix including this period
 */
DerivedStats compute_period_derived_stats(
    const std::vector<double>& numbers,
    const NumberStats* prior_stats,
    const NumberStats* prior_cumulatives,
    double cumulative_median
);

/// Same as above for stats that are already known
DerivedStats compute_period_derived_stats(
    const NumberStats& stats,
    const NumberStats* prior_stats,
    const NumberStats* prior_cumulatives,
    double cumulative_median
);

} // namespace timeroll
