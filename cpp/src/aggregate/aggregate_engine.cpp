/**
 * @file aggregate_engine.cpp
 * @brief Implementation of the incremental rollup engine
 */

#include "timeroll/aggregate/aggregate_engine.hpp"
#include "timeroll/core/date_key.hpp"
#include "timeroll/statistics/derived_stats.hpp"
#include "timeroll/statistics/extremes.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>

namespace timeroll {

AggregateEngine::AggregateEngine(EngineOptions options)
    : options_(options)
{
}

// ============================================================================
// Building Blocks
// ============================================================================

size_t AggregateEngine::find_first_changed_index(
    const std::vector<DayRecordPtr>& prev,
    const std::vector<DayRecordPtr>& next
) {
    const size_t min_len = std::min(prev.size(), next.size());
    for (size_t i = 0; i < min_len; ++i) {
        if (prev[i] != next[i]) {
            return i;
        }
    }
    return prev.size() == next.size() ? NO_CHANGE : min_len;
}

size_t AggregateEngine::find_first_key_index(
    const std::vector<std::string>& keys,
    const std::optional<std::string>& start_key
) {
    if (!start_key) {
        return keys.size();
    }
    auto it = std::lower_bound(keys.begin(), keys.end(), *start_key);
    return static_cast<size_t>(std::distance(keys.begin(), it));
}

std::vector<double> AggregateEngine::flatten_numbers(
    const std::vector<AggregatePtr>& items,
    size_t begin,
    size_t end
) {
    size_t total = 0;
    for (size_t i = begin; i < end; ++i) {
        total += items[i]->numbers.size();
    }
    
    std::vector<double> numbers;
    numbers.reserve(total);
    for (size_t i = begin; i < end; ++i) {
        numbers.insert(numbers.end(), items[i]->numbers.begin(), items[i]->numbers.end());
    }
    return numbers;
}

// ============================================================================
// Recompute
// ============================================================================

RecomputeResult AggregateEngine::recompute(
    const std::vector<DayRecordPtr>& log,
    AggregateCache cache
) const {
    RecomputeResult result;
    RecomputeStats& stats = result.stats;
    
    std::vector<DayRecordPtr> sorted = sort_day_records(log, stats);
    
    if (!cache.consistent()) {
        log_warning("Cache arrays are inconsistent, rebuilding from scratch");
        cache.clear();
        stats.cache_discarded = true;
    }
    
    const AllPeriodsAggregate& prev = cache.aggregates;
    const size_t changed = find_first_changed_index(cache.sorted_days, sorted);
    const bool has_changes = changed != NO_CHANGE;
    
    // Nothing changed: hand back the previous snapshot as is
    if (!has_changes && prev.alltime) {
        stats.days_reused = prev.days.size();
        stats.weeks_reused = prev.weeks.size();
        stats.months_reused = prev.months.size();
        stats.years_reused = prev.years.size();
        stats.alltime_reused = true;
        result.aggregates = prev;
        result.cache = std::move(cache);
        return result;
    }
    
    AllPeriodsAggregate out;
    const size_t day_start = has_changes ? changed : sorted.size();
    
    // ===== Days =====
    
    // Rewind the prefix distribution to the first changed day
    size_t missing = 0;
    for (size_t i = day_start; i < prev.days.size(); ++i) {
        missing += cache.day_prefix.erase(prev.days[i]->numbers);
    }
    if (missing > 0) {
        log_warning("Prefix distribution out of sync (" + std::to_string(missing) +
                    " values missing), rebuilding it");
        cache.day_prefix.clear();
        for (size_t i = 0; i < day_start; ++i) {
            cache.day_prefix.insert(prev.days[i]->numbers);
        }
    }
    
    out.days.assign(prev.days.begin(), prev.days.begin() + day_start);
    out.day_keys.assign(prev.day_keys.begin(), prev.day_keys.begin() + day_start);
    stats.days_reused = day_start;
    
    for (size_t i = day_start; i < sorted.size(); ++i) {
        const PeriodAggregate* prior = i > 0 ? out.days[i - 1].get() : nullptr;
        AggregatePtr day = build_day(*sorted[i], prior, cache.day_prefix, stats);
        
        // Same values as the cached day at this position: keep its identity
        if (i < prev.days.size() && prev.days[i]->same_values(*day)) {
            day = prev.days[i];
        }
        
        out.day_keys.push_back(sorted[i]->date_key);
        out.days.push_back(std::move(day));
        ++stats.days_recomputed;
    }
    
    // Earliest day key the change can touch; a removed or displaced
    // record may sort before the new record at the same position
    std::optional<std::string> earliest_day_key;
    if (has_changes) {
        if (changed < sorted.size()) {
            earliest_day_key = sorted[changed]->date_key;
        }
        if (changed < cache.sorted_days.size()) {
            const std::string& old_key = cache.sorted_days[changed]->date_key;
            if (!earliest_day_key || old_key < *earliest_day_key) {
                earliest_day_key = old_key;
            }
        }
    }
    
    auto level_key = [&](TimePeriod period) -> std::optional<std::string> {
        if (!earliest_day_key) {
            return std::nullopt;
        }
        return convert_date_key(*earliest_day_key, period);
    };
    
    // ===== Weeks & Months (children: days) =====
    
    stats.weeks_reused = build_level(
        TimePeriod::WEEK, out.days, day_start,
        prev.week_keys, prev.weeks, level_key(TimePeriod::WEEK),
        out.week_keys, out.weeks, stats);
    stats.weeks_recomputed = out.weeks.size() - stats.weeks_reused;
    
    stats.months_reused = build_level(
        TimePeriod::MONTH, out.days, day_start,
        prev.month_keys, prev.months, level_key(TimePeriod::MONTH),
        out.month_keys, out.months, stats);
    stats.months_recomputed = out.months.size() - stats.months_reused;
    
    // ===== Years (children: months) =====
    
    stats.years_reused = build_level(
        TimePeriod::YEAR, out.months, stats.months_reused,
        prev.year_keys, prev.years, level_key(TimePeriod::YEAR),
        out.year_keys, out.years, stats);
    stats.years_recomputed = out.years.size() - stats.years_reused;
    
    // ===== All-Time =====
    
    out.alltime = build_alltime(out.years, prev.alltime, cache.day_prefix, stats);
    
    if (options_.verbose) {
        std::ostringstream oss;
        oss << "Recomputed " << stats.days_recomputed << " days, "
            << stats.weeks_recomputed << " weeks, "
            << stats.months_recomputed << " months, "
            << stats.years_recomputed << " years (reused "
            << stats.days_reused << "/" << stats.weeks_reused << "/"
            << stats.months_reused << "/" << stats.years_reused << ")";
        log_info(oss.str());
    }
    
    if (stats.skipped_values > 0) {
        log_warning("Filtered " + std::to_string(stats.skipped_values) + " non-finite values");
    }
    
    cache.sorted_days = std::move(sorted);
    cache.aggregates = out;
    result.aggregates = std::move(out);
    result.cache = std::move(cache);
    return result;
}

// ============================================================================
// Internal Methods
// ============================================================================

std::vector<DayRecordPtr> AggregateEngine::sort_day_records(
    const std::vector<DayRecordPtr>& log,
    RecomputeStats& stats
) const {
    std::vector<DayRecordPtr> sorted;
    sorted.reserve(log.size());
    
    for (const auto& record : log) {
        if (!record || !is_day_key(record->date_key)) {
            ++stats.skipped_records;
            continue;
        }
        sorted.push_back(record);
    }
    
    if (stats.skipped_records > 0) {
        log_warning("Skipped " + std::to_string(stats.skipped_records) +
                    " records with a missing or malformed day key");
    }
    
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const DayRecordPtr& a, const DayRecordPtr& b) {
            return a->date_key < b->date_key;
        });
    
    for (size_t i = 1; i < sorted.size(); ++i) {
        if (sorted[i]->date_key == sorted[i - 1]->date_key) {
            log_warning("Duplicate day key " + sorted[i]->date_key);
        }
    }
    
    return sorted;
}

AggregatePtr AggregateEngine::build_day(
    const DayRecord& record,
    const PeriodAggregate* prior,
    PrefixDistribution& prefix,
    RecomputeStats& stats
) const {
    auto day = std::make_shared<PeriodAggregate>();
    day->date_key = record.date_key;
    day->period = TimePeriod::DAY;
    
    // Non-finite values are dropped before any statistic sees them
    day->numbers.reserve(record.numbers.size());
    for (double value : record.numbers) {
        if (std::isfinite(value)) {
            day->numbers.push_back(value);
        } else {
            ++stats.skipped_values;
        }
    }
    
    prefix.insert(day->numbers);
    day->assign(compute_period_derived_stats(
        day->numbers,
        prior ? &prior->stats : nullptr,
        prior ? &prior->cumulatives : nullptr,
        prefix.median()
    ));
    return day;
}

size_t AggregateEngine::build_level(
    TimePeriod period,
    const std::vector<AggregatePtr>& children,
    size_t first_changed_child,
    const std::vector<std::string>& prev_keys,
    const std::vector<AggregatePtr>& prev_items,
    const std::optional<std::string>& boundary_key,
    std::vector<std::string>& keys,
    std::vector<AggregatePtr>& items,
    RecomputeStats& stats
) const {
    if (!boundary_key) {
        keys = prev_keys;
        items = prev_items;
        return items.size();
    }
    
    // Cached aggregates before the boundary only cover unchanged children
    const size_t boundary = find_first_key_index(prev_keys, boundary_key);
    keys.assign(prev_keys.begin(), prev_keys.begin() + boundary);
    items.assign(prev_items.begin(), prev_items.begin() + boundary);
    
    // Level keys of the children that may need re-bucketing. Children at or
    // after first_changed_child are all at or after the boundary; unchanged
    // children sharing the boundary bucket sit right before them.
    size_t start = std::min(first_changed_child, children.size());
    while (start > 0) {
        auto key = convert_date_key(children[start - 1]->key(), period);
        if (!key || *key < *boundary_key) {
            break;
        }
        --start;
    }
    
    std::vector<std::string> child_keys;
    child_keys.reserve(children.size() - start);
    for (size_t i = start; i < children.size(); ++i) {
        auto key = convert_date_key(children[i]->key(), period);
        child_keys.push_back(key ? *key : std::string());
    }
    
    size_t prev_pos = boundary;
    size_t i = start;
    while (i < children.size()) {
        const std::string& key = child_keys[i - start];
        size_t end = i + 1;
        while (end < children.size() && child_keys[end - start] == key) {
            ++end;
        }
        
        const PeriodAggregate* prior = items.empty() ? nullptr : items.back().get();
        
        auto aggregate = std::make_shared<PeriodAggregate>();
        aggregate->date_key = key;
        aggregate->period = period;
        aggregate->numbers = flatten_numbers(children, i, end);
        
        // The last child's cumulative median already covers this whole prefix
        aggregate->assign(compute_period_derived_stats(
            aggregate->numbers,
            prior ? &prior->stats : nullptr,
            prior ? &prior->cumulatives : nullptr,
            children[end - 1]->cumulatives.median
        ));
        
        // Cached aggregate with the same key, if any (keys are sorted)
        while (prev_pos < prev_keys.size() && prev_keys[prev_pos] < key) {
            ++prev_pos;
        }
        const PeriodAggregate* previous =
            (prev_pos < prev_keys.size() && prev_keys[prev_pos] == key)
                ? prev_items[prev_pos].get()
                : nullptr;
        
        std::vector<const NumberStats*> child_stats;
        child_stats.reserve(end - i);
        for (size_t c = i; c < end; ++c) {
            child_stats.push_back(&children[c]->stats);
        }
        attach_extremes(*aggregate, child_stats, previous, stats);
        
        if (previous && previous->same_values(*aggregate)) {
            items.push_back(prev_items[prev_pos]);
        } else {
            items.push_back(std::move(aggregate));
        }
        keys.push_back(key);
        
        i = end;
    }
    
    return boundary;
}

AggregatePtr AggregateEngine::build_alltime(
    const std::vector<AggregatePtr>& years,
    const AggregatePtr& prev_alltime,
    const PrefixDistribution& prefix,
    RecomputeStats& stats
) const {
    auto alltime = std::make_shared<PeriodAggregate>(
        create_empty_aggregate(std::nullopt, TimePeriod::ANYTIME));
    alltime->numbers = flatten_numbers(years, 0, years.size());
    
    // The last year's cumulatives already cover the whole history; only
    // the median comes from the prefix distribution
    NumberStats alltime_stats;
    if (!years.empty()) {
        alltime_stats = years.back()->cumulatives;
        alltime_stats.median = prefix.median();
    }
    
    // No siblings: no prior stats, no prior cumulatives
    alltime->assign(compute_period_derived_stats(alltime_stats, nullptr, nullptr, prefix.median()));
    
    std::vector<const NumberStats*> year_stats;
    year_stats.reserve(years.size());
    for (const auto& year : years) {
        year_stats.push_back(&year->stats);
    }
    attach_extremes(*alltime, year_stats, prev_alltime.get(), stats);
    
    if (prev_alltime && prev_alltime->same_values(*alltime)) {
        stats.alltime_reused = true;
        return prev_alltime;
    }
    return alltime;
}

void AggregateEngine::attach_extremes(
    PeriodAggregate& aggregate,
    const std::vector<const NumberStats*>& children,
    const PeriodAggregate* previous,
    RecomputeStats& stats
) const {
    auto extremes = calculate_extremes(children);
    if (!extremes) {
        aggregate.extremes.reset();
        return;
    }
    
    if (previous && previous->extremes && extremes_equal(*previous->extremes, *extremes)) {
        aggregate.extremes = previous->extremes;
        ++stats.extremes_reused;
        return;
    }
    aggregate.extremes = std::make_shared<const StatsExtremes>(*extremes);
}

void AggregateEngine::log_warning(const std::string& message) const {
    if (options_.log_warnings) {
        std::cerr << constants::LOG_TAG << " " << message << std::endl;
    }
}

void AggregateEngine::log_info(const std::string& message) const {
    if (options_.verbose) {
        std::cout << constants::LOG_TAG << " " << message << std::endl;
    }
}

} // namespace timeroll
