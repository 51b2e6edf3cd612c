#include "timeroll/statistics/number_stats.hpp"
#include "timeroll/statistics/arrow_utils.hpp"
#include "timeroll/core/types.hpp"
#include <algorithm>
#include <cmath>

namespace timeroll {

const char* stat_field_name(StatField field) {
    switch (field) {
        case StatField::COUNT: return "count";
        case StatField::TOTAL: return "total";
        case StatField::MEAN: return "mean";
        case StatField::MEDIAN: return "median";
        case StatField::MIN: return "min";
        case StatField::MAX: return "max";
        case StatField::FIRST: return "first";
        case StatField::LAST: return "last";
        case StatField::RANGE: return "range";
        case StatField::CHANGE: return "change";
        case StatField::CHANGE_PERCENT: return "change_percent";
    }
    return "unknown";
}

double stat_value(const NumberStats& stats, StatField field) {
    switch (field) {
        case StatField::COUNT: return stats.count;
        case StatField::TOTAL: return stats.total;
        case StatField::MEAN: return stats.mean;
        case StatField::MEDIAN: return stats.median;
        case StatField::MIN: return stats.min;
        case StatField::MAX: return stats.max;
        case StatField::FIRST: return stats.first;
        case StatField::LAST: return stats.last;
        case StatField::RANGE: return stats.range;
        case StatField::CHANGE: return stats.change;
        case StatField::CHANGE_PERCENT: return stats.change_percent;
    }
    return 0.0;
}

void set_stat_value(NumberStats& stats, StatField field, double value) {
    switch (field) {
        case StatField::COUNT: stats.count = value; break;
        case StatField::TOTAL: stats.total = value; break;
        case StatField::MEAN: stats.mean = value; break;
        case StatField::MEDIAN: stats.median = value; break;
        case StatField::MIN: stats.min = value; break;
        case StatField::MAX: stats.max = value; break;
        case StatField::FIRST: stats.first = value; break;
        case StatField::LAST: stats.last = value; break;
        case StatField::RANGE: stats.range = value; break;
        case StatField::CHANGE: stats.change = value; break;
        case StatField::CHANGE_PERCENT: stats.change_percent = value; break;
    }
}

std::optional<double> percent_value(const PercentStats& percents, StatField field) {
    switch (field) {
        case StatField::COUNT: return percents.count;
        case StatField::TOTAL: return percents.total;
        case StatField::MEAN: return percents.mean;
        case StatField::MEDIAN: return percents.median;
        case StatField::MIN: return percents.min;
        case StatField::MAX: return percents.max;
        case StatField::FIRST: return percents.first;
        case StatField::LAST: return percents.last;
        case StatField::RANGE: return percents.range;
        case StatField::CHANGE: return percents.change;
        case StatField::CHANGE_PERCENT: return percents.change_percent;
    }
    return std::nullopt;
}

void set_percent_value(PercentStats& percents, StatField field, std::optional<double> value) {
    switch (field) {
        case StatField::COUNT: percents.count = value; break;
        case StatField::TOTAL: percents.total = value; break;
        case StatField::MEAN: percents.mean = value; break;
        case StatField::MEDIAN: percents.median = value; break;
        case StatField::MIN: percents.min = value; break;
        case StatField::MAX: percents.max = value; break;
        case StatField::FIRST: percents.first = value; break;
        case StatField::LAST: percents.last = value; break;
        case StatField::RANGE: percents.range = value; break;
        case StatField::CHANGE: percents.change = value; break;
        case StatField::CHANGE_PERCENT: percents.change_percent = value; break;
    }
}

double sorted_median(const std::vector<double>& sorted) {
    const size_t n = sorted.size();
    if (n == 0) {
        return 0.0;
    }
    if (n % 2 == 0) {
        return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
    }
    return sorted[n / 2];
}

void update_spread_fields(NumberStats& stats) {
    stats.range = stats.max - stats.min;
    stats.change = stats.last - stats.first;
    stats.change_percent = stats.first != 0.0 ? stats.change / std::abs(stats.first) : 0.0;
}

NumberStats compute_number_stats(const std::vector<double>& numbers) {
    NumberStats stats;
    if (numbers.empty()) {
        return stats;
    }
    
    const size_t length = numbers.size();
    stats.count = static_cast<double>(length);
    stats.first = numbers.front();
    stats.last = numbers.back();
    
    // Median needs a sorted copy; min/max fall out of it for free
    std::vector<double> sorted(numbers);
    std::sort(sorted.begin(), sorted.end());
    stats.median = sorted_median(sorted);
    stats.min = sorted.front();
    stats.max = sorted.back();
    
    bool have_total = false;
    
#ifdef HAVE_ARROW
    // Arrow overhead only pays off for large periods (all-time, long years)
    if (length >= constants::ARROW_COMPUTE_THRESHOLD && arrow_utils::is_arrow_available()) {
        have_total = arrow_utils::sum(numbers, stats.total);
    }
#endif
    
    if (!have_total) {
        double total = 0.0;
        for (double value : numbers) {
            total += value;
        }
        stats.total = total;
    }
    
    stats.mean = stats.total / stats.count;
    update_spread_fields(stats);
    return stats;
}

} // namespace timeroll
