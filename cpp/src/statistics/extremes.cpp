#include "timeroll/statistics/extremes.hpp"
#include <algorithm>

namespace timeroll {

namespace {

// Works for both const and mutable extremes
template <typename Extremes>
auto& highest_ref(Extremes& e, StatField field) {
    switch (field) {
        case StatField::COUNT: return e.highest_count;
        case StatField::TOTAL: return e.highest_total;
        case StatField::MEAN: return e.highest_mean;
        case StatField::MEDIAN: return e.highest_median;
        case StatField::MIN: return e.highest_min;
        case StatField::MAX: return e.highest_max;
        case StatField::FIRST: return e.highest_first;
        case StatField::LAST: return e.highest_last;
        case StatField::RANGE: return e.highest_range;
        case StatField::CHANGE: return e.highest_change;
        case StatField::CHANGE_PERCENT: return e.highest_change_percent;
    }
    return e.highest_count;
}

template <typename Extremes>
auto& lowest_ref(Extremes& e, StatField field) {
    switch (field) {
        case StatField::COUNT: return e.lowest_count;
        case StatField::TOTAL: return e.lowest_total;
        case StatField::MEAN: return e.lowest_mean;
        case StatField::MEDIAN: return e.lowest_median;
        case StatField::MIN: return e.lowest_min;
        case StatField::MAX: return e.lowest_max;
        case StatField::FIRST: return e.lowest_first;
        case StatField::LAST: return e.lowest_last;
        case StatField::RANGE: return e.lowest_range;
        case StatField::CHANGE: return e.lowest_change;
        case StatField::CHANGE_PERCENT: return e.lowest_change_percent;
    }
    return e.lowest_count;
}

} // namespace

bool extremes_equal(const StatsExtremes& left, const StatsExtremes& right) {
    for (StatField field : ALL_STAT_FIELDS) {
        if (highest_for(left, field) != highest_for(right, field) ||
            lowest_for(left, field) != lowest_for(right, field)) {
            return false;
        }
    }
    return true;
}

double highest_for(const StatsExtremes& extremes, StatField field) {
    return highest_ref(extremes, field);
}

double lowest_for(const StatsExtremes& extremes, StatField field) {
    return lowest_ref(extremes, field);
}

std::optional<StatsExtremes> calculate_extremes(const std::vector<const NumberStats*>& children) {
    if (children.empty()) {
        return std::nullopt;
    }
    
    StatsExtremes extremes;
    for (StatField field : ALL_STAT_FIELDS) {
        double high = stat_value(*children.front(), field);
        double low = high;
        for (size_t i = 1; i < children.size(); ++i) {
            const double value = stat_value(*children[i], field);
            high = std::max(high, value);
            low = std::min(low, value);
        }
        highest_ref(extremes, field) = high;
        lowest_ref(extremes, field) = low;
    }
    return extremes;
}

} // namespace timeroll
