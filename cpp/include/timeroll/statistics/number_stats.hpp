#pragma once

/**
 * @file number_stats.hpp
 * @brief Summary statistics over a finite sequence of numbers
 * 
 * Empty convention: every field of an empty NumberStats is 0.0 and
 * count == 0 is the only emptiness marker. No field is ever NaN, so
 * consumers can compare any field against a threshold directly.
 */

#include <array>
#include <optional>
#include <vector>

namespace timeroll {

/// Fields of NumberStats, in declaration order
enum class StatField {
    COUNT = 0,
    TOTAL = 1,
    MEAN = 2,
    MEDIAN = 3,
    MIN = 4,
    MAX = 5,
    FIRST = 6,
    LAST = 7,
    RANGE = 8,
    CHANGE = 9,
    CHANGE_PERCENT = 10
};

/// All fields, for field-wise iteration
constexpr std::array<StatField, 11> ALL_STAT_FIELDS = {
    StatField::COUNT, StatField::TOTAL, StatField::MEAN,
    StatField::MEDIAN, StatField::MIN, StatField::MAX,
    StatField::FIRST, StatField::LAST, StatField::RANGE,
    StatField::CHANGE, StatField::CHANGE_PERCENT
};

/// Lower-case field name ("count", "total", ...)
const char* stat_field_name(StatField field);

/// Summary statistics of a number sequence
struct NumberStats {
    double count;       ///< Number of values (stored as double for uniform deltas)
    double total;       ///< Sum of all values
    double mean;        ///< Arithmetic mean
    double median;      ///< Middle value (average of the two middle values when even)
    double min;         ///< Lowest value
    double max;         ///< Highest value
    double first;       ///< First value in entry order
    double last;        ///< Last value in entry order
    double range;       ///< max - min
    double change;      ///< last - first
    double change_percent;  ///< change / |first| as a fraction (0 when first is 0)
    
    NumberStats()
        : count(0.0), total(0.0), mean(0.0)
        , median(0.0), min(0.0), max(0.0)
        , first(0.0), last(0.0), range(0.0)
        , change(0.0), change_percent(0.0)
    {}
    
    /// True when no values contributed
    bool empty() const { return count == 0.0; }
    
    bool operator==(const NumberStats& other) const {
        return count == other.count && total == other.total &&
               mean == other.mean && median == other.median &&
               min == other.min && max == other.max &&
               first == other.first && last == other.last &&
               range == other.range && change == other.change &&
               change_percent == other.change_percent;
    }
    bool operator!=(const NumberStats& other) const { return !(*this == other); }
};

/// Per-field ratio of a delta to its baseline; absent where the baseline is zero
struct PercentStats {
    std::optional<double> count;
    std::optional<double> total;
    std::optional<double> mean;
    std::optional<double> median;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> first;
    std::optional<double> last;
    std::optional<double> range;
    std::optional<double> change;
    std::optional<double> change_percent;
    
    bool operator==(const PercentStats& other) const {
        return count == other.count && total == other.total &&
               mean == other.mean && median == other.median &&
               min == other.min && max == other.max &&
               first == other.first && last == other.last &&
               range == other.range && change == other.change &&
               change_percent == other.change_percent;
    }
    bool operator!=(const PercentStats& other) const { return !(*this == other); }
};

/// Read a field of NumberStats
double stat_value(const NumberStats& stats, StatField field);

/// Write a field of NumberStats
void set_stat_value(NumberStats& stats, StatField field, double value);

/// Read a field of PercentStats
std::optional<double> percent_value(const PercentStats& percents, StatField field);

/// Write a field of PercentStats
void set_percent_value(PercentStats& percents, StatField field, std::optional<double> value);

/// Stats of the empty sequence
inline NumberStats empty_stats() { return NumberStats(); }

/// Derive range, change and change_percent from min/max/first/last
void update_spread_fields(NumberStats& stats);

/**
 * @brief Compute count/total/mean/median/min/max/first/last and spreads
 * 
 * The input is not modified; the median works on a sorted copy.
 * Sequences of at least constants::ARROW_COMPUTE_THRESHOLD values use
 * the Arrow sum kernel when built with Arrow.
 * 
 * @param numbers Finite values (non-finite filtering is the caller's job)
 * @return Statistics, or the empty convention for an empty input
 */
NumberStats compute_number_stats(const std::vector<double>& numbers);

/// Median of an already sorted sequence (0.0 when empty)
double sorted_median(const std::vector<double>& sorted);

} // namespace timeroll
