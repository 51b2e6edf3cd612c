#pragma once

/**
 * @file types.hpp
 * @brief Core data types for the TimeRoll aggregation engine
 * 
 * This file defines the fundamental structures shared by the statistics
 * layer and the period rollup engine: the input day records, the time
 * period enumeration, engine options and recompute counters.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace timeroll {

// ============================================================================
// Time Periods
// ============================================================================

/**
 * @brief Granularity of an aggregate
 * 
 * Ordered from finest to coarsest. ANYTIME is the single unbounded span
 * covering the whole history.
 */
enum class TimePeriod {
    DAY = 0,
    WEEK = 1,
    MONTH = 2,
    YEAR = 3,
    ANYTIME = 4
};

/// Lower-case name of a period ("day", "week", ...)
inline const char* period_name(TimePeriod period) {
    switch (period) {
        case TimePeriod::DAY: return "day";
        case TimePeriod::WEEK: return "week";
        case TimePeriod::MONTH: return "month";
        case TimePeriod::YEAR: return "year";
        case TimePeriod::ANYTIME: return "anytime";
    }
    return "unknown";
}

// ============================================================================
// Input Records
// ============================================================================

/**
 * @brief One day of the measurement log
 * 
 * Owned by the external log store. The engine only reads it and relies
 * on the store handing back the same handle for an unchanged day, so
 * handle identity is the change signal.
 */
struct DayRecord {
    std::string date_key;           ///< Day key (YYYY-MM-DD)
    std::vector<double> numbers;    ///< Measurements in entry order
    
    /// Default constructor
    DayRecord() = default;
    
    /// Constructor with data
    DayRecord(std::string key, std::vector<double> values)
        : date_key(std::move(key)), numbers(std::move(values)) {}
};

/// Shared, immutable handle to a day record
using DayRecordPtr = std::shared_ptr<const DayRecord>;

/// Convenience factory for a day record handle
inline DayRecordPtr make_day_record(std::string key, std::vector<double> values) {
    return std::make_shared<const DayRecord>(std::move(key), std::move(values));
}

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Options for the aggregate engine
 */
struct EngineOptions {
    bool verbose = false;           ///< Print a summary line per recompute
    bool log_warnings = true;       ///< Report skipped records and values
};

// ============================================================================
// Recompute Counters
// ============================================================================

/**
 * @brief Work done by a single recompute call
 * 
 * "reused" aggregates were served from the cache by reference,
 * "recomputed" ones were built in this call.
 */
struct RecomputeStats {
    size_t days_reused;
    size_t days_recomputed;
    size_t weeks_reused;
    size_t weeks_recomputed;
    size_t months_reused;
    size_t months_recomputed;
    size_t years_reused;
    size_t years_recomputed;
    bool alltime_reused;
    size_t extremes_reused;         ///< Recomputed containers that kept their previous extremes object
    size_t skipped_records;         ///< Null handles and malformed date keys
    size_t skipped_values;          ///< Non-finite numbers filtered out
    bool cache_discarded;           ///< Cache was inconsistent and ignored
    
    /// Default constructor
    RecomputeStats()
        : days_reused(0), days_recomputed(0)
        , weeks_reused(0), weeks_recomputed(0)
        , months_reused(0), months_recomputed(0)
        , years_reused(0), years_recomputed(0)
        , alltime_reused(false), extremes_reused(0)
        , skipped_records(0), skipped_values(0)
        , cache_discarded(false) {}
    
    /// Total aggregates built in this call (all-time excluded)
    size_t total_recomputed() const {
        return days_recomputed + weeks_recomputed + months_recomputed + years_recomputed;
    }
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    /// Minimum sequence length before Arrow compute kernels are used
    constexpr size_t ARROW_COMPUTE_THRESHOLD = 10000;
    
    /// Log tag used by the engine
    constexpr const char* LOG_TAG = "[Aggregate]";
}

} // namespace timeroll
