#pragma once

/**
 * @file date_key.hpp
 * @brief Date keys for every granularity and conversion between them
 * 
 * Key formats:
 * - Day:   YYYY-MM-DD
 * - Week:  YYYY-Www  (ISO 8601 week-year and week number)
 * - Month: YYYY-MM
 * - Year:  YYYY
 * 
 * Every format sorts lexicographically in chronological order, and the
 * day -> week/month/year and month -> year mappings are monotonic, so
 * sorted children always group into consecutive runs.
 */

#include "timeroll/core/types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace timeroll {

// ============================================================================
// Format Checks
// ============================================================================

/// True for a well-formed YYYY-MM-DD key naming a real calendar date
bool is_day_key(std::string_view key);

/// True for a well-formed YYYY-Www key whose week exists in that ISO year
bool is_week_key(std::string_view key);

/// True for a well-formed YYYY-MM key
bool is_month_key(std::string_view key);

/// True for a well-formed YYYY key
bool is_year_key(std::string_view key);

/// Granularity of a key, or std::nullopt if it matches no format
std::optional<TimePeriod> key_period(std::string_view key);

// ============================================================================
// Construction
// ============================================================================

std::string to_day_key(int year, unsigned month, unsigned day);
std::string to_week_key(int iso_year, unsigned week);
std::string to_month_key(int year, unsigned month);
std::string to_year_key(int year);

/// Day key for a calendar date
std::string to_day_key(const std::chrono::year_month_day& date);

// ============================================================================
// Parsing & Conversion
// ============================================================================

/// Calendar date of a day key, or std::nullopt when malformed
std::optional<std::chrono::year_month_day> parse_day_key(std::string_view key);

/// ISO 8601 (week-year, week number) of a date
std::pair<int, unsigned> iso_week(const std::chrono::year_month_day& date);

/**
 * @brief First calendar day covered by a key
 * 
 * Day -> itself, week -> its Monday, month -> the 1st, year -> January 1st.
 * 
 * @return std::nullopt when the key is malformed
 */
std::optional<std::chrono::year_month_day> period_start(std::string_view key);

/**
 * @brief Convert a key to a coarser (or the same) granularity
 * 
 * Supported: day -> day/week/month/year, week -> week/year,
 * month -> month/year, year -> year.
 * 
 * @param key Source key
 * @param target Target granularity
 * @return Converted key, or std::nullopt if the source key is malformed
 * @throws std::runtime_error if target is ANYTIME or cannot contain the source period
 */
std::optional<std::string> convert_date_key(std::string_view key, TimePeriod target);

} // namespace timeroll
