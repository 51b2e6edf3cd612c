#include "timeroll/core/date_key.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace timeroll {

using namespace std::chrono;

namespace {

/// Parse a fixed-width run of digits; false on any non-digit
bool parse_digits(std::string_view text, size_t pos, size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

/// Monday of ISO week 1 of an ISO week-year
sys_days iso_year_start(int iso_year) {
    const sys_days jan4{year{iso_year} / January / 4};
    const int offset = static_cast<int>(weekday{jan4}.iso_encoding()) - 1;
    return jan4 - days{offset};
}

/// Parsed (iso_year, week) of a week key, without range validation
bool parse_week_parts(std::string_view key, int& iso_year, int& week) {
    return key.size() == 8 &&
           parse_digits(key, 0, 4, iso_year) &&
           key[4] == '-' && key[5] == 'W' &&
           parse_digits(key, 6, 2, week);
}

bool parse_month_parts(std::string_view key, int& y, int& m) {
    return key.size() == 7 &&
           parse_digits(key, 0, 4, y) &&
           key[4] == '-' &&
           parse_digits(key, 5, 2, m) &&
           m >= 1 && m <= 12;
}

} // namespace

// ===== Format Checks =====

std::optional<year_month_day> parse_day_key(std::string_view key) {
    int y = 0, m = 0, d = 0;
    if (key.size() != 10 ||
        !parse_digits(key, 0, 4, y) || key[4] != '-' ||
        !parse_digits(key, 5, 2, m) || key[7] != '-' ||
        !parse_digits(key, 8, 2, d)) {
        return std::nullopt;
    }
    const year_month_day date{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

bool is_day_key(std::string_view key) {
    return parse_day_key(key).has_value();
}

bool is_week_key(std::string_view key) {
    int iso_year = 0, week = 0;
    if (!parse_week_parts(key, iso_year, week) || week < 1 || week > 53) {
        return false;
    }
    if (week < 53) {
        return true;
    }
    // Week 53 only exists when its Thursday still belongs to the same ISO year
    const sys_days thursday = iso_year_start(iso_year) + days{52 * 7 + 3};
    return iso_week(year_month_day{thursday}).first == iso_year;
}

bool is_month_key(std::string_view key) {
    int y = 0, m = 0;
    return parse_month_parts(key, y, m);
}

bool is_year_key(std::string_view key) {
    int y = 0;
    return key.size() == 4 && parse_digits(key, 0, 4, y);
}

std::optional<TimePeriod> key_period(std::string_view key) {
    if (is_day_key(key)) return TimePeriod::DAY;
    if (is_week_key(key)) return TimePeriod::WEEK;
    if (is_month_key(key)) return TimePeriod::MONTH;
    if (is_year_key(key)) return TimePeriod::YEAR;
    return std::nullopt;
}

// ===== Construction =====

std::string to_day_key(int y, unsigned m, unsigned d) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", y, m, d);
    return buffer;
}

std::string to_week_key(int iso_year, unsigned week) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-W%02u", iso_year, week);
    return buffer;
}

std::string to_month_key(int y, unsigned m) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u", y, m);
    return buffer;
}

std::string to_year_key(int y) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d", y);
    return buffer;
}

std::string to_day_key(const year_month_day& date) {
    return to_day_key(static_cast<int>(date.year()),
                      static_cast<unsigned>(date.month()),
                      static_cast<unsigned>(date.day()));
}

// ===== Parsing & Conversion =====

std::pair<int, unsigned> iso_week(const year_month_day& date) {
    const sys_days day_point{date};
    const int iso_weekday = static_cast<int>(weekday{day_point}.iso_encoding());  // Mon=1 .. Sun=7
    
    // The ISO year of a week is the year of its Thursday
    const sys_days thursday = day_point + days{4} - days{iso_weekday};
    const int iso_year = static_cast<int>(year_month_day{thursday}.year());
    const sys_days jan1{year{iso_year} / January / 1};
    const unsigned week = static_cast<unsigned>((thursday - jan1).count() / 7 + 1);
    return {iso_year, week};
}

std::optional<year_month_day> period_start(std::string_view key) {
    if (auto date = parse_day_key(key)) {
        return date;
    }
    if (is_week_key(key)) {
        int iso_year = 0, week = 0;
        parse_week_parts(key, iso_year, week);
        return year_month_day{iso_year_start(iso_year) + days{(week - 1) * 7}};
    }
    int y = 0, m = 0;
    if (parse_month_parts(key, y, m)) {
        return year_month_day{year{y}, month{static_cast<unsigned>(m)}, day{1}};
    }
    if (is_year_key(key)) {
        parse_digits(key, 0, 4, y);
        return year_month_day{year{y}, January, day{1}};
    }
    return std::nullopt;
}

std::optional<std::string> convert_date_key(std::string_view key, TimePeriod target) {
    if (target == TimePeriod::ANYTIME) {
        throw std::runtime_error("Cannot convert a date key to the anytime period");
    }
    
    const auto source = key_period(key);
    if (!source) {
        return std::nullopt;
    }
    
    if (*source == target) {
        return std::string(key);
    }
    if (static_cast<int>(target) < static_cast<int>(*source)) {
        throw std::runtime_error(std::string("Cannot convert ") + period_name(*source) +
                                 " key to finer period " + period_name(target));
    }
    
    switch (*source) {
        case TimePeriod::DAY: {
            const year_month_day date = *parse_day_key(key);
            if (target == TimePeriod::WEEK) {
                const auto [iso_year, week] = iso_week(date);
                return to_week_key(iso_year, week);
            }
            if (target == TimePeriod::MONTH) {
                return to_month_key(static_cast<int>(date.year()), static_cast<unsigned>(date.month()));
            }
            return to_year_key(static_cast<int>(date.year()));
        }
        case TimePeriod::WEEK:
            if (target == TimePeriod::MONTH) {
                throw std::runtime_error("A week key does not map to a single month");
            }
            // ISO week-year
            return std::string(key.substr(0, 4));
        case TimePeriod::MONTH:
            return std::string(key.substr(0, 4));
        default:
            break;
    }
    throw std::runtime_error("Unsupported date key conversion");
}

} // namespace timeroll
