/**
 * Date Key Test
 * 
 * Validates key predicates and conversion:
 * 1. Day keys must be real calendar dates
 * 2. ISO week keys, including year boundaries and week 53
 * 3. Conversions and their error cases
 * 4. Week keys sort in day order
 */

#include "test_common.hpp"
#include "timeroll/core/date_key.hpp"
#include <functional>
#include <stdexcept>

using namespace timeroll;
using namespace std::chrono;

bool test_day_keys() {
    std::cout << "\n=== Test 1: Day Keys ===" << std::endl;
    
    TEST_ASSERT(is_day_key("2024-01-01"), "2024-01-01 is a day key");
    TEST_ASSERT(is_day_key("2024-02-29"), "Leap day is valid");
    TEST_ASSERT(!is_day_key("2023-02-29"), "Non-leap Feb 29 is invalid");
    TEST_ASSERT(!is_day_key("2024-13-01"), "Month 13 is invalid");
    TEST_ASSERT(!is_day_key("2024-1-01"), "Unpadded month is invalid");
    TEST_ASSERT(!is_day_key("garbage"), "Garbage is invalid");
    TEST_ASSERT(!is_day_key(""), "Empty string is invalid");
    
    TEST_ASSERT(to_day_key(2024, 3, 7) == "2024-03-07", "to_day_key pads");
    auto parsed = parse_day_key("2024-03-07");
    TEST_ASSERT(parsed && to_day_key(*parsed) == "2024-03-07", "parse_day_key round-trips");
    return true;
}

bool test_week_keys() {
    std::cout << "\n=== Test 2: Week Keys ===" << std::endl;
    
    TEST_ASSERT(convert_date_key("2024-01-01", TimePeriod::WEEK) == "2024-W01",
                "Monday 2024-01-01 is in 2024-W01");
    TEST_ASSERT(convert_date_key("2024-01-07", TimePeriod::WEEK) == "2024-W01",
                "Sunday 2024-01-07 is still in 2024-W01");
    TEST_ASSERT(convert_date_key("2024-01-08", TimePeriod::WEEK) == "2024-W02",
                "Monday 2024-01-08 starts 2024-W02");
    TEST_ASSERT(convert_date_key("2024-12-30", TimePeriod::WEEK) == "2025-W01",
                "2024-12-30 belongs to ISO year 2025");
    TEST_ASSERT(convert_date_key("2021-01-03", TimePeriod::WEEK) == "2020-W53",
                "2021-01-03 belongs to 2020-W53");
    
    TEST_ASSERT(is_week_key("2020-W53"), "2020 has 53 ISO weeks");
    TEST_ASSERT(!is_week_key("2021-W53"), "2021 has 52 ISO weeks");
    TEST_ASSERT(!is_week_key("2021-W00"), "Week 0 is invalid");
    TEST_ASSERT(!is_week_key("2021-01"), "Month key is not a week key");
    
    auto start = period_start("2025-W01");
    TEST_ASSERT(start && to_day_key(*start) == "2024-12-30", "2025-W01 starts on 2024-12-30");
    return true;
}

bool test_conversions() {
    std::cout << "\n=== Test 3: Conversions ===" << std::endl;
    
    TEST_ASSERT(convert_date_key("2024-03-07", TimePeriod::MONTH) == "2024-03", "day -> month");
    TEST_ASSERT(convert_date_key("2024-03-07", TimePeriod::YEAR) == "2024", "day -> year");
    TEST_ASSERT(convert_date_key("2024-03", TimePeriod::YEAR) == "2024", "month -> year");
    TEST_ASSERT(convert_date_key("2020-W53", TimePeriod::YEAR) == "2020", "week -> ISO year");
    TEST_ASSERT(convert_date_key("2024-03", TimePeriod::MONTH) == "2024-03", "Same period is identity");
    TEST_ASSERT(!convert_date_key("2024-02-30", TimePeriod::MONTH).has_value(),
                "Malformed key yields nullopt");
    
    bool threw_finer = false;
    try {
        (void)convert_date_key("2024-03", TimePeriod::DAY);
    } catch (const std::runtime_error&) {
        threw_finer = true;
    }
    TEST_ASSERT(threw_finer, "Finer target throws");
    
    bool threw_anytime = false;
    try {
        (void)convert_date_key("2024-03-07", TimePeriod::ANYTIME);
    } catch (const std::runtime_error&) {
        threw_anytime = true;
    }
    TEST_ASSERT(threw_anytime, "ANYTIME target throws");
    
    bool threw_week_month = false;
    try {
        (void)convert_date_key("2024-W10", TimePeriod::MONTH);
    } catch (const std::runtime_error&) {
        threw_week_month = true;
    }
    TEST_ASSERT(threw_week_month, "Week -> month throws");
    
    TEST_ASSERT(key_period("2024") == TimePeriod::YEAR, "key_period detects year");
    TEST_ASSERT(key_period("2024-W10") == TimePeriod::WEEK, "key_period detects week");
    TEST_ASSERT(!key_period("2024/01/01").has_value(), "key_period rejects unknown formats");
    return true;
}

bool test_week_order() {
    std::cout << "\n=== Test 4: Week Order ===" << std::endl;
    
    // Every day of 2019-12-01 .. 2022-01-31 maps to a non-decreasing week key
    sys_days day_point{year{2019} / December / 1};
    const sys_days last{year{2022} / January / 31};
    std::string previous_week;
    std::string previous_month;
    for (; day_point <= last; day_point += days{1}) {
        const std::string key = to_day_key(year_month_day{day_point});
        const std::string week = *convert_date_key(key, TimePeriod::WEEK);
        const std::string month = *convert_date_key(key, TimePeriod::MONTH);
        if (week < previous_week || month < previous_month || !is_week_key(week)) {
            std::cerr << "❌ TEST FAILED: non-monotonic keys at " << key << std::endl;
            return false;
        }
        previous_week = week;
        previous_month = month;
    }
    std::cout << "✅ Week and month keys are monotonic over day keys" << std::endl;
    return true;
}

int main() {
    const std::vector<std::function<bool()>> tests = {
        test_day_keys,
        test_week_keys,
        test_conversions,
        test_week_order,
    };
    return timeroll::test::run_tests("Date Key Tests", tests);
}
