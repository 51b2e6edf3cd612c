/**
 * Extremes Test
 * 
 * Validates calculate_extremes:
 * 1. Empty list yields no extremes
 * 2. A single child yields highest == lowest
 * 3. Every field is bounded by the children
 */

#include "test_common.hpp"
#include "timeroll/statistics/extremes.hpp"
#include <functional>

using namespace timeroll;

bool test_no_children() {
    std::cout << "\n=== Test 1: No Children ===" << std::endl;
    
    TEST_ASSERT(!calculate_extremes({}).has_value(), "Empty list has no extremes");
    return true;
}

bool test_single_child() {
    std::cout << "\n=== Test 2: Single Child ===" << std::endl;
    
    NumberStats only = compute_number_stats({2.0, 6.0});
    auto extremes = calculate_extremes({&only});
    
    TEST_ASSERT(extremes.has_value(), "Single child has extremes");
    for (StatField field : ALL_STAT_FIELDS) {
        TEST_ASSERT(highest_for(*extremes, field) == lowest_for(*extremes, field),
                    std::string("highest == lowest for ") + stat_field_name(field));
    }
    TEST_ASSERT(extremes->highest_total == 8.0, "highest_total = 8");
    return true;
}

bool test_bounds() {
    std::cout << "\n=== Test 3: Bounds ===" << std::endl;
    
    NumberStats a = compute_number_stats({5.0});
    NumberStats b = compute_number_stats({3.0, -2.0});
    NumberStats empty;
    std::vector<const NumberStats*> children = {&a, &b, &empty};
    
    auto extremes = calculate_extremes(children);
    TEST_ASSERT(extremes.has_value(), "Extremes present");
    TEST_ASSERT(extremes->highest_total == 5.0, "highest_total = 5");
    TEST_ASSERT(extremes->lowest_total == 0.0, "Empty child contributes total 0");
    TEST_ASSERT(extremes->highest_count == 2.0, "highest_count = 2");
    TEST_ASSERT(extremes->lowest_min == -2.0, "lowest_min = -2");
    TEST_ASSERT(extremes->highest_first == 5.0 && extremes->lowest_last == -2.0,
                "highest_first = 5, lowest_last = -2");
    TEST_ASSERT(extremes->highest_range == 5.0 && extremes->lowest_change == -5.0,
                "highest_range = 5, lowest_change = -5");
    
    for (StatField field : ALL_STAT_FIELDS) {
        for (const NumberStats* child : children) {
            const double value = stat_value(*child, field);
            TEST_ASSERT(lowest_for(*extremes, field) <= value && value <= highest_for(*extremes, field),
                        std::string("Child within bounds for ") + stat_field_name(field));
        }
    }
    return true;
}

bool test_equality() {
    std::cout << "\n=== Test 4: Equality ===" << std::endl;
    
    NumberStats a = compute_number_stats({1.0, 2.0});
    NumberStats b = compute_number_stats({7.0});
    auto first = calculate_extremes({&a, &b});
    auto second = calculate_extremes({&b, &a});
    auto other = calculate_extremes({&a});
    
    TEST_ASSERT(extremes_equal(*first, *second), "Child order does not matter");
    TEST_ASSERT(!extremes_equal(*first, *other), "Different children differ");
    return true;
}

int main() {
    const std::vector<std::function<bool()>> tests = {
        test_no_children,
        test_single_child,
        test_bounds,
        test_equality,
    };
    return timeroll::test::run_tests("Extremes Tests", tests);
}
