/**
 * Prefix Distribution Test
 * 
 * Validates the order-statistics multiset behind cumulative medians:
 * 1. Median matches a brute-force sorted median while growing
 * 2. Duplicates are kept and erased one at a time
 * 3. Rewinding (erase a suffix) restores the earlier median
 */

#include "test_common.hpp"
#include "timeroll/statistics/number_stats.hpp"
#include "timeroll/statistics/prefix_distribution.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>

using namespace timeroll;

bool test_empty_distribution() {
    std::cout << "\n=== Test 1: Empty Distribution ===" << std::endl;
    
    PrefixDistribution dist;
    TEST_ASSERT(dist.empty(), "New distribution is empty");
    TEST_ASSERT(dist.median() == 0.0, "Median of empty distribution is 0");
    
    bool threw = false;
    try {
        dist.nth(0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "nth() out of range throws");
    return true;
}

bool test_matches_brute_force() {
    std::cout << "\n=== Test 2: Matches Brute-Force Median ===" << std::endl;
    
    const std::vector<double> values = {7, -3, 2.5, 7, 0, 12, -8, 2.5, 4, 100, -0.5};
    PrefixDistribution dist;
    std::vector<double> seen;
    
    for (double value : values) {
        dist.insert(value);
        seen.push_back(value);
        std::vector<double> sorted = seen;
        std::sort(sorted.begin(), sorted.end());
        if (dist.median() != sorted_median(sorted)) {
            std::cerr << "❌ TEST FAILED: median mismatch after " << seen.size() << " values" << std::endl;
            return false;
        }
    }
    std::cout << "✅ Median matches after every insert" << std::endl;
    TEST_ASSERT(dist.size() == values.size(), "Size counts every insert");
    return true;
}

bool test_duplicates() {
    std::cout << "\n=== Test 3: Duplicates ===" << std::endl;
    
    PrefixDistribution dist;
    dist.insert(std::vector<double>{1.0, 1.0, 1.0, 5.0});
    TEST_ASSERT(dist.size() == 4, "Duplicates are kept");
    TEST_ASSERT(dist.median() == 1.0, "Median of {1,1,1,5} = 1");
    
    TEST_ASSERT(dist.erase(1.0), "Erase one duplicate");
    TEST_ASSERT(dist.size() == 3, "Only one copy removed");
    TEST_ASSERT(dist.median() == 1.0, "Median of {1,1,5} = 1");
    
    TEST_ASSERT(!dist.erase(2.0), "Erasing an absent value reports false");
    TEST_ASSERT(dist.erase(std::vector<double>{1.0, 1.0, 3.0}) == 1,
                "Range erase reports one missing value");
    TEST_ASSERT(dist.size() == 1 && dist.median() == 5.0, "Only 5 remains");
    return true;
}

bool test_rewind() {
    std::cout << "\n=== Test 4: Rewind ===" << std::endl;
    
    PrefixDistribution dist;
    dist.insert(std::vector<double>{5.0});
    dist.insert(std::vector<double>{3.0, -2.0});
    const double before = dist.median();
    
    dist.insert(std::vector<double>{40.0, 41.0, 42.0});
    TEST_ASSERT(dist.median() != before, "Median moves after appending");
    
    TEST_ASSERT(dist.erase(std::vector<double>{40.0, 41.0, 42.0}) == 0, "Suffix erased");
    TEST_ASSERT(dist.median() == before, "Median restored after rewind");
    TEST_ASSERT(dist.median() == 3.0, "Median of {5,3,-2} = 3");
    
    dist.clear();
    TEST_ASSERT(dist.empty(), "clear() empties the distribution");
    return true;
}

int main() {
    const std::vector<std::function<bool()>> tests = {
        test_empty_distribution,
        test_matches_brute_force,
        test_duplicates,
        test_rewind,
    };
    return timeroll::test::run_tests("Prefix Distribution Tests", tests);
}
