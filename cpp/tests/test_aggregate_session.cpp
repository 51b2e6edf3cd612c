/**
 * Aggregate Session Test
 * 
 * Validates the stateful wrapper:
 * 1. Updates thread the cache so unchanged periods keep their objects
 * 2. reset() forces a full rebuild
 */

#include "test_common.hpp"
#include "timeroll/aggregate/aggregate_session.hpp"
#include <functional>

using namespace timeroll;

namespace {

EngineOptions quiet_options() {
    EngineOptions options;
    options.log_warnings = false;
    return options;
}

} // namespace

bool test_update_threads_cache() {
    std::cout << "\n=== Test 1: Update Threads Cache ===" << std::endl;
    
    AggregateSession session(quiet_options());
    std::vector<DayRecordPtr> log = {
        make_day_record("2024-01-01", {5.0}),
        make_day_record("2024-01-08", {2.0}),
    };
    
    const AggregatePtr first_week = session.update(log).weeks[0];
    TEST_ASSERT(session.update_count() == 1, "One update");
    TEST_ASSERT(session.last_stats().days_recomputed == 2, "First update builds both days");
    
    log.push_back(make_day_record("2024-01-09", {4.0}));
    const AllPeriodsAggregate& current = session.update(log);
    
    TEST_ASSERT(&current == &session.current(), "update() returns current()");
    TEST_ASSERT(current.weeks[0] == first_week, "Untouched week keeps its object");
    TEST_ASSERT(current.weeks[1]->stats.total == 6.0, "Second week includes the new day");
    TEST_ASSERT(session.last_stats().days_reused == 2, "Both earlier days reused");
    TEST_ASSERT(session.last_stats().weeks_reused == 1, "First week reused");
    return true;
}

bool test_reset() {
    std::cout << "\n=== Test 2: Reset ===" << std::endl;
    
    AggregateSession session(quiet_options());
    std::vector<DayRecordPtr> log = {make_day_record("2024-05-01", {1.0, 2.0})};
    const AggregatePtr before = session.update(log).days[0];
    
    session.reset();
    TEST_ASSERT(session.update_count() == 0, "Counter cleared");
    TEST_ASSERT(session.current().days.empty() && !session.current().alltime, "Current cleared");
    
    const AllPeriodsAggregate& after = session.update(log);
    TEST_ASSERT(after.days[0] != before, "Rebuilt after reset");
    TEST_ASSERT(after.days[0]->same_values(*before), "Same values after reset");
    TEST_ASSERT(session.last_stats().days_reused == 0, "Nothing reused after reset");
    return true;
}

int main() {
    const std::vector<std::function<bool()>> tests = {
        test_update_threads_cache,
        test_reset,
    };
    return timeroll::test::run_tests("Aggregate Session Tests", tests);
}
