#pragma once

/**
 * @file prefix_distribution.hpp
 * @brief Order-statistics multiset of a growing history prefix
 * 
 * Cumulative medians are not mergeable from prior cumulative stats, so
 * the engine keeps every number of the history prefix in an
 * order-statistics tree. Insert, erase and median are O(log n), which
 * lets the engine rewind the prefix to a changed day and replay only
 * the changed suffix.
 */

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include <ext/pb_ds/assoc_container.hpp>
#include <ext/pb_ds/tree_policy.hpp>

namespace timeroll {

class PrefixDistribution {
public:
    PrefixDistribution() = default;
    
    /// Add one value
    void insert(double value);
    
    /// Add every value of a sequence
    void insert(const std::vector<double>& values);
    
    /**
     * @brief Remove one occurrence of a value
     * @return false if the value was not present
     */
    bool erase(double value);
    
    /**
     * @brief Remove one occurrence of every value of a sequence
     * @return Number of values that were not present
     */
    size_t erase(const std::vector<double>& values);
    
    /// Exact median of all values (0.0 when empty)
    double median() const;
    
    /// Value at sorted position n (0-based); n must be < size()
    double nth(size_t n) const;
    
    /// Number of values held
    size_t size() const { return tree_.size(); }
    
    bool empty() const { return tree_.empty(); }
    
    void clear();
    
private:
    // The sequence number makes equal values distinct keys
    using Entry = std::pair<double, uint64_t>;
    using Tree = __gnu_pbds::tree<
        Entry,
        __gnu_pbds::null_type,
        std::less<Entry>,
        __gnu_pbds::rb_tree_tag,
        __gnu_pbds::tree_order_statistics_node_update>;
    
    Tree tree_;
    uint64_t next_sequence_ = 1;
};

} // namespace timeroll
