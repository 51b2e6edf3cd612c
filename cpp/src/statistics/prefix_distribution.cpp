#include "timeroll/statistics/prefix_distribution.hpp"
#include <stdexcept>

namespace timeroll {

void PrefixDistribution::insert(double value) {
    tree_.insert(Entry(value, next_sequence_++));
}

void PrefixDistribution::insert(const std::vector<double>& values) {
    for (double value : values) {
        insert(value);
    }
}

bool PrefixDistribution::erase(double value) {
    // Sequence numbers start at 1, so (value, 0) sorts before every occurrence
    auto it = tree_.lower_bound(Entry(value, 0));
    if (it == tree_.end() || it->first != value) {
        return false;
    }
    tree_.erase(it);
    return true;
}

size_t PrefixDistribution::erase(const std::vector<double>& values) {
    size_t missing = 0;
    for (double value : values) {
        if (!erase(value)) {
            ++missing;
        }
    }
    return missing;
}

double PrefixDistribution::nth(size_t n) const {
    if (n >= tree_.size()) {
        throw std::runtime_error("PrefixDistribution::nth out of range");
    }
    return tree_.find_by_order(n)->first;
}

double PrefixDistribution::median() const {
    const size_t n = tree_.size();
    if (n == 0) {
        return 0.0;
    }
    if (n % 2 == 0) {
        return (nth(n / 2 - 1) + nth(n / 2)) / 2.0;
    }
    return nth(n / 2);
}

void PrefixDistribution::clear() {
    tree_.clear();
    next_sequence_ = 1;
}

} // namespace timeroll
