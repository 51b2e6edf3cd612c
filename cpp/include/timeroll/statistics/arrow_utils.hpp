/**
 * Arrow Utilities - zero-copy bridge between std::vector<double> and Arrow compute
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace timeroll {
namespace arrow_utils {

#ifdef HAVE_ARROW

/**
 * Wrap C++ vector as Arrow array (zero-copy!)
 * 
 * CRITICAL: The input vector MUST stay alive while Arrow array is used!
 * 
 * @param data Input vector (will be referenced, not copied)
 * @return Arrow array that references the same memory
 */
inline std::shared_ptr<arrow::DoubleArray> wrap_vector_as_arrow(
    const std::vector<double>& data
) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data.data()),
        data.size() * sizeof(double)
    );
    
    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        static_cast<int64_t>(data.size()),
        {nullptr, buffer},
        0
    );
    
    return std::make_shared<arrow::DoubleArray>(array_data);
}

/**
 * Sum of a vector through the Arrow "sum" kernel
 * 
 * @param data Input values
 * @param[out] sum Result
 * @return false if the kernel failed (caller falls back to scalar)
 */
inline bool sum(const std::vector<double>& data, double& sum) {
    auto array = wrap_vector_as_arrow(data);
    auto result = arrow::compute::CallFunction("sum", {array});
    if (!result.ok()) {
        return false;
    }
    auto scalar = result.ValueOrDie().scalar_as<arrow::DoubleScalar>();
    if (!scalar.is_valid) {
        return false;
    }
    sum = scalar.value;
    return true;
}

/**
 * Check if Arrow is available at runtime
 */
inline bool is_arrow_available() {
    return true;
}

#else  // HAVE_ARROW not defined

inline bool is_arrow_available() {
    return false;
}

#endif  // HAVE_ARROW

}  // namespace arrow_utils
}  // namespace timeroll
