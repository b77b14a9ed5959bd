#pragma once

#include "dex/core/type.hpp"
#include "dex/core/macros.hpp"
#include "dex/core/algo.hpp"

#include <cmath>
#include <limits>
#include <vector>

// =============================================================================
// Scalar statistical helpers
// Full precision via std::erfc (~15 significant digits)
// =============================================================================

namespace dex::math {

// =============================================================================
// Normal Distribution
// =============================================================================

DEX_FORCE_INLINE double normal_cdf(double z) {
    return 0.5 * std::erfc(-z * 0.7071067811865475);
}

DEX_FORCE_INLINE double normal_sf(double z) {
    return 0.5 * std::erfc(z * 0.7071067811865475);
}

// P(|Z| >= |z|)
DEX_FORCE_INLINE double normal_two_sided_p(double z) {
    return std::erfc(std::abs(z) * 0.7071067811865475);
}

// =============================================================================
// Polygamma
// =============================================================================

// psi_1(x) for x > 0: recurrence up to x >= 6, then the asymptotic series
inline double trigamma(double x) {
    if (DEX_UNLIKELY(!(x > 0.0))) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double result = 0.0;
    while (x < 6.0) {
        result += 1.0 / (x * x);
        x += 1.0;
    }

    const double inv = 1.0 / x;
    const double inv2 = inv * inv;
    result += inv + 0.5 * inv2 +
              inv * inv2 * (1.0 / 6.0 - inv2 * (1.0 / 30.0 - inv2 * (1.0 / 42.0 - inv2 * (1.0 / 30.0))));
    return result;
}

// =============================================================================
// Robust Location / Scale
// =============================================================================

// Median of values; reorders the buffer. Empty input yields NaN.
template <typename T>
inline T median_inplace(Array<T> values) {
    const Size n = values.len;
    if (n == 0) {
        return std::numeric_limits<T>::quiet_NaN();
    }

    T* first = values.ptr;
    T* last = values.ptr + n;
    T* mid = first + n / 2;
    algo::nth_element(first, mid, last);
    T upper = *mid;

    if (n % 2 == 1) {
        return upper;
    }

    // Lower middle is the maximum of the left partition
    T lower = *first;
    for (T* p = first + 1; p < mid; ++p) {
        lower = algo::max2(lower, *p);
    }
    return (lower + upper) / T(2);
}

// Median absolute deviation scaled to the normal standard deviation (x 1.4826)
template <typename T>
inline T mad(Array<const T> values) {
    if (values.len == 0) {
        return std::numeric_limits<T>::quiet_NaN();
    }

    std::vector<T> buffer(values.begin(), values.end());
    const T center = median_inplace(as_array(buffer));

    for (auto& v : buffer) {
        v = std::abs(v - center);
    }
    return T(1.4826) * median_inplace(as_array(buffer));
}

} // namespace dex::math
