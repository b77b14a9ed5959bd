#pragma once

// =============================================================================
// DEX - Numerical Precision Comparison Utilities
// =============================================================================
//
// Robust numerical comparison with configurable tolerances.
//
// =============================================================================

#include "dex/core/type.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace dex::test::precision {

// =============================================================================
// Tolerance Presets
// =============================================================================

struct Tolerance {
    double rtol;  // Relative tolerance
    double atol;  // Absolute tolerance

    static constexpr Tolerance strict() { return {1e-12, 1e-15}; }
    static constexpr Tolerance normal() { return {1e-9, 1e-12}; }
    static constexpr Tolerance relaxed() { return {1e-6, 1e-9}; }
    static constexpr Tolerance loose() { return {1e-3, 1e-6}; }

    // Iterative fits compared against an independent solver
    static constexpr Tolerance iterative() { return {1e-4, 1e-6}; }
    static constexpr Tolerance statistical() { return {1e-2, 1e-4}; }
};

// =============================================================================
// Scalar Comparison
// =============================================================================

inline bool approx_equal(
    double a,
    double b,
    const Tolerance& tol = Tolerance::normal()
) {
    if (std::isnan(a) || std::isnan(b)) {
        return std::isnan(a) && std::isnan(b);
    }
    if (std::isinf(a) || std::isinf(b)) {
        return a == b;
    }
    const double diff = std::abs(a - b);
    const double max_val = std::max(std::abs(a), std::abs(b));
    return diff <= tol.atol + tol.rtol * max_val;
}

// NA on both sides compares equal
inline bool approx_equal(
    const std::optional<Real>& a,
    const std::optional<Real>& b,
    const Tolerance& tol = Tolerance::normal()
) {
    if (!a.has_value() || !b.has_value()) {
        return a.has_value() == b.has_value();
    }
    return approx_equal(static_cast<double>(*a), static_cast<double>(*b), tol);
}

// =============================================================================
// Vector Comparison
// =============================================================================

template<typename VecA, typename VecB>
inline bool vectors_equal(
    const VecA& a,
    const VecB& b,
    const Tolerance& tol = Tolerance::normal()
) {
    if (static_cast<std::size_t>(a.size()) != static_cast<std::size_t>(b.size())) {
        return false;
    }

    double max_val = 0;
    double max_diff = 0;
    for (std::size_t i = 0; i < static_cast<std::size_t>(a.size()); ++i) {
        const double x = static_cast<double>(a[i]);
        const double y = static_cast<double>(b[i]);
        max_val = std::max(max_val, std::max(std::abs(x), std::abs(y)));
        max_diff = std::max(max_diff, std::abs(x - y));
    }
    return max_diff <= tol.atol + tol.rtol * max_val;
}

template<typename VecA, typename VecB>
inline double relative_error(const VecA& a, const VecB& b) {
    if (static_cast<std::size_t>(a.size()) != static_cast<std::size_t>(b.size())) {
        return std::numeric_limits<double>::infinity();
    }

    double max_val = 0;
    double max_diff = 0;
    for (std::size_t i = 0; i < static_cast<std::size_t>(a.size()); ++i) {
        const double x = static_cast<double>(a[i]);
        const double y = static_cast<double>(b[i]);
        max_val = std::max(max_val, std::max(std::abs(x), std::abs(y)));
        max_diff = std::max(max_diff, std::abs(x - y));
    }
    if (max_val < 1e-15) {
        return max_diff;
    }
    return max_diff / max_val;
}

// =============================================================================
// Matrix Comparison
// =============================================================================

template<typename MatA, typename MatB>
inline bool matrices_equal(
    const Eigen::MatrixBase<MatA>& A,
    const Eigen::MatrixBase<MatB>& B,
    const Tolerance& tol = Tolerance::normal()
) {
    if (A.rows() != B.rows() || A.cols() != B.cols()) {
        return false;
    }
    const double max_val = std::max(A.cwiseAbs().maxCoeff(), B.cwiseAbs().maxCoeff());
    const double max_diff = (A - B).cwiseAbs().maxCoeff();
    return max_diff <= tol.atol + tol.rtol * max_val;
}

// =============================================================================
// Ordering Checks
// =============================================================================

// Checks v[i] <= v[i+1] over a container
template<typename Container>
inline bool is_non_decreasing(const Container& v) {
    for (std::size_t i = 1; i < v.size(); ++i) {
        if (v[i] < v[i - 1]) return false;
    }
    return true;
}

} // namespace dex::test::precision
