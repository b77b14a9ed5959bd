#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/core/macros.hpp"
#include "dex/core/simd.hpp"
#include "dex/core/algo.hpp"
#include "dex/threading/parallel_for.hpp"

#include <cmath>
#include <array>

// =============================================================================
// Weighted least squares and LOESS kernels
// =============================================================================

namespace dex::math::regression {

namespace config {
    constexpr Real SINGULAR_TOL = Real(1e-12);
}

// =============================================================================
// Internal Helpers - Tiny Linear Algebra
// =============================================================================

namespace detail {

// Solve symmetric 2x2 system [a00 a01; a01 a11] x = b
// Returns false when the system is numerically singular
DEX_FORCE_INLINE bool solve_sym_2x2(Real a00, Real a01, Real a11, const Real* b, Real* x) {
    Real det = a00 * a11 - a01 * a01;
    Real scale = std::abs(a00 * a11) + a01 * a01;
    if (!(std::abs(det) > config::SINGULAR_TOL * scale) || !std::isfinite(det)) {
        return false;
    }
    Real inv_det = Real(1) / det;
    x[0] = inv_det * (a11 * b[0] - a01 * b[1]);
    x[1] = inv_det * (a00 * b[1] - a01 * b[0]);
    return true;
}

// Solve symmetric 3x3 system via analytical inverse
// A_sym = {a00, a01, a02, a11, a12, a22}
DEX_FORCE_INLINE bool solve_sym_3x3(const Real* A_sym, const Real* b, Real* x) {
    Real a00 = A_sym[0], a01 = A_sym[1], a02 = A_sym[2];
    Real a11 = A_sym[3], a12 = A_sym[4];
    Real a22 = A_sym[5];

    Real det = a00 * (a11 * a22 - a12 * a12) -
               a01 * (a01 * a22 - a12 * a02) +
               a02 * (a01 * a12 - a11 * a02);

    Real scale = std::abs(a00 * a11 * a22) + Real(1e-300);
    if (!(std::abs(det) > config::SINGULAR_TOL * scale) || !std::isfinite(det)) {
        return false;
    }
    auto inv_det = Real(1.0) / det;

    x[0] = inv_det * (
        (a11 * a22 - a12 * a12) * b[0] +
        (a02 * a12 - a01 * a22) * b[1] +
        (a01 * a12 - a02 * a11) * b[2]
    );

    x[1] = inv_det * (
        (a12 * a02 - a01 * a22) * b[0] +
        (a00 * a22 - a02 * a02) * b[1] +
        (a01 * a02 - a00 * a12) * b[2]
    );

    x[2] = inv_det * (
        (a01 * a12 - a02 * a11) * b[0] +
        (a02 * a01 - a00 * a12) * b[1] +
        (a00 * a11 - a01 * a01) * b[2]
    );
    return true;
}

DEX_FORCE_INLINE Real tricube_weight(Real dist) {
    Real a = std::abs(dist);
    if (a >= Real(1.0)) return Real(0.0);
    Real tmp = Real(1.0) - a * a * a;
    return tmp * tmp * tmp;
}

} // namespace detail

// =============================================================================
// Weighted Straight-Line Fit
// =============================================================================

struct LineFit {
    Real intercept = Real(0);
    Real slope = Real(0);
    bool ok = false;
};

// Minimizes sum w_i (y_i - b0 - b1 x_i)^2
inline LineFit wls_line(
    Array<const Real> x,
    Array<const Real> y,
    Array<const Real> w
) {
    DEX_CHECK_DIM(x.len == y.len && x.len == w.len, "wls_line: x/y/w size mismatch");

    Real s0 = 0, s1 = 0, s2 = 0, sy0 = 0, sy1 = 0;
    for (Size i = 0; i < x.len; ++i) {
        const Real wi = w.ptr[i];
        const Real xi = x.ptr[i];
        s0 += wi;
        s1 += wi * xi;
        s2 += wi * xi * xi;
        sy0 += wi * y.ptr[i];
        sy1 += wi * xi * y.ptr[i];
    }

    LineFit fit;
    std::array<Real, 2> b{sy0, sy1};
    std::array<Real, 2> coef{};
    fit.ok = detail::solve_sym_2x2(s0, s1, s2, b.data(), coef.data());
    fit.intercept = coef[0];
    fit.slope = coef[1];
    return fit;
}

// =============================================================================
// LOESS (Locally Weighted Scatterplot Smoothing)
// =============================================================================

namespace detail {

// Weighted normal equations of a local quadratic with tricube weights
DEX_FORCE_INLINE void accumulate_loess_window_simd(
    Array<const Real> x,
    Array<const Real> y,
    Real target_x,
    Real max_dist,
    Real* sums
) {
    namespace s = dex::simd;
    auto d = s::SimdTagFor<Real>();
    const size_t N = x.len;
    const size_t lanes = s::Lanes(d);

    auto v_s0 = s::Zero(d);
    auto v_s1 = s::Zero(d);
    auto v_s2 = s::Zero(d);
    auto v_s3 = s::Zero(d);
    auto v_s4 = s::Zero(d);

    auto v_sy0 = s::Zero(d);
    auto v_sy1 = s::Zero(d);
    auto v_sy2 = s::Zero(d);

    // Centre on the target to keep the 3x3 system well conditioned
    const auto v_target = s::Set(d, target_x);
    const Real inv_max = Real(1.0) / max_dist;
    const auto v_inv_max = s::Set(d, inv_max);
    const auto v_one = s::Set(d, Real(1.0));

    size_t i = 0;

    for (; i + lanes <= N; i += lanes) {
        auto vx = s::Sub(s::LoadU(d, x.ptr + i), v_target);
        auto vy = s::LoadU(d, y.ptr + i);

        auto v_norm = s::Mul(s::Abs(vx), v_inv_max);
        auto mask = s::Lt(v_norm, v_one);

        auto v_norm3 = s::Mul(v_norm, s::Mul(v_norm, v_norm));
        auto v_t = s::Sub(v_one, v_norm3);
        auto v_t3 = s::Mul(v_t, s::Mul(v_t, v_t));
        auto vw = s::IfThenElseZero(mask, v_t3);

        auto vx2 = s::Mul(vx, vx);
        auto vx3 = s::Mul(vx2, vx);
        auto vx4 = s::Mul(vx2, vx2);

        v_s0 = s::Add(v_s0, vw);
        v_s1 = s::MulAdd(vx, vw, v_s1);
        v_s2 = s::MulAdd(vx2, vw, v_s2);
        v_s3 = s::MulAdd(vx3, vw, v_s3);
        v_s4 = s::MulAdd(vx4, vw, v_s4);

        auto v_yw = s::Mul(vy, vw);
        v_sy0 = s::Add(v_sy0, v_yw);
        v_sy1 = s::MulAdd(vx, v_yw, v_sy1);
        v_sy2 = s::MulAdd(vx2, v_yw, v_sy2);
    }

    sums[0] = s::GetLane(s::SumOfLanes(d, v_s0));
    sums[1] = s::GetLane(s::SumOfLanes(d, v_s1));
    sums[2] = s::GetLane(s::SumOfLanes(d, v_s2));
    sums[3] = s::GetLane(s::SumOfLanes(d, v_s3));
    sums[4] = s::GetLane(s::SumOfLanes(d, v_s4));
    sums[5] = s::GetLane(s::SumOfLanes(d, v_sy0));
    sums[6] = s::GetLane(s::SumOfLanes(d, v_sy1));
    sums[7] = s::GetLane(s::SumOfLanes(d, v_sy2));

    for (; i < N; ++i) {
        Real xi = x.ptr[i] - target_x;
        Real w = tricube_weight(xi * inv_max);
        if (w == Real(0)) continue;

        Real xi2 = xi * xi;
        sums[0] += w;
        sums[1] += xi * w;
        sums[2] += xi2 * w;
        sums[3] += xi2 * xi * w;
        sums[4] += xi2 * xi2 * w;

        Real yw = y.ptr[i] * w;
        sums[5] += yw;
        sums[6] += xi * yw;
        sums[7] += xi2 * yw;
    }
}

} // namespace detail

// Local quadratic LOESS evaluated at every x.
// Precondition: x sorted ascending. A window whose quadratic system is
// singular falls back to a local linear, then a weighted mean.
inline void loess(
    Array<const Real> x,
    Array<const Real> y,
    Array<Real> fitted,
    double span = 0.3
) {
    DEX_CHECK_DIM(x.len == y.len, "LOESS: x/y size mismatch");
    DEX_CHECK_DIM(fitted.len == x.len, "LOESS: fitted buffer size mismatch");
    DEX_CHECK_ARG(span > 0.0 && span <= 1.0, "LOESS: span must lie in (0, 1]");

    const Size n = x.len;
    if (n == 0) return;

    Size k = static_cast<Size>(std::ceil(span * static_cast<double>(n)));
    k = algo::clamp<Size>(k, algo::min2<Size>(3, n), n);

    dex::threading::parallel_for(0, n, [&](size_t i) {
        const Real target_x = x.ptr[i];

        // k nearest neighbours in a sorted array form a contiguous window
        Size left = (i > k / 2) ? (i - k / 2) : 0;
        if (left + k > n) left = n - k;
        while (left > 0 && target_x - x.ptr[left - 1] < x.ptr[left + k - 1] - target_x) {
            --left;
        }
        while (left + k < n && x.ptr[left + k] - target_x < target_x - x.ptr[left]) {
            ++left;
        }
        const Size right = left + k - 1;

        Real max_dist = algo::max2(target_x - x.ptr[left], x.ptr[right] - target_x);
        if (max_dist < Real(1e-9)) max_dist = Real(1e-9);
        max_dist *= Real(1.0000001);

        Array<const Real> x_win(x.ptr + left, k);
        Array<const Real> y_win(y.ptr + left, k);

        std::array<Real, 8> sums{};
        detail::accumulate_loess_window_simd(x_win, y_win, target_x, max_dist, sums.data());

        // Coordinates are centred on target_x, so the fit at the target is coef[0]
        std::array<Real, 6> A_sym{sums[0], sums[1], sums[2], sums[2], sums[3], sums[4]};
        std::array<Real, 3> B{sums[5], sums[6], sums[7]};
        std::array<Real, 3> X{};
        if (detail::solve_sym_3x3(A_sym.data(), B.data(), X.data())) {
            fitted.ptr[i] = X[0];
            return;
        }

        std::array<Real, 2> X2{};
        if (detail::solve_sym_2x2(sums[0], sums[1], sums[2], B.data(), X2.data())) {
            fitted.ptr[i] = X2[0];
            return;
        }

        fitted.ptr[i] = (sums[0] > Real(0)) ? sums[5] / sums[0]
                                            : std::numeric_limits<Real>::quiet_NaN();
    });
}

// Piecewise-linear interpolation of (x_sorted, y) at q; constant beyond the ends
inline Real interpolate_sorted(Array<const Real> x_sorted, Array<const Real> y, Real q) {
    const Size n = x_sorted.len;
    if (n == 0) return std::numeric_limits<Real>::quiet_NaN();
    if (q <= x_sorted.ptr[0]) return y.ptr[0];
    if (q >= x_sorted.ptr[n - 1]) return y.ptr[n - 1];

    const Real* it = algo::lower_bound(x_sorted.ptr, x_sorted.ptr + n, q);
    const Size hi = static_cast<Size>(it - x_sorted.ptr);
    const Size lo = hi - 1;
    const Real dx = x_sorted.ptr[hi] - x_sorted.ptr[lo];
    if (dx <= Real(0)) return y.ptr[hi];
    const Real t = (q - x_sorted.ptr[lo]) / dx;
    return y.ptr[lo] + t * (y.ptr[hi] - y.ptr[lo]);
}

} // namespace dex::math::regression
