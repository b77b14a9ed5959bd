#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/core/algo.hpp"
#include "dex/core/sort.hpp"
#include "dex/core/vectorize.hpp"
#include "dex/math/stats.hpp"
#include "dex/math/regression.hpp"
#include "dex/data/count_matrix.hpp"
#include "dex/data/design.hpp"
#include "dex/data/results.hpp"
#include "dex/threading/parallel_for.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

// =============================================================================
// FILE: dex/kernel/dispersion.hpp
// BRIEF: Negative-binomial dispersion with empirical-Bayes shrinkage
//
// Three phases with a barrier between each:
//   1. raw    (parallel over genes)  moment estimate under the sex design
//   2. trend  (serial)               alpha(mean) over all raw estimates
//   3. shrink (parallel over genes)  log-space posterior toward the trend
//
// Variance model: Var(Y) = mu + alpha * mu^2
// =============================================================================

namespace dex::kernel::dispersion {

namespace config {
    constexpr Real MIN_DISP = Real(1e-8);
    constexpr Real MIN_MAX_DISP = Real(10);

    // Genes with raw < TREND_MIN_FACTOR * min_disp sit on the floor and
    // carry no information about the trend
    constexpr Real TREND_MIN_FACTOR = Real(100);
    constexpr Size MIN_TREND_GENES = 3;

    // Parametric trend (gamma-family GLM, identity link)
    constexpr Real RESIDUAL_LOW = Real(1e-4);
    constexpr Real RESIDUAL_HIGH = Real(15);
    constexpr Real START_A0 = Real(0.1);
    constexpr Real START_A1 = Real(1);
    constexpr Size MAX_OUTER_ITER = 10;
    constexpr Real OUTER_TOL = Real(1e-6);
    constexpr Size GAMMA_MAX_ITER = 25;
    constexpr Real GAMMA_TOL = Real(1e-8);

    // Local trend
    constexpr double LOESS_SPAN = 0.3;

    // Shrinkage
    constexpr Real PRIOR_VARIANCE_FLOOR = Real(0.25);
    constexpr Real OUTLIER_SD = Real(2);
}

struct DispersionOptions {
    TrendType trend = TrendType::Parametric;
    Real min_disp = config::MIN_DISP;
    Real outlier_sd = config::OUTLIER_SD;
    Real prior_variance_floor = config::PRIOR_VARIANCE_FLOOR;
    double loess_span = config::LOESS_SPAN;
    Count min_total_count = 0;     // 0 disables the low-count filter
};

// Upper clamp: max(10, n_samples)
[[nodiscard]] inline Real max_dispersion(Size n_samples) noexcept {
    return algo::max2(config::MIN_MAX_DISP, static_cast<Real>(n_samples));
}

// =============================================================================
// Trend Evaluation
// =============================================================================

[[nodiscard]] inline Real evaluate_trend(const DispersionTrend& trend, Real mean) {
    switch (trend.type) {
        case TrendType::Parametric:
            return trend.a0 + trend.a1 / mean;
        case TrendType::Local:
            return std::exp(dex::math::regression::interpolate_sorted(
                as_array(trend.log_mean_grid), as_array(trend.log_disp_fit), std::log(mean)));
        case TrendType::Constant:
            return trend.constant;
    }
    return trend.constant;
}

// =============================================================================
// Phase 1: Raw Estimates
// =============================================================================

namespace detail {

// Classifies a gene before estimation; None means it is estimable
DEX_FORCE_INLINE ExclusionReason classify_gene(Array<const Count> row, Count min_total_count) {
    std::uint64_t total = 0;
    bool constant = true;
    for (Size s = 0; s < row.len; ++s) {
        total += row.ptr[s];
        constant = constant && (row.ptr[s] == row.ptr[0]);
    }
    if (total == 0) return ExclusionReason::AllZero;
    if (constant) return ExclusionReason::ZeroVariance;
    if (total < min_total_count) return ExclusionReason::LowCount;
    return ExclusionReason::None;
}

// mean(1 / f_s)
inline Real mean_inverse(Array<const Real> size_factors) {
    std::vector<Real> inv(size_factors.len);
    for (Size s = 0; s < size_factors.len; ++s) {
        inv[s] = Real(1) / size_factors.ptr[s];
    }
    return vectorize::sum(as_array(std::as_const(inv))) / static_cast<Real>(size_factors.len);
}

// Rough moment estimate:
//   alpha = sum_s ((q_s - mu_s)^2 - mu_s * xim) / mu_s^2 / (n - 2)
// with q normalized counts, mu_s the sample's group mean floored at 1,
// xim = mean(1 / size factor)
inline Real raw_moment(
    Array<const Count> row,
    Array<const Real> size_factors,
    Array<const std::uint8_t> is_male,
    Real xim,
    Size df,
    Real& base_mean
) {
    const Size n = row.len;
    Real sum_all = 0, sum_m = 0, sum_f = 0;
    Size n_m = 0;
    for (Size s = 0; s < n; ++s) {
        const Real q = static_cast<Real>(row.ptr[s]) / size_factors.ptr[s];
        sum_all += q;
        if (is_male.ptr[s]) {
            sum_m += q;
            ++n_m;
        } else {
            sum_f += q;
        }
    }
    const Size n_f = n - n_m;
    base_mean = sum_all / static_cast<Real>(n);

    const Real mu_m = algo::max2(Real(1), n_m ? sum_m / static_cast<Real>(n_m) : Real(0));
    const Real mu_f = algo::max2(Real(1), n_f ? sum_f / static_cast<Real>(n_f) : Real(0));

    Real acc = 0;
    for (Size s = 0; s < n; ++s) {
        const Real q = static_cast<Real>(row.ptr[s]) / size_factors.ptr[s];
        const Real mu = is_male.ptr[s] ? mu_m : mu_f;
        const Real d = q - mu;
        acc += (d * d - mu * xim) / (mu * mu);
    }
    return acc / static_cast<Real>(df);
}

} // namespace detail

// Fills base_mean, raw and excluded of est (sized by the caller).
// Throws DomainError when the design leaves no residual degrees of freedom.
inline void estimate_raw(
    const CountMatrix& matrix,
    Array<const Real> size_factors,
    const SexDesign& design,
    const DispersionOptions& options,
    DispersionEstimate& est
) {
    const Size n_genes = matrix.gene_count();
    const Size n_samples = matrix.sample_count();
    DEX_CHECK_DIM(size_factors.len == n_samples, "dispersion: size factor count mismatch");
    DEX_CHECK_DIM(design.sample_count() == n_samples, "dispersion: design row count mismatch");

    const Size df = design.residual_df();
    if (DEX_UNLIKELY(df == 0)) {
        throw DomainError("dispersion: need more than " + std::to_string(SexDesign::N_COEF) +
                          " samples, got " + std::to_string(n_samples));
    }

    const Real xim = detail::mean_inverse(size_factors);

    const Real max_disp = max_dispersion(n_samples);
    const Real nan = std::numeric_limits<Real>::quiet_NaN();
    auto is_male = design.indicator();

    dex::threading::parallel_for(0, n_genes, [&](size_t g) {
        auto row = matrix.row(g);
        Real mean = 0;
        const ExclusionReason reason = detail::classify_gene(row, options.min_total_count);
        est.excluded[g] = reason;

        if (reason == ExclusionReason::AllZero) {
            est.base_mean[g] = Real(0);
            est.raw[g] = nan;
            return;
        }

        const Real alpha = detail::raw_moment(row, size_factors, is_male, xim, df, mean);
        est.base_mean[g] = mean;
        est.raw[g] = (reason == ExclusionReason::None)
            ? algo::clamp(alpha, options.min_disp, max_disp)
            : nan;
    });
}

// =============================================================================
// Phase 2: Trend
// =============================================================================

namespace detail {

struct GammaFit {
    Real a0;
    Real a1;
    bool converged;
};

// Gamma-family GLM with identity link: y ~ a0 + a1 * x, x = 1 / mean.
// IRLS weights 1 / mu^2; the working response equals y under identity link.
inline GammaFit fit_gamma_identity(
    Array<const Real> x,
    Array<const Real> y,
    Real a0,
    Real a1
) {
    const Size n = x.len;
    std::vector<Real> w(n);
    Real dev_old = std::numeric_limits<Real>::infinity();

    for (Size iter = 0; iter < config::GAMMA_MAX_ITER; ++iter) {
        for (Size i = 0; i < n; ++i) {
            const Real mu = a0 + a1 * x.ptr[i];
            if (!(mu > Real(0))) return {a0, a1, false};
            w[i] = Real(1) / (mu * mu);
        }

        auto line = dex::math::regression::wls_line(x, y, as_array(w));
        if (!line.ok) return {a0, a1, false};
        a0 = line.intercept;
        a1 = line.slope;

        Real dev = 0;
        for (Size i = 0; i < n; ++i) {
            const Real mu = a0 + a1 * x.ptr[i];
            if (!(mu > Real(0))) return {a0, a1, false};
            dev += Real(2) * (-std::log(y.ptr[i] / mu) + (y.ptr[i] - mu) / mu);
        }

        if (std::abs(dev - dev_old) / (std::abs(dev) + Real(0.1)) < config::GAMMA_TOL) {
            return {a0, a1, true};
        }
        dev_old = dev;
    }
    return {a0, a1, false};
}

} // namespace detail

// a0 + a1 / mean over genes selected by the caller. Returns false when the
// fit does not converge or yields a non-positive coefficient.
inline bool fit_parametric_trend(
    Array<const Real> means,
    Array<const Real> disps,
    Real& a0,
    Real& a1
) {
    DEX_CHECK_DIM(means.len == disps.len, "parametric trend: size mismatch");
    const Size n = means.len;
    if (n < config::MIN_TREND_GENES) return false;

    a0 = config::START_A0;
    a1 = config::START_A1;

    std::vector<Real> x, y;
    x.reserve(n);
    y.reserve(n);

    for (Size iter = 0; iter < config::MAX_OUTER_ITER; ++iter) {
        x.clear();
        y.clear();
        for (Size i = 0; i < n; ++i) {
            const Real resid = disps.ptr[i] / (a0 + a1 / means.ptr[i]);
            if (resid > config::RESIDUAL_LOW && resid < config::RESIDUAL_HIGH) {
                x.push_back(Real(1) / means.ptr[i]);
                y.push_back(disps.ptr[i]);
            }
        }
        if (x.size() < config::MIN_TREND_GENES) return false;

        auto fit = detail::fit_gamma_identity(as_array(x), as_array(y), a0, a1);
        if (!(fit.a0 > Real(0)) || !(fit.a1 > Real(0))) return false;

        const Real d0 = std::log(fit.a0 / a0);
        const Real d1 = std::log(fit.a1 / a1);
        a0 = fit.a0;
        a1 = fit.a1;

        if (d0 * d0 + d1 * d1 < config::OUTER_TOL && fit.converged) {
            return true;
        }
    }
    return false;
}

// LOESS of log(disp) on log(mean). Grid output is sorted by log mean.
inline bool fit_local_trend(
    Array<const Real> means,
    Array<const Real> disps,
    double span,
    std::vector<Real>& log_mean_grid,
    std::vector<Real>& log_disp_fit
) {
    DEX_CHECK_DIM(means.len == disps.len, "local trend: size mismatch");
    const Size n = means.len;
    if (n < config::MIN_TREND_GENES) return false;

    log_mean_grid.resize(n);
    std::vector<Real> log_disp(n);
    for (Size i = 0; i < n; ++i) {
        log_mean_grid[i] = std::log(means.ptr[i]);
        log_disp[i] = std::log(disps.ptr[i]);
    }
    dex::sort::sort_pairs(as_array(log_mean_grid), as_array(log_disp));

    log_disp_fit.resize(n);
    dex::math::regression::loess(
        as_array(std::as_const(log_mean_grid)), as_array(std::as_const(log_disp)),
        as_array(log_disp_fit), span);

    for (Real v : log_disp_fit) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

// Fits the requested trend over usable genes; falls back to the median raw
// estimate with degraded = true. With no estimable gene the trend is a
// degraded NaN constant and every gene stays excluded.
inline DispersionTrend fit_trend(
    Array<const Real> base_mean,
    Array<const Real> raw,
    Array<const ExclusionReason> excluded,
    const DispersionOptions& options
) {
    const Size n_genes = raw.len;

    std::vector<Real> all_raw;
    std::vector<Real> means, disps;
    for (Size g = 0; g < n_genes; ++g) {
        if (excluded.ptr[g] != ExclusionReason::None) continue;
        all_raw.push_back(raw.ptr[g]);
        if (raw.ptr[g] >= config::TREND_MIN_FACTOR * options.min_disp) {
            means.push_back(base_mean.ptr[g]);
            disps.push_back(raw.ptr[g]);
        }
    }
    DispersionTrend trend;
    if (DEX_UNLIKELY(all_raw.empty())) {
        trend.type = TrendType::Constant;
        trend.degraded = true;
        trend.constant = std::numeric_limits<Real>::quiet_NaN();
        return trend;
    }

    trend.type = options.trend;

    bool ok = false;
    if (options.trend == TrendType::Parametric) {
        ok = fit_parametric_trend(as_array(std::as_const(means)), as_array(std::as_const(disps)),
                                  trend.a0, trend.a1);
    } else if (options.trend == TrendType::Local) {
        ok = fit_local_trend(as_array(std::as_const(means)), as_array(std::as_const(disps)),
                             options.loess_span, trend.log_mean_grid, trend.log_disp_fit);
    }

    if (!ok) {
        trend.type = TrendType::Constant;
        trend.degraded = (options.trend != TrendType::Constant);
        trend.a0 = trend.a1 = Real(0);
        trend.log_mean_grid.clear();
        trend.log_disp_fit.clear();
        trend.constant = dex::math::median_inplace(as_array(all_raw));
    }
    return trend;
}

// =============================================================================
// Phase 3: Shrinkage
// =============================================================================

// Consumes base_mean, raw, excluded and fit; fills trend, final, outlier,
// prior_variance and log_residual_sd.
inline void shrink(
    Array<const Real> size_factors,
    const SexDesign& design,
    const DispersionOptions& options,
    DispersionEstimate& est
) {
    const Size n_genes = est.gene_count();
    const Size n_samples = design.sample_count();
    const Real df = static_cast<Real>(design.residual_df());
    const Real max_disp = max_dispersion(n_samples);
    const Real nan = std::numeric_limits<Real>::quiet_NaN();

    const Real xim = detail::mean_inverse(size_factors);

    for (Size g = 0; g < n_genes; ++g) {
        est.trend[g] = (est.excluded[g] == ExclusionReason::None)
            ? evaluate_trend(est.fit, est.base_mean[g])
            : nan;
    }

    std::vector<Real> resid;
    resid.reserve(n_genes);
    for (Size g = 0; g < n_genes; ++g) {
        if (est.excluded[g] != ExclusionReason::None) continue;
        if (est.raw[g] < config::TREND_MIN_FACTOR * options.min_disp) continue;
        resid.push_back(std::log(est.raw[g]) - std::log(est.trend[g]));
    }

    const Real mad_sd = resid.empty() ? Real(0) : dex::math::mad(as_array(std::as_const(resid)));
    est.log_residual_sd = mad_sd;
    const Real expected = static_cast<Real>(dex::math::trigamma(static_cast<double>(df) / 2.0));
    const Real prior = algo::max2(mad_sd * mad_sd - expected, options.prior_variance_floor);
    est.prior_variance = prior;

    const Real outlier_cut = options.outlier_sd * mad_sd;

    dex::threading::parallel_for(0, n_genes, [&](size_t g) {
        est.outlier[g] = 0;
        if (est.excluded[g] != ExclusionReason::None) {
            est.final[g] = nan;
            return;
        }

        const Real log_raw = std::log(est.raw[g]);
        const Real log_trend = std::log(est.trend[g]);

        if (mad_sd > Real(0) && log_raw - log_trend > outlier_cut) {
            est.outlier[g] = 1;
            est.final[g] = est.raw[g];
            return;
        }

        const Real inflate = Real(1) + xim / (est.base_mean[g] * est.trend[g]);
        const Real sampling = Real(2) / df * inflate * inflate;
        const Real w = prior / (prior + sampling);
        const Real log_post = w * log_raw + (Real(1) - w) * log_trend;
        est.final[g] = algo::clamp(std::exp(log_post), options.min_disp, max_disp);
    });
}

// =============================================================================
// Full Estimator
// =============================================================================

inline DispersionEstimate estimate_dispersions(
    const CountMatrix& matrix,
    const SizeFactors& size_factors,
    const SexDesign& design,
    const DispersionOptions& options = {}
) {
    DEX_CHECK_ARG(options.min_disp > Real(0), "dispersion: min_disp must be positive");

    const Size n_genes = matrix.gene_count();
    DispersionEstimate est;
    est.gene_ids = matrix.gene_ids();
    est.base_mean.resize(n_genes);
    est.raw.resize(n_genes);
    est.trend.resize(n_genes);
    est.final.resize(n_genes);
    est.outlier.resize(n_genes);
    est.excluded.resize(n_genes, ExclusionReason::None);

    estimate_raw(matrix, size_factors.view(), design, options, est);

    est.fit = fit_trend(as_array(std::as_const(est.base_mean)), as_array(std::as_const(est.raw)),
                        as_array(std::as_const(est.excluded)), options);

    shrink(size_factors.view(), design, options, est);
    return est;
}

} // namespace dex::kernel::dispersion
