#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/core/algo.hpp"
#include "dex/math/stats.hpp"
#include "dex/math/regression.hpp"
#include "dex/data/count_matrix.hpp"
#include "dex/data/design.hpp"
#include "dex/data/results.hpp"
#include "dex/threading/parallel_for.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <utility>
#include <vector>

// =============================================================================
// FILE: dex/kernel/glm.hpp
// BRIEF: Per-gene negative-binomial GLM and Wald test
//
// Model:  log mu_s = beta0 + beta1 * male_s + log f_s,  alpha fixed
// Fit:    IRLS with a small ridge on both coefficients
//           w_s = mu_s / (1 + alpha mu_s)
//           z_s = log(mu_s / f_s) + (y_s - mu_s) / mu_s
//           beta = (X'WX + L)^-1 X'Wz
// Test:   lfc = beta1 / ln 2,  stat = lfc / se,  p = 2 * (1 - Phi(|stat|))
//
// Every gene runs the FitState machine Fitting -> {Converged, NonConverged};
// genes excluded upstream enter as Excluded and are never fitted.
// =============================================================================

namespace dex::kernel::glm {

namespace config {
    constexpr Real BETA_TOL = Real(1e-8);
    constexpr Real DEVIANCE_TOL = Real(1e-8);
    constexpr Size MAX_ITER = 100;
    constexpr Real MIN_MU = Real(0.5);
    constexpr Real RIDGE_LOG2 = Real(1e-6);
    constexpr Real LARGE_BETA = Real(30);
    constexpr Real INIT_PSEUDOCOUNT = Real(0.1);
}

struct GlmOptions {
    Real beta_tol = config::BETA_TOL;
    Real deviance_tol = config::DEVIANCE_TOL;
    Size max_iter = config::MAX_ITER;
    Real min_mu = config::MIN_MU;
    Real ridge_log2 = config::RIDGE_LOG2;   // ridge on the log2 scale
};

struct GeneFit {
    FitState state = FitState::Fitting;
    Real beta0 = Real(0);
    Real beta1 = Real(0);
    Real lfc = std::numeric_limits<Real>::quiet_NaN();
    Real lfc_se = std::numeric_limits<Real>::quiet_NaN();
    Real stat = std::numeric_limits<Real>::quiet_NaN();
    Real pvalue = std::numeric_limits<Real>::quiet_NaN();
    Real deviance = std::numeric_limits<Real>::quiet_NaN();
    Size iterations = 0;
};

namespace detail {

constexpr Real LN2 = std::numbers::ln2_v<Real>;

// -2 * NB log-likelihood of one observation
DEX_FORCE_INLINE Real nb_deviance_term(Real y, Real mu, Real alpha) {
    const Real inv_alpha = Real(1) / alpha;
    const Real ll = std::lgamma(y + inv_alpha) - std::lgamma(inv_alpha) - std::lgamma(y + Real(1))
                  + y * std::log(alpha * mu / (Real(1) + alpha * mu))
                  - inv_alpha * std::log1p(alpha * mu);
    return Real(-2) * ll;
}

struct Accumulator {
    // Symmetric X'WX for X = [1, male]
    Real xtwx00 = 0, xtwx01 = 0, xtwx11 = 0;
    Real xtwz0 = 0, xtwz1 = 0;
};

// Builds the weighted normal equations at the current beta
DEX_FORCE_INLINE Accumulator accumulate(
    Array<const Count> y,
    Array<const Real> log_sf,
    Array<const std::uint8_t> is_male,
    Real beta0,
    Real beta1,
    Real alpha,
    Real min_mu
) {
    Accumulator acc;
    for (Size s = 0; s < y.len; ++s) {
        const Real x1 = is_male.ptr[s] ? Real(1) : Real(0);
        const Real eta = beta0 + beta1 * x1 + log_sf.ptr[s];
        const Real mu = algo::max2(std::exp(eta), min_mu);
        const Real w = mu / (Real(1) + alpha * mu);
        const Real z = std::log(mu) - log_sf.ptr[s] + (static_cast<Real>(y.ptr[s]) - mu) / mu;

        acc.xtwx00 += w;
        acc.xtwx01 += w * x1;
        acc.xtwx11 += w * x1 * x1;
        acc.xtwz0 += w * z;
        acc.xtwz1 += w * x1 * z;
    }
    return acc;
}

DEX_FORCE_INLINE Real deviance(
    Array<const Count> y,
    Array<const Real> log_sf,
    Array<const std::uint8_t> is_male,
    Real beta0,
    Real beta1,
    Real alpha,
    Real min_mu
) {
    Real dev = 0;
    for (Size s = 0; s < y.len; ++s) {
        const Real x1 = is_male.ptr[s] ? Real(1) : Real(0);
        const Real mu = algo::max2(std::exp(beta0 + beta1 * x1 + log_sf.ptr[s]), min_mu);
        dev += nb_deviance_term(static_cast<Real>(y.ptr[s]), mu, alpha);
    }
    return dev;
}

} // namespace detail

// Fits one gene. Never throws on numerical trouble: the state says what happened.
inline GeneFit fit_gene(
    Array<const Count> y,
    Array<const Real> log_sf,
    Array<const std::uint8_t> is_male,
    Real alpha,
    const GlmOptions& options = {}
) {
    GeneFit fit;
    const Size n = y.len;

    // Start from group means of normalized counts
    Real sum_m = 0, sum_f = 0;
    Size n_m = 0;
    for (Size s = 0; s < n; ++s) {
        const Real q = static_cast<Real>(y.ptr[s]) / std::exp(log_sf.ptr[s]);
        if (is_male.ptr[s]) {
            sum_m += q;
            ++n_m;
        } else {
            sum_f += q;
        }
    }
    const Size n_f = n - n_m;
    if (n_m == 0 || n_f == 0 || !(alpha > Real(0))) {
        fit.state = FitState::NonConverged;
        return fit;
    }

    const Real mean_m = sum_m / static_cast<Real>(n_m);
    const Real mean_f = sum_f / static_cast<Real>(n_f);
    Real beta0 = std::log(mean_f + config::INIT_PSEUDOCOUNT);
    Real beta1 = std::log(mean_m + config::INIT_PSEUDOCOUNT) - beta0;

    const Real lambda = options.ridge_log2 / (detail::LN2 * detail::LN2);
    Real dev_old = detail::deviance(y, log_sf, is_male, beta0, beta1, alpha, options.min_mu);

    while (fit.state == FitState::Fitting) {
        ++fit.iterations;

        auto acc = detail::accumulate(y, log_sf, is_male, beta0, beta1, alpha, options.min_mu);
        const Real rhs[2] = {acc.xtwz0, acc.xtwz1};
        Real beta_new[2] = {0, 0};
        const bool solved = dex::math::regression::detail::solve_sym_2x2(
            acc.xtwx00 + lambda, acc.xtwx01, acc.xtwx11 + lambda, rhs, beta_new);

        if (!solved || !std::isfinite(beta_new[0]) || !std::isfinite(beta_new[1]) ||
            std::abs(beta_new[0]) > config::LARGE_BETA || std::abs(beta_new[1]) > config::LARGE_BETA) {
            fit.state = FitState::NonConverged;
            break;
        }

        const Real delta = algo::max2(std::abs(beta_new[0] - beta0), std::abs(beta_new[1] - beta1));
        beta0 = beta_new[0];
        beta1 = beta_new[1];

        const Real dev = detail::deviance(y, log_sf, is_male, beta0, beta1, alpha, options.min_mu);
        const Real rel_change = std::abs(dev - dev_old) / (std::abs(dev) + Real(0.1));
        dev_old = dev;

        if (!std::isfinite(dev)) {
            fit.state = FitState::NonConverged;
        } else if (delta < options.beta_tol || rel_change < options.deviance_tol) {
            fit.state = FitState::Converged;
        } else if (fit.iterations >= options.max_iter) {
            fit.state = FitState::NonConverged;
        }
    }

    if (fit.state != FitState::Converged) {
        return fit;
    }

    fit.beta0 = beta0;
    fit.beta1 = beta1;
    fit.deviance = dev_old;

    // Sandwich covariance (X'WX + L)^-1 X'WX (X'WX + L)^-1 at the final fit
    auto acc = detail::accumulate(y, log_sf, is_male, beta0, beta1, alpha, options.min_mu);
    const Real a00 = acc.xtwx00 + lambda;
    const Real a01 = acc.xtwx01;
    const Real a11 = acc.xtwx11 + lambda;
    const Real det = a00 * a11 - a01 * a01;
    if (!(det > Real(0))) {
        fit.state = FitState::NonConverged;
        return fit;
    }
    const Real i01 = -a01 / det;
    const Real i11 = a00 / det;

    // Row 1 of inv(A) * B * inv(A), element (1,1)
    const Real t0 = i01 * acc.xtwx00 + i11 * acc.xtwx01;
    const Real t1 = i01 * acc.xtwx01 + i11 * acc.xtwx11;
    const Real var_beta1 = t0 * i01 + t1 * i11;

    if (!(var_beta1 > Real(0)) || !std::isfinite(var_beta1)) {
        fit.state = FitState::NonConverged;
        return fit;
    }

    fit.lfc = beta1 / detail::LN2;
    fit.lfc_se = std::sqrt(var_beta1) / detail::LN2;
    fit.stat = fit.lfc / fit.lfc_se;
    fit.pvalue = static_cast<Real>(dex::math::normal_two_sided_p(static_cast<double>(fit.stat)));

    if (!std::isfinite(fit.lfc) || !std::isfinite(fit.stat) || !std::isfinite(fit.pvalue)) {
        fit.state = FitState::NonConverged;
        fit.lfc = fit.lfc_se = fit.stat = fit.pvalue = std::numeric_limits<Real>::quiet_NaN();
    }
    return fit;
}

// Fits every non-excluded gene in parallel and builds the result table
// (padj and label are left for the adjustment and classification stages).
inline std::vector<TestResult> wald_test(
    const CountMatrix& matrix,
    const SizeFactors& size_factors,
    const SexDesign& design,
    const DispersionEstimate& dispersion,
    const GlmOptions& options = {}
) {
    const Size n_genes = matrix.gene_count();
    const Size n_samples = matrix.sample_count();
    DEX_CHECK_DIM(size_factors.values.size() == n_samples, "wald_test: size factor count mismatch");
    DEX_CHECK_DIM(design.sample_count() == n_samples, "wald_test: design row count mismatch");
    DEX_CHECK_DIM(dispersion.gene_count() == n_genes, "wald_test: dispersion gene count mismatch");
    DEX_CHECK_ARG(options.max_iter > 0, "wald_test: max_iter must be positive");

    std::vector<Real> log_sf(n_samples);
    for (Size s = 0; s < n_samples; ++s) {
        log_sf[s] = std::log(size_factors.values[s]);
    }

    std::vector<TestResult> results(n_genes);
    const auto& ids = matrix.gene_ids();

    dex::threading::parallel_for(0, n_genes, [&](size_t g) {
        TestResult& r = results[g];
        r.base_mean = dispersion.base_mean[g];
        r.exclusion = dispersion.excluded[g];

        if (r.exclusion != ExclusionReason::None) {
            r.state = FitState::Excluded;
            return;
        }

        auto fit = fit_gene(matrix.row(g), as_array(std::as_const(log_sf)),
                            design.indicator(), dispersion.final[g], options);
        r.state = fit.state;
        r.iterations = fit.iterations;
        if (fit.state == FitState::Converged) {
            r.log2_fold_change = fit.lfc;
            r.lfc_se = fit.lfc_se;
            r.stat = fit.stat;
            r.pvalue = fit.pvalue;
        }
    });

    // Ids are copied serially to keep string allocation out of the workers
    for (Size g = 0; g < n_genes; ++g) {
        results[g].gene_id = ids[g];
    }
    return results;
}

} // namespace dex::kernel::glm
