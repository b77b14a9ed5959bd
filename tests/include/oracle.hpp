#pragma once

// =============================================================================
// DEX - Oracle (Eigen Reference Implementation)
// =============================================================================
//
// Straightforward reference implementations used as the source of truth for
// numerical results. They favour clarity over speed:
//   - NB GLM by dense IRLS on an explicit Eigen design matrix
//   - Hypergeometric upper tail by direct long-double summation
//   - Benjamini-Hochberg by the O(m^2) definition
//   - Median-of-ratios size factors without any SIMD or threading
//
// =============================================================================

#include "dex/core/type.hpp"
#include "dex/data/count_matrix.hpp"

#include <Eigen/Core>
#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

namespace dex::test::oracle {

using EigenDense = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic>;
using EigenVector = Eigen::Matrix<double, Eigen::Dynamic, 1>;

// =============================================================================
// Negative-Binomial GLM
// =============================================================================

struct NbFit {
    EigenVector beta;       // natural-log scale
    EigenDense covariance;  // (X'WX)^-1
    bool converged = false;
    int iterations = 0;
};

/// Unpenalised IRLS for log mu = X beta + offset with fixed alpha.
/// X is [1, male]; offset is log size factor.
inline NbFit nb_glm(
    const std::vector<Count>& y,
    const std::vector<double>& size_factors,
    const std::vector<std::uint8_t>& is_male,
    double alpha,
    int max_iter = 200,
    double tol = 1e-12
) {
    const Eigen::Index n = static_cast<Eigen::Index>(y.size());
    EigenDense X(n, 2);
    EigenVector yv(n), offset(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        X(i, 0) = 1.0;
        X(i, 1) = is_male[static_cast<std::size_t>(i)] ? 1.0 : 0.0;
        yv(i) = static_cast<double>(y[static_cast<std::size_t>(i)]);
        offset(i) = std::log(size_factors[static_cast<std::size_t>(i)]);
    }

    NbFit fit;
    fit.beta = EigenVector::Zero(2);
    fit.beta(0) = std::log(yv.mean() + 0.1);

    for (int iter = 0; iter < max_iter; ++iter) {
        fit.iterations = iter + 1;
        EigenVector eta = X * fit.beta + offset;
        EigenVector mu = eta.array().exp().matrix();
        EigenVector w = (mu.array() / (1.0 + alpha * mu.array())).matrix();
        EigenVector z = ((eta - offset).array() + (yv - mu).array() / mu.array()).matrix();

        EigenDense xtwx = X.transpose() * w.asDiagonal() * X;
        EigenVector xtwz = X.transpose() * w.asDiagonal() * z;
        EigenVector beta_new = xtwx.ldlt().solve(xtwz);

        const double delta = (beta_new - fit.beta).cwiseAbs().maxCoeff();
        fit.beta = beta_new;
        if (delta < tol) {
            fit.converged = true;
            break;
        }
    }

    EigenVector mu = (X * fit.beta + offset).array().exp().matrix();
    EigenVector w = (mu.array() / (1.0 + alpha * mu.array())).matrix();
    EigenDense xtwx = X.transpose() * w.asDiagonal() * X;
    fit.covariance = xtwx.inverse();
    return fit;
}

// =============================================================================
// Hypergeometric Tail
// =============================================================================

/// P(X >= k), X ~ Hypergeometric(N, K, n), summing every pmf term
inline long double hypergeometric_upper_tail(std::size_t k, std::size_t N, std::size_t K, std::size_t n) {
    auto log_choose = [](long double a, long double b) {
        return std::lgamma(a + 1.0L) - std::lgamma(b + 1.0L) - std::lgamma(a - b + 1.0L);
    };

    const std::size_t lo = (n + K > N) ? n + K - N : 0;
    const std::size_t hi = std::min(n, K);
    const long double denom = log_choose(static_cast<long double>(N), static_cast<long double>(n));

    long double sum = 0.0L;
    for (std::size_t x = std::max(k, lo); x <= hi; ++x) {
        const long double lx = static_cast<long double>(x);
        const long double lp = log_choose(static_cast<long double>(K), lx)
                             + log_choose(static_cast<long double>(N - K), static_cast<long double>(n) - lx)
                             - denom;
        sum += std::exp(lp);
    }
    return std::min(sum, 1.0L);
}

// =============================================================================
// Benjamini-Hochberg
// =============================================================================

/// padj_i = min over j with p_j >= p_i of min(1, p_j m / rank_j); NaN passes through
inline std::vector<double> benjamini_hochberg(const std::vector<double>& p) {
    std::vector<double> valid;
    for (double v : p) {
        if (!std::isnan(v)) valid.push_back(v);
    }
    std::sort(valid.begin(), valid.end());
    const double m = static_cast<double>(valid.size());

    std::vector<double> out(p.size(), std::numeric_limits<double>::quiet_NaN());
    for (std::size_t i = 0; i < p.size(); ++i) {
        if (std::isnan(p[i])) continue;
        double best = 1.0;
        for (std::size_t r = 0; r < valid.size(); ++r) {
            if (valid[r] >= p[i]) {
                best = std::min(best, valid[r] * m / static_cast<double>(r + 1));
            }
        }
        out[i] = best;
    }
    return out;
}

// =============================================================================
// Size Factors
// =============================================================================

/// Median of ratios over genes without zeros, rescaled to geometric mean 1
inline std::vector<double> median_of_ratios(const CountMatrix& m) {
    const std::size_t G = m.gene_count();
    const std::size_t S = m.sample_count();

    std::vector<double> log_geo(G, std::numeric_limits<double>::quiet_NaN());
    for (std::size_t g = 0; g < G; ++g) {
        double acc = 0.0;
        bool zero = false;
        for (std::size_t s = 0; s < S; ++s) {
            if (m.count(g, s) == 0) {
                zero = true;
                break;
            }
            acc += std::log(static_cast<double>(m.count(g, s)));
        }
        if (!zero) log_geo[g] = acc / static_cast<double>(S);
    }

    std::vector<double> log_sf(S);
    for (std::size_t s = 0; s < S; ++s) {
        std::vector<double> r;
        for (std::size_t g = 0; g < G; ++g) {
            if (std::isnan(log_geo[g])) continue;
            r.push_back(std::log(static_cast<double>(m.count(g, s))) - log_geo[g]);
        }
        std::sort(r.begin(), r.end());
        const std::size_t h = r.size() / 2;
        log_sf[s] = (r.size() % 2 == 1) ? r[h] : 0.5 * (r[h - 1] + r[h]);
    }

    double mean = 0.0;
    for (double v : log_sf) mean += v;
    mean /= static_cast<double>(S);

    std::vector<double> sf(S);
    for (std::size_t s = 0; s < S; ++s) {
        sf[s] = std::exp(log_sf[s] - mean);
    }
    return sf;
}

} // namespace dex::test::oracle
