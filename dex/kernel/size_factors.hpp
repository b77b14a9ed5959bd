#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/core/memory.hpp"
#include "dex/core/vectorize.hpp"
#include "dex/math/stats.hpp"
#include "dex/data/count_matrix.hpp"
#include "dex/data/results.hpp"
#include "dex/threading/parallel_for.hpp"

#include <cmath>
#include <limits>
#include <vector>

// =============================================================================
// FILE: dex/kernel/size_factors.hpp
// BRIEF: Per-sample library size factors (median of ratios)
//
// ALGORITHM (Ratio):
//   lgm[g]  = mean_s log c[g,s]          genes with a zero are skipped
//   log f_s = median_g (log c[g,s] - lgm[g])
//   f_s    /= geometric_mean(f)
//
// PosCounts replaces lgm by sum_{c>0} log c / n_samples and takes the median
// over each sample's positive counts, so every gene may contain zeros.
// =============================================================================

namespace dex::kernel::size_factors {

using Method = SizeFactorMethod;

namespace config {
    constexpr Real EXCLUDED = -std::numeric_limits<Real>::infinity();
}

namespace detail {

// Log geometric mean per gene; EXCLUDED where the gene cannot serve as reference
inline void log_geometric_means(const CountMatrix& matrix, Method method, Array<Real> out) {
    const Size n_genes = matrix.gene_count();
    const Size n_samples = matrix.sample_count();
    const Real inv_n = Real(1) / static_cast<Real>(n_samples);

    dex::threading::parallel_for(0, n_genes, [&](size_t g) {
        auto row = matrix.row(g);
        Real acc = Real(0);
        Size positive = 0;
        bool has_zero = false;

        for (Size s = 0; s < n_samples; ++s) {
            const Count c = row.ptr[s];
            if (c == 0) {
                has_zero = true;
                continue;
            }
            acc += std::log(static_cast<Real>(c));
            ++positive;
        }

        if (method == Method::Ratio) {
            out.ptr[g] = has_zero ? config::EXCLUDED : acc * inv_n;
        } else {
            out.ptr[g] = (positive == 0) ? config::EXCLUDED : acc * inv_n;
        }
    });
}

} // namespace detail

// Raw kernel: factors has one slot per sample.
// Throws DomainError if some sample has no usable reference gene.
inline void estimate_size_factors(const CountMatrix& matrix, Array<Real> factors, Method method = Method::Ratio) {
    const Size n_genes = matrix.gene_count();
    const Size n_samples = matrix.sample_count();
    DEX_CHECK_DIM(factors.len == n_samples, "size factors: output size must equal sample count");
    DEX_CHECK_ARG(n_samples > 0, "size factors: matrix has no samples");

    std::vector<Real> lgm(n_genes);
    detail::log_geometric_means(matrix, method, as_array(lgm));

    Size usable = 0;
    for (Real v : lgm) {
        usable += (v != config::EXCLUDED);
    }
    if (DEX_UNLIKELY(usable == 0)) {
        throw DomainError(method == Method::Ratio
            ? "size factors: every gene contains at least one zero; use PosCounts"
            : "size factors: every gene is all-zero");
    }

    // Each sample owns its factor slot; failures are NaN and reported below
    dex::threading::parallel_for(0, n_samples, [&](size_t s) {
        std::vector<Real> ratios;
        ratios.reserve(usable);
        for (Size g = 0; g < n_genes; ++g) {
            if (lgm[g] == config::EXCLUDED) continue;
            const Count c = matrix.count(g, s);
            if (c == 0) continue;
            ratios.push_back(std::log(static_cast<Real>(c)) - lgm[g]);
        }
        factors.ptr[s] = ratios.empty()
            ? std::numeric_limits<Real>::quiet_NaN()
            : dex::math::median_inplace(as_array(ratios));
    });

    for (Size s = 0; s < n_samples; ++s) {
        if (DEX_UNLIKELY(!std::isfinite(factors.ptr[s]))) {
            throw DomainError("size factors: sample '" + matrix.sample_ids()[s] +
                              "' has no positive count among reference genes");
        }
    }
    const Real mean_log = vectorize::sum(Array<const Real>(factors.ptr, n_samples)) / static_cast<Real>(n_samples);

    for (Size s = 0; s < n_samples; ++s) {
        factors.ptr[s] = std::exp(factors.ptr[s] - mean_log);
    }
}

inline SizeFactors estimate_size_factors(const CountMatrix& matrix, Method method = Method::Ratio) {
    SizeFactors sf;
    sf.sample_ids = matrix.sample_ids();
    sf.values.resize(matrix.sample_count());
    sf.method = method;
    estimate_size_factors(matrix, as_array(sf.values), method);
    return sf;
}

// out[g * n_samples + s] = c[g,s] / f_s
inline void normalized_counts(const CountMatrix& matrix, Array<const Real> factors, Array<Real> out) {
    const Size n_samples = matrix.sample_count();
    DEX_CHECK_DIM(factors.len == n_samples, "normalized_counts: factor count mismatch");
    DEX_CHECK_DIM(out.len == matrix.gene_count() * n_samples, "normalized_counts: output size mismatch");

    auto inv = memory::aligned_alloc<Real>(n_samples);
    for (Size s = 0; s < n_samples; ++s) {
        inv[s] = Real(1) / factors.ptr[s];
    }

    dex::threading::parallel_for(0, matrix.gene_count(), [&](size_t g) {
        auto row = matrix.row(g);
        Real* dst = out.ptr + g * n_samples;
        for (Size s = 0; s < n_samples; ++s) {
            dst[s] = static_cast<Real>(row.ptr[s]) * inv[s];
        }
    });
}

// Mean normalized count per gene
inline std::vector<Real> base_means(const CountMatrix& matrix, Array<const Real> factors) {
    const Size n_samples = matrix.sample_count();
    DEX_CHECK_DIM(factors.len == n_samples, "base_means: factor count mismatch");

    std::vector<Real> means(matrix.gene_count());
    dex::threading::parallel_for(0, matrix.gene_count(), [&](size_t g) {
        auto row = matrix.row(g);
        Real acc = Real(0);
        for (Size s = 0; s < n_samples; ++s) {
            acc += static_cast<Real>(row.ptr[s]) / factors.ptr[s];
        }
        means[g] = (n_samples > 0) ? acc / static_cast<Real>(n_samples) : Real(0);
    });
    return means;
}

} // namespace dex::kernel::size_factors
