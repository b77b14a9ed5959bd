#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/core/memory.hpp"
#include "dex/core/sort.hpp"
#include "dex/core/algo.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

// =============================================================================
// FILE: dex/kernel/multiple_testing.hpp
// BRIEF: Multiple testing correction methods
//
// APPLICATIONS:
// - FDR control across genes (Benjamini-Hochberg)
// - FDR control across ontology terms
// - Family-wise control (Bonferroni)
//
// NA SEMANTICS:
// - NaN p-values are not counted in m and stay NaN in the output
// =============================================================================

namespace dex::kernel::multiple_testing {

namespace config {
    constexpr Real DEFAULT_FDR_LEVEL = Real(0.05);
    constexpr Real MAX_PVALUE = Real(1.0);
}

enum class AdjustMethod : std::uint8_t {
    BenjaminiHochberg,
    Bonferroni
};

namespace detail {

// Positions of the finite p-values, sorted by p ascending
DEX_FORCE_INLINE Size sort_valid_by_pvalue(
    Array<const Real> p_values,
    Real* sorted_pvalues,
    Index* sorted_indices
) {
    Size m = 0;
    for (Size i = 0; i < p_values.len; ++i) {
        if (std::isnan(p_values.ptr[i])) continue;
        sorted_pvalues[m] = p_values.ptr[i];
        sorted_indices[m] = static_cast<Index>(i);
        ++m;
    }

    dex::sort::sort_pairs(
        Array<Real>(sorted_pvalues, m),
        Array<Index>(sorted_indices, m)
    );
    return m;
}

} // namespace detail

// =============================================================================
// Benjamini-Hochberg FDR correction
// =============================================================================

inline void benjamini_hochberg(
    Array<const Real> p_values,
    Array<Real> adjusted_p_values
) {
    DEX_CHECK_DIM(p_values.len == adjusted_p_values.len,
        "p_values and adjusted_p_values must have same length");

    const Size n = p_values.len;
    if (n == 0) return;

    auto sorted_indices_ptr = dex::memory::aligned_alloc<Index>(n, DEX_ALIGNMENT);
    auto sorted_pvalues_ptr = dex::memory::aligned_alloc<Real>(n, DEX_ALIGNMENT);
    Index* sorted_indices = sorted_indices_ptr.get();
    Real* sorted_pvalues = sorted_pvalues_ptr.get();

    for (Size i = 0; i < n; ++i) {
        adjusted_p_values.ptr[i] = std::numeric_limits<Real>::quiet_NaN();
    }

    const Size m = detail::sort_valid_by_pvalue(p_values, sorted_pvalues, sorted_indices);
    if (m == 0) return;

    // p_adj[i] = p[i] * m / rank, then cumulative minimum from the right
    const Real m_real = static_cast<Real>(m);
    Real running = config::MAX_PVALUE;
    for (Size i = m; i-- > 0;) {
        const Real rank = static_cast<Real>(i + 1);
        running = dex::algo::min2(running, sorted_pvalues[i] * m_real / rank);
        adjusted_p_values.ptr[sorted_indices[i]] = running;
    }
}

// =============================================================================
// Bonferroni correction
// =============================================================================

inline void bonferroni(
    Array<const Real> p_values,
    Array<Real> adjusted_p_values
) {
    DEX_CHECK_DIM(p_values.len == adjusted_p_values.len,
        "p_values and adjusted_p_values must have same length");

    Size m = 0;
    for (Size i = 0; i < p_values.len; ++i) {
        m += !std::isnan(p_values.ptr[i]);
    }
    const Real m_real = static_cast<Real>(m);

    for (Size i = 0; i < p_values.len; ++i) {
        const Real p = p_values.ptr[i];
        adjusted_p_values.ptr[i] = std::isnan(p) ? p : dex::algo::min2(p * m_real, config::MAX_PVALUE);
    }
}

inline void adjust(
    Array<const Real> p_values,
    Array<Real> adjusted_p_values,
    AdjustMethod method = AdjustMethod::BenjaminiHochberg
) {
    switch (method) {
        case AdjustMethod::BenjaminiHochberg:
            benjamini_hochberg(p_values, adjusted_p_values);
            return;
        case AdjustMethod::Bonferroni:
            bonferroni(p_values, adjusted_p_values);
            return;
    }
    throw ValueError("adjust: unknown method");
}

// NA-aware overload for record columns
inline std::vector<std::optional<Real>> adjust(
    const std::vector<std::optional<Real>>& p_values,
    AdjustMethod method = AdjustMethod::BenjaminiHochberg
) {
    const Size n = p_values.size();
    std::vector<Real> p(n), q(n);
    for (Size i = 0; i < n; ++i) {
        p[i] = p_values[i].value_or(std::numeric_limits<Real>::quiet_NaN());
    }
    adjust(as_array(std::as_const(p)), as_array(q), method);

    std::vector<std::optional<Real>> out(n);
    for (Size i = 0; i < n; ++i) {
        if (!std::isnan(q[i])) out[i] = q[i];
    }
    return out;
}

// Count of adjusted p-values strictly below alpha; NaN never counts
inline Size count_significant(
    Array<const Real> adjusted_p_values,
    Real alpha = config::DEFAULT_FDR_LEVEL
) {
    Size count = 0;
    for (Size i = 0; i < adjusted_p_values.len; ++i) {
        if (adjusted_p_values.ptr[i] < alpha) {
            ++count;
        }
    }
    return count;
}

} // namespace dex::kernel::multiple_testing
