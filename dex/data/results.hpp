#pragma once

#include "dex/core/type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: dex/data/results.hpp
// BRIEF: Fixed-schema records produced by one stratum's run
//
// NA is std::nullopt in records; kernels use NaN internally and convert at
// the record boundary.
// =============================================================================

namespace dex {

// =============================================================================
// Size Factors
// =============================================================================

enum class SizeFactorMethod : std::uint8_t {
    Ratio,      // median of ratios over genes without zeros
    PosCounts   // geometric means over positive counts only
};

struct SizeFactors {
    std::vector<std::string> sample_ids;
    std::vector<Real> values;
    SizeFactorMethod method = SizeFactorMethod::Ratio;

    [[nodiscard]] Array<const Real> view() const noexcept { return as_array(values); }

    [[nodiscard]] std::optional<Real> find(std::string_view sample_id) const {
        for (Size i = 0; i < sample_ids.size(); ++i) {
            if (sample_ids[i] == sample_id) return values[i];
        }
        return std::nullopt;
    }
};

// =============================================================================
// Gene Exclusion / Fit State
// =============================================================================

enum class ExclusionReason : std::uint8_t {
    None = 0,
    AllZero,
    ZeroVariance,
    LowCount
};

[[nodiscard]] constexpr const char* to_string(ExclusionReason r) noexcept {
    switch (r) {
        case ExclusionReason::None:         return "none";
        case ExclusionReason::AllZero:      return "all_zero";
        case ExclusionReason::ZeroVariance: return "zero_variance";
        case ExclusionReason::LowCount:     return "low_count";
    }
    return "none";
}

// Per-gene GLM fit lifecycle
enum class FitState : std::uint8_t {
    Fitting = 0,
    Converged,
    NonConverged,
    Excluded
};

[[nodiscard]] constexpr const char* to_string(FitState s) noexcept {
    switch (s) {
        case FitState::Fitting:      return "fitting";
        case FitState::Converged:    return "converged";
        case FitState::NonConverged: return "non_converged";
        case FitState::Excluded:     return "excluded";
    }
    return "fitting";
}

// =============================================================================
// Dispersion
// =============================================================================

enum class TrendType : std::uint8_t {
    Parametric,   // a0 + a1 / mean
    Local,        // LOESS on log-log scale
    Constant      // fallback: median raw estimate
};

struct DispersionTrend {
    TrendType type = TrendType::Parametric;
    bool degraded = false;

    // Parametric
    Real a0 = Real(0);
    Real a1 = Real(0);

    // Local: fitted log dispersion on a sorted log-mean grid
    std::vector<Real> log_mean_grid;
    std::vector<Real> log_disp_fit;

    // Constant
    Real constant = Real(0);
};

struct DispersionEstimate {
    std::vector<std::string> gene_ids;
    std::vector<Real> base_mean;
    std::vector<Real> raw;          // NaN for excluded genes
    std::vector<Real> trend;        // trend evaluated at base_mean
    std::vector<Real> final;        // shrunk, NaN for excluded genes
    std::vector<std::uint8_t> outlier;
    std::vector<ExclusionReason> excluded;

    DispersionTrend fit;
    Real prior_variance = Real(0);
    Real log_residual_sd = Real(0);

    [[nodiscard]] Size gene_count() const noexcept { return gene_ids.size(); }

    [[nodiscard]] Size outlier_count() const noexcept {
        Size n = 0;
        for (auto o : outlier) n += (o != 0);
        return n;
    }

    [[nodiscard]] Size excluded_count(ExclusionReason reason) const noexcept {
        Size n = 0;
        for (auto r : excluded) n += (r == reason);
        return n;
    }
};

// =============================================================================
// Differential Expression
// =============================================================================

enum class DiffLabel : std::uint8_t {
    NO = 0,
    Male,
    Female
};

[[nodiscard]] constexpr const char* to_string(DiffLabel label) noexcept {
    switch (label) {
        case DiffLabel::Male:   return "Male";
        case DiffLabel::Female: return "Female";
        case DiffLabel::NO:     return "NO";
    }
    return "NO";
}

struct TestResult {
    std::string gene_id;
    Real base_mean = Real(0);
    std::optional<Real> log2_fold_change;
    std::optional<Real> lfc_se;
    std::optional<Real> stat;
    std::optional<Real> pvalue;
    std::optional<Real> padj;
    DiffLabel label = DiffLabel::NO;
    FitState state = FitState::Fitting;
    ExclusionReason exclusion = ExclusionReason::None;
    Size iterations = 0;

    bool operator==(const TestResult&) const = default;
};

// TestResult left-joined with the annotation table
struct AnnotatedResult {
    TestResult result;
    std::optional<std::string> gene_name;

    bool operator==(const AnnotatedResult&) const = default;
};

// =============================================================================
// Enrichment
// =============================================================================

struct EnrichmentResult {
    std::string term_id;
    std::string term_name;
    Size list_count = 0;         // k: list genes in term
    Size background_count = 0;   // n: universe genes in term
    Size list_total = 0;         // K
    Size background_total = 0;   // N
    Real pvalue = Real(1);
    Real padj = Real(1);
    std::vector<std::string> genes;  // contributing genes in list order
};

} // namespace dex
