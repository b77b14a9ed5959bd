#pragma once

#include "dex/core/type.hpp"
#include "dex/data/results.hpp"

#include <cmath>
#include <optional>
#include <vector>

// =============================================================================
// FILE: dex/kernel/classify.hpp
// BRIEF: Fixed-threshold significance labels
//
//   Male    lfc >  lfc_threshold and padj < padj_threshold
//   Female  lfc < -lfc_threshold and padj < padj_threshold
//   NO      otherwise, including NA lfc or NA padj
// =============================================================================

namespace dex::kernel::classify {

namespace config {
    constexpr Real LFC_THRESHOLD = Real(1.0);
    constexpr Real PADJ_THRESHOLD = Real(0.05);
}

struct ClassifierThresholds {
    Real lfc = config::LFC_THRESHOLD;
    Real padj = config::PADJ_THRESHOLD;
};

[[nodiscard]] constexpr DiffLabel classify(
    std::optional<Real> lfc,
    std::optional<Real> padj,
    const ClassifierThresholds& thresholds = {}
) noexcept {
    if (!lfc.has_value() || !padj.has_value()) return DiffLabel::NO;
    if (!(*padj < thresholds.padj)) return DiffLabel::NO;
    if (*lfc > thresholds.lfc) return DiffLabel::Male;
    if (*lfc < -thresholds.lfc) return DiffLabel::Female;
    return DiffLabel::NO;
}

inline void classify_results(std::vector<TestResult>& results, const ClassifierThresholds& thresholds = {}) {
    for (auto& r : results) {
        r.label = classify(r.log2_fold_change, r.padj, thresholds);
    }
}

struct LabelCounts {
    Size male = 0;
    Size female = 0;
    Size no = 0;
};

[[nodiscard]] inline LabelCounts count_labels(const std::vector<TestResult>& results) noexcept {
    LabelCounts counts;
    for (const auto& r : results) {
        switch (r.label) {
            case DiffLabel::Male:   ++counts.male; break;
            case DiffLabel::Female: ++counts.female; break;
            case DiffLabel::NO:     ++counts.no; break;
        }
    }
    return counts;
}

} // namespace dex::kernel::classify
