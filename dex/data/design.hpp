#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/data/sample_metadata.hpp"

#include <cstdint>
#include <vector>

// =============================================================================
// FILE: dex/data/design.hpp
// BRIEF: Two-column design [intercept, male] with female as reference
// =============================================================================

namespace dex {

struct SexDesign {
    std::vector<std::uint8_t> is_male;
    Size n_male = 0;
    Size n_female = 0;

    static constexpr Size N_COEF = 2;

    [[nodiscard]] Size sample_count() const noexcept { return is_male.size(); }

    // Residual degrees of freedom
    [[nodiscard]] Size residual_df() const noexcept {
        return is_male.size() > N_COEF ? is_male.size() - N_COEF : 0;
    }

    [[nodiscard]] Array<const std::uint8_t> indicator() const noexcept {
        return as_array(is_male);
    }
};

// Throws ValueError if any sample lacks a sex; a single level is not an
// error here (the cohort filter owns that rule)
inline SexDesign make_sex_design(const SampleMetadata& metadata) {
    SexDesign design;
    design.is_male.reserve(metadata.size());
    for (const auto& rec : metadata) {
        if (DEX_UNLIKELY(!rec.sex.has_value())) {
            throw ValueError("sample '" + rec.sample_id + "' has no sex covariate");
        }
        const bool male = (*rec.sex == Sex::Male);
        design.is_male.push_back(male ? 1 : 0);
        if (male) {
            ++design.n_male;
        } else {
            ++design.n_female;
        }
    }
    return design;
}

} // namespace dex
