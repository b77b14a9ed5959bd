#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/data/count_matrix.hpp"
#include "dex/data/sample_metadata.hpp"

#include <cstdint>
#include <optional>
#include <string>

// =============================================================================
// FILE: dex/kernel/cohort.hpp
// BRIEF: Sample selection for one age stratum
//
// A sample is kept when all hold:
//   - age is present
//   - sex is present (the design covariate)
//   - sample_type equals the configured type
//   - age <= threshold (AtOrBelow) or age > threshold (Above)
//   - sex equals the optional sex filter
// =============================================================================

namespace dex::kernel::cohort {

namespace config {
    constexpr Real AGE_THRESHOLD = Real(50);
    constexpr const char* SAMPLE_TYPE = "Metastatic";
}

enum class AgeStratum : std::uint8_t {
    AtOrBelow,
    Above
};

[[nodiscard]] constexpr const char* to_string(AgeStratum s) noexcept {
    return s == AgeStratum::AtOrBelow ? "age_at_or_below" : "age_above";
}

struct CohortFilter {
    AgeStratum stratum = AgeStratum::AtOrBelow;
    Real age_threshold = config::AGE_THRESHOLD;
    std::string sample_type = config::SAMPLE_TYPE;
    std::optional<Sex> sex;
    // A sex filter leaves one level; it requires this to be false
    bool require_both_sexes = true;
};

struct CohortSummary {
    Size n_samples = 0;
    Size n_male = 0;
    Size n_female = 0;
};

struct Cohort {
    CountMatrix counts;
    SampleMetadata metadata;
    CohortSummary summary;
};

[[nodiscard]] bool passes(const SampleRecord& record, const CohortFilter& filter) noexcept;

// Column subset in original order with row-aligned metadata.
// Throws DimensionError on misaligned input and EmptyCohortError when no
// sample survives or (with require_both_sexes) only one sex level does.
[[nodiscard]] Cohort filter_cohort(
    const CountMatrix& matrix,
    const SampleMetadata& metadata,
    const CohortFilter& filter
);

} // namespace dex::kernel::cohort
