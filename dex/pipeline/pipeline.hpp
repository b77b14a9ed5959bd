#pragma once

#include "dex/core/error.hpp"
#include "dex/data/count_matrix.hpp"
#include "dex/data/sample_metadata.hpp"
#include "dex/data/ontology.hpp"
#include "dex/data/results.hpp"
#include "dex/kernel/annotation.hpp"
#include "dex/kernel/cohort.hpp"
#include "dex/pipeline/config.hpp"

#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: dex/pipeline/pipeline.hpp
// BRIEF: One-stratum analysis and the two-stratum driver
//
// Stage order per stratum:
//   cohort -> size factors -> dispersion -> GLM / Wald -> adjustment ->
//   classification -> id normalization + annotation -> up/down enrichment
//
// Everything a stratum computes is owned by its StratumResult.
// =============================================================================

namespace dex::pipeline {

// Per-stratum counts that make silent data loss visible
struct RunReport {
    kernel::cohort::AgeStratum stratum = kernel::cohort::AgeStratum::AtOrBelow;
    Size samples = 0;
    Size male_samples = 0;
    Size female_samples = 0;
    Size genes = 0;
    Size excluded_all_zero = 0;
    Size excluded_zero_variance = 0;
    Size excluded_low_count = 0;
    Size non_converged = 0;
    Size tested = 0;
    Size label_male = 0;
    Size label_female = 0;
    Size label_no = 0;
    Size missing_annotation = 0;
    Size dispersion_outliers = 0;
    bool trend_degraded = false;
    Size enriched_up = 0;
    Size enriched_down = 0;
};

struct StratumResult {
    kernel::cohort::CohortSummary cohort;
    SizeFactors size_factors;
    DispersionEstimate dispersion;
    std::vector<AnnotatedResult> results;
    std::vector<EnrichmentResult> enrichment_up;
    std::vector<EnrichmentResult> enrichment_down;
    RunReport report;
};

// Either a result or the error that aborted the stratum
struct StratumOutcome {
    kernel::cohort::AgeStratum stratum = kernel::cohort::AgeStratum::AtOrBelow;
    std::optional<StratumResult> result;
    std::optional<ErrorCode> error_code;
    std::string error_message;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }
};

// Runs one stratum. Throws EmptyCohortError, DimensionError, DomainError.
[[nodiscard]] StratumResult run_stratum(
    const CountMatrix& matrix,
    const SampleMetadata& metadata,
    kernel::cohort::AgeStratum stratum,
    const kernel::annotation::GeneAnnotation& annotation,
    const Ontology& ontology,
    const PipelineConfig& config = {}
);

// Runs AtOrBelow then Above; a dex::Exception in one stratum is recorded
// in its outcome and does not stop the other.
[[nodiscard]] std::vector<StratumOutcome> run_strata(
    const CountMatrix& matrix,
    const SampleMetadata& metadata,
    const kernel::annotation::GeneAnnotation& annotation,
    const Ontology& ontology,
    const PipelineConfig& config = {}
);

} // namespace dex::pipeline
