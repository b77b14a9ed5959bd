#pragma once

#include "dex/core/log.hpp"
#include "dex/data/results.hpp"
#include "dex/kernel/cohort.hpp"
#include "dex/kernel/size_factors.hpp"
#include "dex/kernel/dispersion.hpp"
#include "dex/kernel/glm.hpp"
#include "dex/kernel/multiple_testing.hpp"
#include "dex/kernel/classify.hpp"
#include "dex/kernel/enrichment.hpp"

#include <cstddef>
#include <optional>

// =============================================================================
// FILE: dex/pipeline/config.hpp
// BRIEF: Explicit run configuration; defaults come from the kernel configs
// =============================================================================

namespace dex::pipeline {

struct PipelineConfig {
    // stratum is overridden by run_strata
    kernel::cohort::CohortFilter cohort;
    kernel::size_factors::Method size_factor_method = kernel::size_factors::Method::Ratio;
    kernel::dispersion::DispersionOptions dispersion;
    kernel::glm::GlmOptions glm;
    kernel::multiple_testing::AdjustMethod adjust = kernel::multiple_testing::AdjustMethod::BenjaminiHochberg;
    kernel::classify::ClassifierThresholds classifier;

    // Up / down list selection for enrichment
    Real flagged_padj = kernel::multiple_testing::config::DEFAULT_FDR_LEVEL;
    Real flagged_lfc = Real(0);
    kernel::enrichment::EnrichmentOptions enrichment;

    // 0 leaves the backend default
    std::size_t num_threads = 0;

    // Applied by the entry point when set; unset keeps the current logger
    std::optional<log::LogConfig> logging;
};

} // namespace dex::pipeline
