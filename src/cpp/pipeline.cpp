#include "dex/pipeline/pipeline.hpp"

#include "dex/core/log.hpp"
#include "dex/data/design.hpp"
#include "dex/kernel/classify.hpp"
#include "dex/kernel/dispersion.hpp"
#include "dex/kernel/enrichment.hpp"
#include "dex/kernel/glm.hpp"
#include "dex/kernel/multiple_testing.hpp"
#include "dex/kernel/size_factors.hpp"
#include "dex/threading/scheduler.hpp"

#include <cstdint>
#include <utility>

namespace dex::pipeline {
namespace {

using dex::log::BoolField;
using dex::log::IntField;
using dex::log::StringField;

std::int64_t as_int(Size v) {
    return static_cast<std::int64_t>(v);
}

void adjust_pvalues(std::vector<TestResult>& results, kernel::multiple_testing::AdjustMethod method) {
    std::vector<std::optional<Real>> p;
    p.reserve(results.size());
    for (const auto& r : results) {
        p.push_back(r.pvalue);
    }
    auto padj = kernel::multiple_testing::adjust(p, method);
    for (Size g = 0; g < results.size(); ++g) {
        results[g].padj = padj[g];
    }
}

void log_report(const RunReport& report) {
    const char* stratum = kernel::cohort::to_string(report.stratum);
    DEX_LOG_INFO("stratum report", {
        StringField("stratum", stratum),
        IntField("samples", as_int(report.samples)),
        IntField("male", as_int(report.male_samples)),
        IntField("female", as_int(report.female_samples)),
        IntField("genes", as_int(report.genes)),
        IntField("tested", as_int(report.tested)),
        IntField("all_zero", as_int(report.excluded_all_zero)),
        IntField("zero_variance", as_int(report.excluded_zero_variance)),
        IntField("low_count", as_int(report.excluded_low_count)),
        IntField("non_converged", as_int(report.non_converged)),
        IntField("label_male", as_int(report.label_male)),
        IntField("label_female", as_int(report.label_female)),
        IntField("missing_annotation", as_int(report.missing_annotation)),
        IntField("dispersion_outliers", as_int(report.dispersion_outliers)),
        BoolField("trend_degraded", report.trend_degraded),
    });
}

std::vector<EnrichmentResult> enrich_direction(
    const std::vector<TestResult>& results,
    const std::vector<std::string>& universe,
    kernel::enrichment::Direction direction,
    const kernel::annotation::GeneAnnotation& annotation,
    const Ontology& ontology,
    const PipelineConfig& config,
    const char* stratum
) {
    auto genes = kernel::enrichment::select_flagged(results, direction, config.flagged_padj, config.flagged_lfc);
    if (genes.empty()) {
        DEX_LOG_DEBUG("empty enrichment input", {
            StringField("stratum", stratum),
            StringField("direction", kernel::enrichment::to_string(direction)),
        });
        return {};
    }

    auto terms = kernel::enrichment::over_representation(genes, universe, ontology, config.enrichment, &annotation);
    DEX_LOG_INFO("enrichment", {
        StringField("stratum", stratum),
        StringField("direction", kernel::enrichment::to_string(direction)),
        IntField("genes", as_int(genes.size())),
        IntField("terms", as_int(terms.size())),
    });
    return terms;
}

StratumResult run_one_stratum(
    const CountMatrix& matrix,
    const SampleMetadata& metadata,
    kernel::cohort::AgeStratum stratum,
    const kernel::annotation::GeneAnnotation& annotation,
    const Ontology& ontology,
    const PipelineConfig& config
) {
    DEX_CHECK_RANGE(config.flagged_padj, Real(0), Real(1), "run_stratum: flagged_padj must lie in [0, 1]");
    DEX_CHECK_RANGE(config.enrichment.pvalue_cutoff, Real(0), Real(1), "run_stratum: pvalue_cutoff must lie in [0, 1]");
    DEX_CHECK_RANGE(config.enrichment.padj_cutoff, Real(0), Real(1), "run_stratum: padj_cutoff must lie in [0, 1]");

    if (config.num_threads > 0) {
        threading::Scheduler::set_num_threads(config.num_threads);
    }

    const char* stratum_name = kernel::cohort::to_string(stratum);
    StratumResult out;
    RunReport& report = out.report;
    report.stratum = stratum;

    kernel::cohort::CohortFilter filter = config.cohort;
    filter.stratum = stratum;
    auto cohort = kernel::cohort::filter_cohort(matrix, metadata, filter);
    out.cohort = cohort.summary;
    report.samples = cohort.summary.n_samples;
    report.male_samples = cohort.summary.n_male;
    report.female_samples = cohort.summary.n_female;
    report.genes = cohort.counts.gene_count();

    DEX_LOG_INFO("cohort selected", {
        StringField("stratum", stratum_name),
        IntField("samples", as_int(report.samples)),
        IntField("male", as_int(report.male_samples)),
        IntField("female", as_int(report.female_samples)),
    });

    const SexDesign design = make_sex_design(cohort.metadata);

    out.size_factors = kernel::size_factors::estimate_size_factors(cohort.counts, config.size_factor_method);

    out.dispersion = kernel::dispersion::estimate_dispersions(cohort.counts, out.size_factors, design, config.dispersion);
    report.excluded_all_zero = out.dispersion.excluded_count(ExclusionReason::AllZero);
    report.excluded_zero_variance = out.dispersion.excluded_count(ExclusionReason::ZeroVariance);
    report.excluded_low_count = out.dispersion.excluded_count(ExclusionReason::LowCount);
    report.dispersion_outliers = out.dispersion.outlier_count();
    report.trend_degraded = out.dispersion.fit.degraded;
    if (report.trend_degraded && report.excluded_all_zero + report.excluded_zero_variance +
                                     report.excluded_low_count == report.genes) {
        DEX_LOG_WARN("no gene has an estimable dispersion", {
            StringField("stratum", stratum_name),
            IntField("genes", as_int(report.genes)),
        });
    } else if (report.trend_degraded) {
        DEX_LOG_WARN("dispersion trend did not converge, using constant median dispersion", {
            StringField("stratum", stratum_name),
            dex::log::RealField("dispersion", out.dispersion.fit.constant),
        });
    }

    auto results = kernel::glm::wald_test(cohort.counts, out.size_factors, design, out.dispersion, config.glm);
    for (const auto& r : results) {
        report.non_converged += (r.state == FitState::NonConverged);
        report.tested += r.pvalue.has_value();
    }
    if (report.non_converged > 0) {
        DEX_LOG_WARN("genes did not converge", {
            StringField("stratum", stratum_name),
            IntField("genes", as_int(report.non_converged)),
        });
    }

    adjust_pvalues(results, config.adjust);
    kernel::classify::classify_results(results, config.classifier);
    auto labels = kernel::classify::count_labels(results);
    report.label_male = labels.male;
    report.label_female = labels.female;
    report.label_no = labels.no;

    kernel::annotation::normalize_gene_ids(results);

    std::vector<std::string> universe;
    universe.reserve(report.tested);
    for (const auto& r : results) {
        if (r.pvalue.has_value()) universe.push_back(r.gene_id);
    }
    DEX_ASSERT(universe.size() == report.tested, "run_stratum: universe does not match tested genes");

    out.enrichment_up = enrich_direction(results, universe, kernel::enrichment::Direction::Up,
                                         annotation, ontology, config, stratum_name);
    out.enrichment_down = enrich_direction(results, universe, kernel::enrichment::Direction::Down,
                                           annotation, ontology, config, stratum_name);
    report.enriched_up = out.enrichment_up.size();
    report.enriched_down = out.enrichment_down.size();

    out.results = kernel::annotation::annotate(results, annotation);
    report.missing_annotation = kernel::annotation::count_missing(out.results);

    log_report(report);
    return out;
}

} // namespace

StratumResult run_stratum(
    const CountMatrix& matrix,
    const SampleMetadata& metadata,
    kernel::cohort::AgeStratum stratum,
    const kernel::annotation::GeneAnnotation& annotation,
    const Ontology& ontology,
    const PipelineConfig& config
) {
    if (config.logging) {
        dex::log::initialize(*config.logging);
    }
    return run_one_stratum(matrix, metadata, stratum, annotation, ontology, config);
}

std::vector<StratumOutcome> run_strata(
    const CountMatrix& matrix,
    const SampleMetadata& metadata,
    const kernel::annotation::GeneAnnotation& annotation,
    const Ontology& ontology,
    const PipelineConfig& config
) {
    if (config.logging) {
        dex::log::initialize(*config.logging);
    }

    std::vector<StratumOutcome> outcomes;
    for (auto stratum : {kernel::cohort::AgeStratum::AtOrBelow, kernel::cohort::AgeStratum::Above}) {
        StratumOutcome outcome;
        outcome.stratum = stratum;
        try {
            outcome.result = run_one_stratum(matrix, metadata, stratum, annotation, ontology, config);
        } catch (const Exception& e) {
            outcome.error_code = e.code();
            outcome.error_message = e.message();
            DEX_LOG_ERROR("stratum failed", {
                StringField("stratum", kernel::cohort::to_string(stratum)),
                StringField("code", error_code_name(e.code())),
                StringField("error", e.message()),
            });
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

} // namespace dex::pipeline
