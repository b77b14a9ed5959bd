// =============================================================================
// DEX - Negative-Binomial GLM Tests
// =============================================================================
//
// Functions tested:
//   - fit_gene (against the Eigen IRLS oracle)
//   - wald_test (exclusions, calibration, power)
//
// =============================================================================

#include "test.hpp"

#include "dex/kernel/dispersion.hpp"
#include "dex/kernel/glm.hpp"
#include "dex/kernel/size_factors.hpp"

#include <cmath>
#include <vector>

using namespace dex;
using namespace dex::kernel::glm;
using dex::test::precision::Tolerance;
using dex::test::precision::approx_equal;

namespace {

constexpr double LN2 = 0.69314718055994530942;

SexDesign design_of(const std::vector<std::uint8_t>& is_male) {
    SexDesign d;
    d.is_male = is_male;
    for (auto m : is_male) {
        if (m) ++d.n_male; else ++d.n_female;
    }
    return d;
}

std::vector<Real> logs(const std::vector<double>& v) {
    std::vector<Real> out(v.size());
    for (Size i = 0; i < v.size(); ++i) out[i] = std::log(v[i]);
    return out;
}

std::vector<Count> row_of(const CountMatrix& m, Size g) {
    auto r = m.row(g);
    return std::vector<Count>(r.ptr, r.ptr + r.len);
}

} // namespace

DEX_TEST_BEGIN

// =============================================================================
// Single-gene fit
// =============================================================================

DEX_TEST_SUITE(fit_gene)

DEX_TEST_CASE(matches_oracle) {
    test::Random rng(101);
    test::NbParams params;
    params.n_de = 10;
    auto data = test::make_nb_counts(20, 5, 7, params, rng);
    auto log_sf = logs(data.size_factors);

    for (Size g = 0; g < 20; ++g) {
        auto y = row_of(data.counts, g);
        const double alpha = data.alpha[g];

        auto fit = fit_gene(as_array(std::as_const(y)), as_array(std::as_const(log_sf)),
                            as_array(std::as_const(data.is_male)), alpha);
        auto ref = test::oracle::nb_glm(y, data.size_factors, data.is_male, alpha);

        DEX_ASSERT_TRUE(ref.converged);
        DEX_ASSERT_TRUE(fit.state == FitState::Converged);
        DEX_ASSERT_TRUE(approx_equal(fit.beta0, ref.beta(0), Tolerance::iterative()));
        DEX_ASSERT_TRUE(approx_equal(fit.lfc, ref.beta(1) / LN2, Tolerance::iterative()));
        DEX_ASSERT_TRUE(approx_equal(fit.lfc_se, std::sqrt(ref.covariance(1, 1)) / LN2, Tolerance::iterative()));
        DEX_ASSERT_NEAR(fit.lfc / fit.lfc_se, fit.stat, 1e-12);
        DEX_ASSERT_GE(fit.pvalue, 0.0);
        DEX_ASSERT_LE(fit.pvalue, 1.0);
    }
}

DEX_TEST_CASE(unit_factors_give_group_mean_ratio) {
    std::vector<Count> y = {40, 52, 47, 10, 14, 9, 12};
    std::vector<std::uint8_t> male = {1, 1, 1, 0, 0, 0, 0};
    std::vector<Real> log_sf(7, Real(0));
    auto fit = fit_gene(as_array(std::as_const(y)), as_array(std::as_const(log_sf)),
                        as_array(std::as_const(male)), 0.1);

    const double mean_m = (40.0 + 52.0 + 47.0) / 3.0;
    const double mean_f = (10.0 + 14.0 + 9.0 + 12.0) / 4.0;
    DEX_ASSERT_TRUE(fit.state == FitState::Converged);
    DEX_ASSERT_NEAR(std::log2(mean_m / mean_f), fit.lfc, 1e-5);
    DEX_ASSERT_NEAR(std::log(mean_f), fit.beta0, 1e-5);
    DEX_ASSERT_GT(fit.stat, 0.0);
    DEX_ASSERT_GT(fit.iterations, Size(0));
}

DEX_TEST_CASE(swapping_groups_flips_sign) {
    std::vector<Count> y = {40, 52, 47, 10, 14, 9};
    std::vector<std::uint8_t> male = {1, 1, 1, 0, 0, 0};
    std::vector<std::uint8_t> female = {0, 0, 0, 1, 1, 1};
    std::vector<Real> log_sf(6, Real(0));

    auto a = fit_gene(as_array(std::as_const(y)), as_array(std::as_const(log_sf)), as_array(std::as_const(male)), 0.05);
    auto b = fit_gene(as_array(std::as_const(y)), as_array(std::as_const(log_sf)), as_array(std::as_const(female)), 0.05);
    DEX_ASSERT_NEAR(a.lfc, -b.lfc, 1e-6);
    DEX_ASSERT_NEAR(a.lfc_se, b.lfc_se, 1e-6);
    DEX_ASSERT_NEAR(a.pvalue, b.pvalue, 1e-6);
}

DEX_TEST_CASE(iteration_cap_reports_non_converged) {
    std::vector<Count> y = {400, 520, 470, 10, 14, 9};
    std::vector<std::uint8_t> male = {1, 1, 1, 0, 0, 0};
    std::vector<Real> log_sf = {0.1, -0.2, 0.05, 0.3, -0.1, 0.0};

    GlmOptions opts;
    opts.max_iter = 1;
    opts.beta_tol = 0;
    opts.deviance_tol = 0;
    auto fit = fit_gene(as_array(std::as_const(y)), as_array(std::as_const(log_sf)), as_array(std::as_const(male)), 0.1, opts);

    DEX_ASSERT_TRUE(fit.state == FitState::NonConverged);
    DEX_ASSERT_EQ(fit.iterations, Size(1));
    DEX_ASSERT_TRUE(std::isnan(fit.lfc));
    DEX_ASSERT_TRUE(std::isnan(fit.pvalue));
}

DEX_TEST_CASE(degenerate_inputs_are_non_converged) {
    std::vector<Count> y = {4, 5, 7};
    std::vector<Real> log_sf(3, Real(0));
    std::vector<std::uint8_t> all_male = {1, 1, 1};
    std::vector<std::uint8_t> mixed = {1, 0, 0};

    auto single = fit_gene(as_array(std::as_const(y)), as_array(std::as_const(log_sf)), as_array(std::as_const(all_male)), 0.1);
    DEX_ASSERT_TRUE(single.state == FitState::NonConverged);

    auto bad_alpha = fit_gene(as_array(std::as_const(y)), as_array(std::as_const(log_sf)), as_array(std::as_const(mixed)), 0.0);
    DEX_ASSERT_TRUE(bad_alpha.state == FitState::NonConverged);
    DEX_ASSERT_EQ(bad_alpha.iterations, Size(0));
}

DEX_TEST_SUITE_END

// =============================================================================
// Wald test over a matrix
// =============================================================================

DEX_TEST_SUITE(wald_test)

DEX_TEST_CASE(excluded_genes_keep_na) {
    auto m = CountMatrix::from_rows(
        {"g1", "g2", "g3", "g4", "g5"},
        {"a", "b", "c", "d", "e", "f"},
        {{0, 0, 0, 0, 0, 0},
         {30, 41, 35, 12, 9, 15},
         {5, 5, 5, 5, 5, 5},
         {120, 90, 140, 100, 130, 80},
         {8, 3, 11, 20, 25, 17}});
    auto design = design_of({1, 1, 1, 0, 0, 0});
    auto sf = dex::kernel::size_factors::estimate_size_factors(m, SizeFactorMethod::PosCounts);
    auto disp = dex::kernel::dispersion::estimate_dispersions(m, sf, design);
    auto results = wald_test(m, sf, design, disp);

    DEX_ASSERT_EQ(results.size(), Size(5));
    DEX_ASSERT_STR_EQ("g1", results[0].gene_id);
    DEX_ASSERT_TRUE(results[0].state == FitState::Excluded);
    DEX_ASSERT_TRUE(results[0].exclusion == ExclusionReason::AllZero);
    DEX_ASSERT_FALSE(results[0].pvalue.has_value());
    DEX_ASSERT_FALSE(results[0].log2_fold_change.has_value());

    DEX_ASSERT_TRUE(results[2].state == FitState::Excluded);
    DEX_ASSERT_TRUE(results[2].exclusion == ExclusionReason::ZeroVariance);
    DEX_ASSERT_GT(results[2].base_mean, 0.0);

    for (Size g : {Size(1), Size(3), Size(4)}) {
        DEX_ASSERT_TRUE(results[g].state == FitState::Converged);
        DEX_ASSERT_TRUE(results[g].pvalue.has_value());
        DEX_ASSERT_FALSE(results[g].padj.has_value());
    }
    DEX_ASSERT_GT(*results[1].log2_fold_change, 0.0);
    DEX_ASSERT_LT(*results[4].log2_fold_change, 0.0);
}

DEX_TEST_CASE(dimension_checks) {
    auto m = CountMatrix::from_rows({"g1"}, {"a", "b", "c"}, {{1, 2, 3}});
    SizeFactors sf;
    sf.sample_ids = m.sample_ids();
    sf.values = {1, 1, 1};
    DispersionEstimate disp;
    DEX_ASSERT_THROWS((void)wald_test(m, sf, design_of({1, 0, 0}), disp), DimensionError);
}

DEX_TEST_CASE(null_pvalues_are_calibrated) {
    test::Random rng(211);
    auto data = test::make_nb_counts(3000, 6, 6, {}, rng);
    auto design = design_of(data.is_male);
    auto sf = dex::kernel::size_factors::estimate_size_factors(data.counts);
    auto disp = dex::kernel::dispersion::estimate_dispersions(data.counts, sf, design);
    auto results = wald_test(data.counts, sf, design, disp);

    Size tested = 0, hits = 0;
    for (const auto& r : results) {
        if (!r.pvalue) continue;
        ++tested;
        hits += (*r.pvalue < 0.05);
    }
    DEX_ASSERT_GT(tested, Size(2900));
    const double rate = static_cast<double>(hits) / static_cast<double>(tested);
    DEX_ASSERT_GT(rate, 0.01);
    DEX_ASSERT_LT(rate, 0.10);
}

DEX_TEST_CASE(detects_planted_effects) {
    test::Random rng(307);
    test::NbParams params;
    params.n_de = 200;
    params.de_lfc = 2.0;
    auto data = test::make_nb_counts(1500, 6, 6, params, rng);
    auto design = design_of(data.is_male);
    auto sf = dex::kernel::size_factors::estimate_size_factors(data.counts);
    auto disp = dex::kernel::dispersion::estimate_dispersions(data.counts, sf, design);
    auto results = wald_test(data.counts, sf, design, disp);

    Size detected = 0, sign_ok = 0;
    for (Size g = 0; g < params.n_de; ++g) {
        const auto& r = results[g];
        if (!r.pvalue) continue;
        detected += (*r.pvalue < 0.01);
        sign_ok += ((*r.log2_fold_change > 0) == (data.lfc[g] > 0));
    }
    DEX_ASSERT_GT(detected, Size(180));
    DEX_ASSERT_GT(sign_ok, Size(195));
}

DEX_TEST_SUITE_END

DEX_TEST_END

DEX_TEST_MAIN()
