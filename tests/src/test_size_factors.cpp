// =============================================================================
// DEX - Size Factor Tests
// =============================================================================
//
// Functions tested:
//   - estimate_size_factors (Ratio, PosCounts)
//   - normalized_counts
//   - base_means
//
// =============================================================================

#include "test.hpp"

#include "dex/kernel/size_factors.hpp"

#include <cmath>
#include <vector>

using namespace dex;
using namespace dex::kernel::size_factors;
using dex::test::precision::Tolerance;

namespace {

CountMatrix scaled_copy(const CountMatrix& m, Size sample, Count factor) {
    std::vector<Count> data = m.data();
    const Size n = m.sample_count();
    for (Size g = 0; g < m.gene_count(); ++g) {
        data[g * n + sample] *= factor;
    }
    return CountMatrix(m.gene_ids(), m.sample_ids(), std::move(data));
}

double geometric_mean(const std::vector<Real>& v) {
    double acc = 0.0;
    for (Real x : v) acc += std::log(static_cast<double>(x));
    return std::exp(acc / static_cast<double>(v.size()));
}

} // namespace

DEX_TEST_BEGIN

DEX_TEST_SUITE(ratio)

DEX_TEST_CASE(matches_oracle) {
    test::Random rng(7);
    test::NbParams params;
    params.min_mean = 50;
    auto data = test::make_nb_counts(300, 5, 5, params, rng);

    auto sf = estimate_size_factors(data.counts, Method::Ratio);
    auto expected = test::oracle::median_of_ratios(data.counts);

    DEX_ASSERT_EQ(sf.values.size(), expected.size());
    DEX_ASSERT_TRUE(test::precision::vectors_equal(sf.values, expected, Tolerance::normal()));
    DEX_ASSERT_TRUE(sf.method == Method::Ratio);
    DEX_ASSERT_STR_EQ(data.counts.sample_ids()[3], sf.sample_ids[3]);
}

DEX_TEST_CASE(geometric_mean_is_one) {
    test::Random rng(11);
    auto data = test::make_nb_counts(200, 4, 4, {}, rng);
    auto sf = estimate_size_factors(data.counts);
    DEX_ASSERT_NEAR(1.0, geometric_mean(sf.values), 1e-12);
    for (Real v : sf.values) {
        DEX_ASSERT_GT(v, 0.0);
    }
}

DEX_TEST_CASE(tracks_true_depth) {
    test::Random rng(3);
    test::NbParams params;
    params.min_mean = 100;
    params.asymptotic = 0.01;
    auto data = test::make_nb_counts(2000, 4, 4, params, rng);
    auto sf = estimate_size_factors(data.counts);

    // True factors rescaled to geometric mean 1
    double g = 1.0;
    {
        double acc = 0.0;
        for (double v : data.size_factors) acc += std::log(v);
        g = std::exp(acc / static_cast<double>(data.size_factors.size()));
    }
    for (Size s = 0; s < sf.values.size(); ++s) {
        DEX_ASSERT_NEAR(data.size_factors[s] / g, sf.values[s], 0.05);
    }
}

DEX_TEST_CASE(rescaling_one_sample_scales_its_ratio) {
    test::Random rng(5);
    auto data = test::make_nb_counts(150, 3, 3, {}, rng);
    auto before = estimate_size_factors(data.counts);
    auto after = estimate_size_factors(scaled_copy(data.counts, 2, 4));

    // Relative to any untouched sample the factor grows by exactly c
    const double ratio_before = before.values[2] / before.values[0];
    const double ratio_after = after.values[2] / after.values[0];
    DEX_ASSERT_NEAR(4.0, ratio_after / ratio_before, 1e-9);

    // Untouched samples keep their mutual ratios
    DEX_ASSERT_NEAR(before.values[1] / before.values[0], after.values[1] / after.values[0], 1e-9);
}

DEX_TEST_CASE(all_genes_with_zero_is_domain_error) {
    auto m = CountMatrix::from_rows({"g1", "g2"}, {"a", "b", "c"}, {{0, 5, 6}, {3, 0, 2}});
    DEX_ASSERT_THROWS((void)estimate_size_factors(m, Method::Ratio), DomainError);
    // The positive-count variant still works
    DEX_ASSERT_NO_THROW((void)estimate_size_factors(m, Method::PosCounts));
}

DEX_TEST_SUITE_END

DEX_TEST_SUITE(pos_counts)

DEX_TEST_CASE(equals_ratio_without_zeros) {
    auto m = CountMatrix::from_rows({"g1", "g2", "g3"}, {"a", "b", "c"},
                                    {{10, 20, 30}, {5, 9, 16}, {100, 180, 330}});
    auto r = estimate_size_factors(m, Method::Ratio);
    auto p = estimate_size_factors(m, Method::PosCounts);
    DEX_ASSERT_TRUE(test::precision::vectors_equal(r.values, p.values, Tolerance::strict()));
}

DEX_TEST_CASE(sample_without_reference_gene_is_domain_error) {
    auto m = CountMatrix::from_rows({"g1", "g2"}, {"a", "b"}, {{0, 5}, {0, 7}});
    DEX_ASSERT_THROWS((void)estimate_size_factors(m, Method::PosCounts), DomainError);
}

DEX_TEST_SUITE_END

DEX_TEST_SUITE(normalization)

DEX_TEST_CASE(normalized_counts_divide_by_factor) {
    auto m = CountMatrix::from_rows({"g1", "g2"}, {"a", "b"}, {{10, 40}, {6, 24}});
    std::vector<Real> f = {0.5, 2.0};
    std::vector<Real> out(4);
    normalized_counts(m, as_array(std::as_const(f)), as_array(out));
    DEX_ASSERT_NEAR(20.0, out[0], 1e-12);
    DEX_ASSERT_NEAR(20.0, out[1], 1e-12);
    DEX_ASSERT_NEAR(12.0, out[2], 1e-12);

    auto means = base_means(m, as_array(std::as_const(f)));
    DEX_ASSERT_NEAR(20.0, means[0], 1e-12);
    DEX_ASSERT_NEAR(12.0, means[1], 1e-12);
}

DEX_TEST_CASE(size_mismatch_rejected) {
    auto m = CountMatrix::from_rows({"g1"}, {"a", "b"}, {{1, 2}});
    std::vector<Real> f(3);
    DEX_ASSERT_THROWS(estimate_size_factors(m, as_array(f)), DimensionError);
}

DEX_TEST_SUITE_END

DEX_TEST_END

DEX_TEST_MAIN()
