// =============================================================================
// DEX - Cohort Filter Tests
// =============================================================================
//
// Functions tested:
//   - passes
//   - filter_cohort
//
// =============================================================================

#include "test.hpp"

#include "dex/kernel/cohort.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace dex;
using namespace dex::kernel::cohort;
using dex::test::make_record;

namespace {

// Six samples: ages 30, 50, 51, 70, unknown, 45
CountMatrix six_sample_matrix() {
    return CountMatrix::from_rows(
        {"g1", "g2"},
        {"s1", "s2", "s3", "s4", "s5", "s6"},
        {{1, 2, 3, 4, 5, 6}, {10, 20, 30, 40, 50, 60}});
}

SampleMetadata six_sample_metadata() {
    return {
        make_record("s1", 30, Sex::Male),
        make_record("s2", 50, Sex::Female),
        make_record("s3", 51, Sex::Male),
        make_record("s4", 70, Sex::Female),
        make_record("s5", std::nullopt, Sex::Male),
        make_record("s6", 45, Sex::Female, "Primary"),
    };
}

} // namespace

DEX_TEST_BEGIN

DEX_TEST_SUITE(passes)

DEX_TEST_CASE(threshold_is_inclusive_below) {
    CohortFilter below;
    below.stratum = AgeStratum::AtOrBelow;
    CohortFilter above;
    above.stratum = AgeStratum::Above;

    auto at = make_record("x", 50, Sex::Male);
    DEX_ASSERT_TRUE(passes(at, below));
    DEX_ASSERT_FALSE(passes(at, above));

    auto over = make_record("y", Real(50.5), Sex::Male);
    DEX_ASSERT_FALSE(passes(over, below));
    DEX_ASSERT_TRUE(passes(over, above));
}

DEX_TEST_CASE(missing_fields_fail_both_strata) {
    CohortFilter below;
    CohortFilter above;
    above.stratum = AgeStratum::Above;

    auto no_age = make_record("x", std::nullopt, Sex::Male);
    auto no_sex = make_record("y", 30, std::nullopt);
    DEX_ASSERT_FALSE(passes(no_age, below));
    DEX_ASSERT_FALSE(passes(no_age, above));
    DEX_ASSERT_FALSE(passes(no_sex, below));
}

DEX_TEST_CASE(sample_type_is_exact) {
    CohortFilter f;
    DEX_ASSERT_FALSE(passes(make_record("x", 30, Sex::Male, "Primary"), f));
    DEX_ASSERT_FALSE(passes(make_record("x", 30, Sex::Male, "metastatic"), f));
    DEX_ASSERT_TRUE(passes(make_record("x", 30, Sex::Male, "Metastatic"), f));
}

DEX_TEST_CASE(optional_sex_filter) {
    CohortFilter f;
    f.sex = Sex::Female;
    DEX_ASSERT_FALSE(passes(make_record("x", 30, Sex::Male), f));
    DEX_ASSERT_TRUE(passes(make_record("x", 30, Sex::Female), f));
}

DEX_TEST_SUITE_END

DEX_TEST_SUITE(filter_cohort)

DEX_TEST_CASE(strata_partition_eligible_samples) {
    auto m = six_sample_matrix();
    auto meta = six_sample_metadata();

    CohortFilter f;
    f.stratum = AgeStratum::AtOrBelow;
    auto young = filter_cohort(m, meta, f);
    f.stratum = AgeStratum::Above;
    auto old = filter_cohort(m, meta, f);

    DEX_ASSERT_EQ(young.summary.n_samples, Size(2));
    DEX_ASSERT_EQ(old.summary.n_samples, Size(2));
    DEX_ASSERT_STR_EQ("s1", young.counts.sample_ids()[0]);
    DEX_ASSERT_STR_EQ("s2", young.counts.sample_ids()[1]);
    DEX_ASSERT_STR_EQ("s3", old.counts.sample_ids()[0]);
    DEX_ASSERT_STR_EQ("s4", old.counts.sample_ids()[1]);

    // Columns and metadata stay aligned
    DEX_ASSERT_EQ(old.counts.count(1, 1), Count(40));
    DEX_ASSERT_STR_EQ("s4", old.metadata[1].sample_id);
    DEX_ASSERT_NO_THROW(validate_alignment(old.counts, old.metadata));

    // Genes are never dropped by the filter
    DEX_ASSERT_EQ(young.counts.gene_count(), m.gene_count());
}

DEX_TEST_CASE(summary_counts_sexes) {
    auto cohort = filter_cohort(six_sample_matrix(), six_sample_metadata(), CohortFilter{});
    DEX_ASSERT_EQ(cohort.summary.n_male, Size(1));
    DEX_ASSERT_EQ(cohort.summary.n_female, Size(1));
}

DEX_TEST_CASE(empty_cohort_raises) {
    auto m = six_sample_matrix();
    auto meta = six_sample_metadata();
    CohortFilter f;
    f.sample_type = "Solid Tissue Normal";
    DEX_ASSERT_THROWS((void)filter_cohort(m, meta, f), EmptyCohortError);

    try {
        (void)filter_cohort(m, meta, f);
        DEX_FAIL("expected EmptyCohortError");
    } catch (const EmptyCohortError& e) {
        DEX_ASSERT_TRUE(e.code() == ErrorCode::EMPTY_COHORT);
    }
}

DEX_TEST_CASE(single_sex_raises_unless_allowed) {
    auto m = six_sample_matrix();
    auto meta = six_sample_metadata();

    CohortFilter f;
    f.sex = Sex::Male;
    DEX_ASSERT_THROWS((void)filter_cohort(m, meta, f), EmptyCohortError);

    f.require_both_sexes = false;
    auto males = filter_cohort(m, meta, f);
    DEX_ASSERT_EQ(males.summary.n_samples, Size(1));
    DEX_ASSERT_EQ(males.summary.n_female, Size(0));
}

DEX_TEST_CASE(misaligned_metadata_raises) {
    auto m = six_sample_matrix();
    auto meta = six_sample_metadata();
    meta.pop_back();
    DEX_ASSERT_THROWS((void)filter_cohort(m, meta, CohortFilter{}), DimensionError);
}

DEX_TEST_SUITE_END

DEX_TEST_END

DEX_TEST_MAIN()
