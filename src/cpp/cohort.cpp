#include "dex/kernel/cohort.hpp"

#include <vector>

namespace dex::kernel::cohort {

bool passes(const SampleRecord& record, const CohortFilter& filter) noexcept {
    if (!record.age.has_value() || !record.sex.has_value()) {
        return false;
    }
    if (record.sample_type != filter.sample_type) {
        return false;
    }

    const Real age = *record.age;
    const bool in_stratum = (filter.stratum == AgeStratum::AtOrBelow)
        ? age <= filter.age_threshold
        : age > filter.age_threshold;
    if (!in_stratum) {
        return false;
    }

    return !filter.sex.has_value() || *record.sex == *filter.sex;
}

Cohort filter_cohort(
    const CountMatrix& matrix,
    const SampleMetadata& metadata,
    const CohortFilter& filter
) {
    validate_alignment(matrix, metadata);

    std::vector<Size> columns;
    Cohort cohort;
    for (Size i = 0; i < metadata.size(); ++i) {
        if (!passes(metadata[i], filter)) continue;
        columns.push_back(i);
        cohort.metadata.push_back(metadata[i]);
        if (*metadata[i].sex == Sex::Male) {
            ++cohort.summary.n_male;
        } else {
            ++cohort.summary.n_female;
        }
    }
    cohort.summary.n_samples = columns.size();

    const std::string where = std::string(" in stratum ") + to_string(filter.stratum);
    if (columns.empty()) {
        throw EmptyCohortError("no sample passes the cohort filter" + where);
    }
    if (filter.require_both_sexes && (cohort.summary.n_male == 0 || cohort.summary.n_female == 0)) {
        throw EmptyCohortError("cohort contains a single sex level (" +
                               std::to_string(cohort.summary.n_male) + " male, " +
                               std::to_string(cohort.summary.n_female) + " female)" + where);
    }

    cohort.counts = matrix.select_columns(columns);
    return cohort;
}

} // namespace dex::kernel::cohort
