#include "dex/data/count_matrix.hpp"

#include <unordered_set>
#include <utility>

namespace dex {
namespace {

void check_unique(const std::vector<std::string>& ids, const char* what) {
    std::unordered_set<std::string> seen;
    seen.reserve(ids.size());
    for (const auto& id : ids) {
        if (!seen.insert(id).second) {
            throw ValueError(std::string("CountMatrix: duplicate ") + what + " id '" + id + "'");
        }
    }
}

} // namespace

CountMatrix::CountMatrix(std::vector<std::string> gene_ids,
                         std::vector<std::string> sample_ids,
                         std::vector<Count> counts)
    : gene_ids_(std::move(gene_ids)),
      sample_ids_(std::move(sample_ids)),
      counts_(std::move(counts)) {
    validate();
}

CountMatrix CountMatrix::from_rows(std::vector<std::string> gene_ids,
                                   std::vector<std::string> sample_ids,
                                   const std::vector<std::vector<Count>>& rows) {
    DEX_CHECK_DIM(rows.size() == gene_ids.size(),
                  "CountMatrix: row count does not match gene id count");

    const Size n_samples = sample_ids.size();
    std::vector<Count> counts;
    counts.reserve(rows.size() * n_samples);
    for (Size g = 0; g < rows.size(); ++g) {
        if (DEX_UNLIKELY(rows[g].size() != n_samples)) {
            throw DimensionError("CountMatrix: row for gene '" + gene_ids[g] +
                                 "' has " + std::to_string(rows[g].size()) +
                                 " entries, expected " + std::to_string(n_samples));
        }
        counts.insert(counts.end(), rows[g].begin(), rows[g].end());
    }
    return CountMatrix(std::move(gene_ids), std::move(sample_ids), std::move(counts));
}

CountMatrix CountMatrix::select_columns(const std::vector<Size>& columns) const {
    const Size n_in = sample_ids_.size();
    const Size n_out = columns.size();

    std::vector<std::string> sample_ids;
    sample_ids.reserve(n_out);
    for (Size c : columns) {
        DEX_CHECK_BOUNDS(c, n_in, "CountMatrix::select_columns: column out of range");
        sample_ids.push_back(sample_ids_[c]);
    }

    std::vector<Count> counts(gene_ids_.size() * n_out);
    for (Size g = 0; g < gene_ids_.size(); ++g) {
        const Count* src = counts_.data() + g * n_in;
        Count* dst = counts.data() + g * n_out;
        for (Size j = 0; j < n_out; ++j) {
            dst[j] = src[columns[j]];
        }
    }

    return CountMatrix(gene_ids_, std::move(sample_ids), std::move(counts));
}

void CountMatrix::validate() const {
    DEX_CHECK_DIM(counts_.size() == gene_ids_.size() * sample_ids_.size(),
                  "CountMatrix: storage size does not match genes x samples");
    check_unique(gene_ids_, "gene");
    check_unique(sample_ids_, "sample");
}

} // namespace dex
