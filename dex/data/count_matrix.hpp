#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"

#include <string>
#include <vector>

// =============================================================================
// FILE: dex/data/count_matrix.hpp
// BRIEF: Dense genes x samples read-count matrix
//
// Row-major storage: counts of gene g are contiguous, so per-gene kernels
// read a single row view. Gene and sample identifiers are opaque keys.
// =============================================================================

namespace dex {

class CountMatrix {
public:
    CountMatrix() = default;

    // counts is row-major with gene_ids.size() * sample_ids.size() entries.
    // Throws DimensionError / ValueError if validate() fails.
    CountMatrix(std::vector<std::string> gene_ids,
                std::vector<std::string> sample_ids,
                std::vector<Count> counts);

    // One inner vector per gene; ragged rows throw DimensionError
    static CountMatrix from_rows(std::vector<std::string> gene_ids,
                                 std::vector<std::string> sample_ids,
                                 const std::vector<std::vector<Count>>& rows);

    [[nodiscard]] Size gene_count() const noexcept { return gene_ids_.size(); }
    [[nodiscard]] Size sample_count() const noexcept { return sample_ids_.size(); }

    [[nodiscard]] Count count(Size gene, Size sample) const noexcept {
        return counts_[gene * sample_ids_.size() + sample];
    }

    [[nodiscard]] Array<const Count> row(Size gene) const noexcept {
        return Array<const Count>(counts_.data() + gene * sample_ids_.size(), sample_ids_.size());
    }

    [[nodiscard]] const std::vector<std::string>& gene_ids() const noexcept { return gene_ids_; }
    [[nodiscard]] const std::vector<std::string>& sample_ids() const noexcept { return sample_ids_; }
    [[nodiscard]] const std::vector<Count>& data() const noexcept { return counts_; }

    // Column subset in the given order
    [[nodiscard]] CountMatrix select_columns(const std::vector<Size>& columns) const;

    // Unique gene ids, unique sample ids, storage size consistent with both
    void validate() const;

private:
    std::vector<std::string> gene_ids_;
    std::vector<std::string> sample_ids_;
    std::vector<Count> counts_;
};

} // namespace dex
