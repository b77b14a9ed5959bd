#pragma once

#include "dex/core/type.hpp"
#include "dex/data/results.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// =============================================================================
// FILE: dex/kernel/annotation.hpp
// BRIEF: Gene identifier normalization and gene-name join
//
// APPLICATIONS:
// - Version-suffix stripping ("ENSG00000123.4" -> "ENSG00000123")
// - Size- and order-preserving left join of gene names onto results
// =============================================================================

namespace dex::kernel::annotation {

// Removes a trailing '.' followed by one or more digits. Idempotent.
[[nodiscard]] std::string strip_version(std::string_view gene_id);

struct AnnotationRecord {
    std::string gene_id;
    std::string gene_name;
};

// Static gene_id -> gene_name mapping keyed by stripped id.
// Many-to-one input is collapsed: the first record for an id wins.
class GeneAnnotation {
public:
    GeneAnnotation() = default;
    explicit GeneAnnotation(const std::vector<AnnotationRecord>& records);

    // Returns false if the stripped id was already present (kept unchanged)
    bool insert(std::string_view gene_id, std::string gene_name);

    // Lookup on the stripped form of gene_id; nullptr when unmapped
    [[nodiscard]] const std::string* find(std::string_view gene_id) const;

    [[nodiscard]] Size size() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

private:
    std::unordered_map<std::string, std::string> names_;
};

// Left join on the stripped id; one output row per input row, same order
[[nodiscard]] std::vector<AnnotatedResult> annotate(
    const std::vector<TestResult>& results,
    const GeneAnnotation& annotation
);

// Drops the joined column; annotate followed by this is the identity
[[nodiscard]] std::vector<TestResult> strip_annotation(const std::vector<AnnotatedResult>& annotated);

// Rewrites every gene_id to its stripped form
void normalize_gene_ids(std::vector<TestResult>& results);

[[nodiscard]] Size count_missing(const std::vector<AnnotatedResult>& annotated) noexcept;

} // namespace dex::kernel::annotation
