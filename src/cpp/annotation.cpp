#include "dex/kernel/annotation.hpp"

#include <utility>

namespace dex::kernel::annotation {

namespace {

// Length of gene_id without one trailing ".<digits>" group; unchanged if absent
Size version_cut(std::string_view gene_id) noexcept {
    const auto dot = gene_id.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == gene_id.size()) {
        return gene_id.size();
    }
    for (Size i = dot + 1; i < gene_id.size(); ++i) {
        const char c = gene_id[i];
        if (c < '0' || c > '9') {
            return gene_id.size();
        }
    }
    return dot;
}

} // namespace

// Chained groups ("X.1.2") are all removed so a second pass is a no-op
std::string strip_version(std::string_view gene_id) {
    for (Size cut = version_cut(gene_id); cut != gene_id.size(); cut = version_cut(gene_id)) {
        gene_id = gene_id.substr(0, cut);
    }
    return std::string(gene_id);
}

GeneAnnotation::GeneAnnotation(const std::vector<AnnotationRecord>& records) {
    names_.reserve(records.size());
    for (const auto& rec : records) {
        insert(rec.gene_id, rec.gene_name);
    }
}

bool GeneAnnotation::insert(std::string_view gene_id, std::string gene_name) {
    return names_.try_emplace(strip_version(gene_id), std::move(gene_name)).second;
}

const std::string* GeneAnnotation::find(std::string_view gene_id) const {
    auto it = names_.find(strip_version(gene_id));
    return it == names_.end() ? nullptr : &it->second;
}

std::vector<AnnotatedResult> annotate(
    const std::vector<TestResult>& results,
    const GeneAnnotation& annotation
) {
    std::vector<AnnotatedResult> out;
    out.reserve(results.size());
    for (const auto& r : results) {
        AnnotatedResult row{r, std::nullopt};
        if (const std::string* name = annotation.find(r.gene_id)) {
            row.gene_name = *name;
        }
        out.push_back(std::move(row));
    }
    return out;
}

std::vector<TestResult> strip_annotation(const std::vector<AnnotatedResult>& annotated) {
    std::vector<TestResult> out;
    out.reserve(annotated.size());
    for (const auto& row : annotated) {
        out.push_back(row.result);
    }
    return out;
}

void normalize_gene_ids(std::vector<TestResult>& results) {
    for (auto& r : results) {
        r.gene_id = strip_version(r.gene_id);
    }
}

Size count_missing(const std::vector<AnnotatedResult>& annotated) noexcept {
    Size n = 0;
    for (const auto& row : annotated) {
        n += !row.gene_name.has_value();
    }
    return n;
}

} // namespace dex::kernel::annotation
