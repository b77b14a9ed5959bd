#pragma once

#include "dex/core/type.hpp"
#include "dex/core/algo.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// =============================================================================
// FILE: dex/data/ontology.hpp
// BRIEF: Static gene-set collection (term -> sorted unique gene ids)
//
// Gene ids are stored version-stripped so they join with stripped result ids.
// =============================================================================

namespace dex {

struct OntologyTerm {
    std::string term_id;
    std::string term_name;
    std::vector<std::string> gene_ids;   // sorted, unique

    [[nodiscard]] bool contains(const std::string& gene_id) const noexcept {
        return algo::contains_sorted(gene_ids.data(), gene_ids.data() + gene_ids.size(), gene_id);
    }
};

// One (term, gene) membership row, as in long-format GO tables
struct OntologyRecord {
    std::string term_id;
    std::string term_name;
    std::string gene_id;
};

class Ontology {
public:
    Ontology() = default;

    static Ontology from_records(const std::vector<OntologyRecord>& records);

    // Merges into an existing term with the same id (first name wins)
    void add_term(std::string term_id, std::string term_name, std::vector<std::string> gene_ids);

    [[nodiscard]] Size size() const noexcept { return terms_.size(); }
    [[nodiscard]] bool empty() const noexcept { return terms_.empty(); }
    [[nodiscard]] const std::vector<OntologyTerm>& terms() const noexcept { return terms_; }

    [[nodiscard]] const OntologyTerm* find(std::string_view term_id) const;

    // Sorted unique union of all member genes
    [[nodiscard]] std::vector<std::string> annotated_genes() const;

private:
    std::vector<OntologyTerm> terms_;
    std::unordered_map<std::string, Size> index_;
};

} // namespace dex
