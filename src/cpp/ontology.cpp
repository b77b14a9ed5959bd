#include "dex/data/ontology.hpp"
#include "dex/kernel/annotation.hpp"

#include <algorithm>
#include <utility>

namespace dex {
namespace {

void sort_unique(std::vector<std::string>& ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
}

} // namespace

Ontology Ontology::from_records(const std::vector<OntologyRecord>& records) {
    // Group rows per term first so each term is sorted once
    std::vector<std::string> order;
    std::unordered_map<std::string, std::pair<std::string, std::vector<std::string>>> groups;
    for (const auto& rec : records) {
        auto it = groups.find(rec.term_id);
        if (it == groups.end()) {
            order.push_back(rec.term_id);
            it = groups.emplace(rec.term_id,
                                std::make_pair(rec.term_name, std::vector<std::string>{})).first;
        }
        it->second.second.push_back(rec.gene_id);
    }

    Ontology ontology;
    for (auto& term_id : order) {
        auto& group = groups[term_id];
        ontology.add_term(term_id, std::move(group.first), std::move(group.second));
    }
    return ontology;
}

void Ontology::add_term(std::string term_id, std::string term_name, std::vector<std::string> gene_ids) {
    for (auto& id : gene_ids) {
        id = kernel::annotation::strip_version(id);
    }

    auto it = index_.find(term_id);
    if (it != index_.end()) {
        auto& genes = terms_[it->second].gene_ids;
        genes.insert(genes.end(), gene_ids.begin(), gene_ids.end());
        sort_unique(genes);
        return;
    }

    sort_unique(gene_ids);
    index_.emplace(term_id, terms_.size());
    terms_.push_back(OntologyTerm{std::move(term_id), std::move(term_name), std::move(gene_ids)});
}

const OntologyTerm* Ontology::find(std::string_view term_id) const {
    auto it = index_.find(std::string(term_id));
    return it == index_.end() ? nullptr : &terms_[it->second];
}

std::vector<std::string> Ontology::annotated_genes() const {
    std::vector<std::string> all;
    for (const auto& term : terms_) {
        all.insert(all.end(), term.gene_ids.begin(), term.gene_ids.end());
    }
    sort_unique(all);
    return all;
}

} // namespace dex
