#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/core/algo.hpp"
#include "dex/data/ontology.hpp"
#include "dex/data/results.hpp"
#include "dex/kernel/annotation.hpp"
#include "dex/kernel/multiple_testing.hpp"
#include "dex/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

// =============================================================================
// FILE: dex/kernel/enrichment.hpp
// BRIEF: Ontology over-representation analysis (hypergeometric test)
//
// For a term with n universe genes, k of which are in the list:
//   p = P(X >= k),  X ~ Hypergeometric(N universe genes, K list genes, n draws)
// Terms are corrected together with the same adjustment as genes.
// =============================================================================

namespace dex::kernel::enrichment {

namespace config {
    constexpr Size MIN_TERM_SIZE = 10;
    constexpr Size MAX_TERM_SIZE = 500;
    constexpr Real NO_CUTOFF = Real(1.0);
    // Tail summation stops once terms fall below this fraction of the sum
    constexpr double TAIL_EPS = 1e-17;
}

struct EnrichmentOptions {
    Size min_term_size = config::MIN_TERM_SIZE;
    Size max_term_size = config::MAX_TERM_SIZE;
    bool restrict_universe_to_annotated = false;
    Real pvalue_cutoff = config::NO_CUTOFF;
    Real padj_cutoff = config::NO_CUTOFF;
    multiple_testing::AdjustMethod adjust = multiple_testing::AdjustMethod::BenjaminiHochberg;
};

// =============================================================================
// Hypergeometric Tail
// =============================================================================

namespace detail {

DEX_FORCE_INLINE double log_choose(double n, double k) {
    return std::lgamma(n + 1.0) - std::lgamma(k + 1.0) - std::lgamma(n - k + 1.0);
}

} // namespace detail

// P(X >= k) for X ~ Hypergeometric(N, K, n). Starts from the log-gamma pmf
// at k and walks the upper tail with the ratio
//   pmf(x+1) / pmf(x) = (K - x)(n - x) / ((x + 1)(N - K - n + x + 1))
[[nodiscard]] inline double hypergeometric_sf(Size k, Size N, Size K, Size n) {
    DEX_CHECK_ARG(K <= N && n <= N, "hypergeometric_sf: K and n must not exceed N");

    const Size lo = (n + K > N) ? n + K - N : 0;
    const Size hi = algo::min2(n, K);
    if (k <= lo) return 1.0;
    if (k > hi) return 0.0;

    const double Nd = static_cast<double>(N);
    const double Kd = static_cast<double>(K);
    const double nd = static_cast<double>(n);
    const double kd = static_cast<double>(k);

    const double log_pmf_k = detail::log_choose(Kd, kd) + detail::log_choose(Nd - Kd, nd - kd)
                           - detail::log_choose(Nd, nd);

    // Sum relative to pmf(k)
    double term = 1.0;
    double sum = 1.0;
    for (Size x = k; x < hi; ++x) {
        const double xd = static_cast<double>(x);
        const double ratio = ((Kd - xd) * (nd - xd)) / ((xd + 1.0) * (Nd - Kd - nd + xd + 1.0));
        term *= ratio;
        sum += term;
        if (ratio < 1.0 && term < sum * config::TAIL_EPS) break;
    }

    const double p = std::exp(log_pmf_k + std::log(sum));
    return algo::clamp(p, 0.0, 1.0);
}

// =============================================================================
// Flagged Gene Lists
// =============================================================================

enum class Direction : std::uint8_t {
    Up,     // lfc > lfc_cutoff
    Down    // lfc < -lfc_cutoff
};

[[nodiscard]] constexpr const char* to_string(Direction d) noexcept {
    return d == Direction::Up ? "up" : "down";
}

// Gene ids with padj < padj_cutoff in the requested direction, table order
[[nodiscard]] inline std::vector<std::string> select_flagged(
    const std::vector<TestResult>& results,
    Direction direction,
    Real padj_cutoff = multiple_testing::config::DEFAULT_FDR_LEVEL,
    Real lfc_cutoff = Real(0)
) {
    std::vector<std::string> genes;
    for (const auto& r : results) {
        if (!r.padj.has_value() || !r.log2_fold_change.has_value()) continue;
        if (!(*r.padj < padj_cutoff)) continue;
        const Real lfc = *r.log2_fold_change;
        const bool keep = (direction == Direction::Up) ? (lfc > lfc_cutoff) : (lfc < -lfc_cutoff);
        if (keep) genes.push_back(r.gene_id);
    }
    return genes;
}

// =============================================================================
// Over-Representation Analysis
// =============================================================================

// gene_list and universe hold stripped ids. List genes outside the universe
// are dropped; duplicates count once. An empty effective list yields an
// empty result. Rows are sorted by p-value, ties by term id.
[[nodiscard]] inline std::vector<EnrichmentResult> over_representation(
    const std::vector<std::string>& gene_list,
    const std::vector<std::string>& universe,
    const Ontology& ontology,
    const EnrichmentOptions& options = {},
    const annotation::GeneAnnotation* gene_names = nullptr
) {
    DEX_CHECK_ARG(options.min_term_size <= options.max_term_size,
                  "over_representation: min_term_size exceeds max_term_size");

    std::unordered_set<std::string> universe_set;
    universe_set.reserve(universe.size());
    if (options.restrict_universe_to_annotated) {
        const auto annotated = ontology.annotated_genes();
        for (const auto& g : universe) {
            if (algo::contains_sorted(annotated.data(), annotated.data() + annotated.size(), g)) {
                universe_set.insert(g);
            }
        }
    } else {
        universe_set.insert(universe.begin(), universe.end());
    }

    std::vector<const std::string*> list;
    {
        std::unordered_set<std::string> seen;
        for (const auto& g : gene_list) {
            if (universe_set.count(g) && seen.insert(g).second) {
                list.push_back(&g);
            }
        }
    }

    const Size N = universe_set.size();
    const Size K = list.size();
    if (K == 0) return {};

    const auto& terms = ontology.terms();
    std::vector<std::optional<EnrichmentResult>> rows(terms.size());

    dex::threading::parallel_for(0, terms.size(), [&](size_t t) {
        const OntologyTerm& term = terms[t];

        Size n = 0;
        for (const auto& g : term.gene_ids) {
            n += universe_set.count(g);
        }
        if (n < options.min_term_size || n > options.max_term_size) return;

        std::vector<std::string> hits;
        for (const std::string* g : list) {
            if (term.contains(*g)) {
                const std::string* name = gene_names ? gene_names->find(*g) : nullptr;
                hits.push_back(name ? *name : *g);
            }
        }
        if (hits.empty()) return;

        EnrichmentResult row;
        row.term_id = term.term_id;
        row.term_name = term.term_name;
        row.list_count = hits.size();
        row.background_count = n;
        row.list_total = K;
        row.background_total = N;
        row.pvalue = static_cast<Real>(hypergeometric_sf(hits.size(), N, K, n));
        row.genes = std::move(hits);
        rows[t] = std::move(row);
    });

    std::vector<EnrichmentResult> tested;
    for (auto& row : rows) {
        if (row.has_value()) tested.push_back(std::move(*row));
    }

    std::vector<Real> p(tested.size()), q(tested.size());
    for (Size i = 0; i < tested.size(); ++i) {
        p[i] = tested[i].pvalue;
    }
    multiple_testing::adjust(as_array(std::as_const(p)), as_array(q), options.adjust);

    std::vector<EnrichmentResult> out;
    for (Size i = 0; i < tested.size(); ++i) {
        tested[i].padj = q[i];
        if (tested[i].pvalue <= options.pvalue_cutoff && tested[i].padj <= options.padj_cutoff) {
            out.push_back(std::move(tested[i]));
        }
    }

    std::sort(out.begin(), out.end(), [](const EnrichmentResult& a, const EnrichmentResult& b) {
        if (a.pvalue != b.pvalue) return a.pvalue < b.pvalue;
        return a.term_id < b.term_id;
    });
    return out;
}

} // namespace dex::kernel::enrichment
