#pragma once

#include "dex/core/type.hpp"
#include "dex/core/error.hpp"
#include "dex/data/count_matrix.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: dex/data/sample_metadata.hpp
// BRIEF: Per-sample clinical records aligned with count matrix columns
// =============================================================================

namespace dex {

enum class Sex : std::uint8_t {
    Female = 0,
    Male = 1
};

[[nodiscard]] constexpr const char* to_string(Sex sex) noexcept {
    return sex == Sex::Male ? "male" : "female";
}

// "male" / "female", case-insensitive; anything else is missing
[[nodiscard]] inline std::optional<Sex> parse_sex(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "male") return Sex::Male;
    if (lower == "female") return Sex::Female;
    return std::nullopt;
}

struct SampleRecord {
    std::string sample_id;
    std::optional<Real> age;
    std::optional<Sex> sex;
    std::string sample_type;
    std::string vital_status;
};

// Row i describes column i of the matching CountMatrix
using SampleMetadata = std::vector<SampleRecord>;

// Throws DimensionError unless metadata rows match matrix columns 1:1, in order
inline void validate_alignment(const CountMatrix& matrix, const SampleMetadata& metadata) {
    if (DEX_UNLIKELY(metadata.size() != matrix.sample_count())) {
        throw DimensionError("metadata has " + std::to_string(metadata.size()) +
                             " rows but the count matrix has " +
                             std::to_string(matrix.sample_count()) + " columns");
    }
    const auto& ids = matrix.sample_ids();
    for (Size i = 0; i < metadata.size(); ++i) {
        if (DEX_UNLIKELY(metadata[i].sample_id != ids[i])) {
            throw DimensionError("metadata row " + std::to_string(i) + " ('" +
                                 metadata[i].sample_id + "') does not match column '" +
                                 ids[i] + "'");
        }
    }
}

} // namespace dex
