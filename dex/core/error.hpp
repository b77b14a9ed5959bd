#pragma once

#include "dex/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: dex/core/error.hpp
// BRIEF: dex exception system
// =============================================================================

namespace dex {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    DOMAIN_ERROR = 12,
    RANGE_ERROR = 13,
    INDEX_OUT_OF_BOUNDS = 14,

    // Cohort errors
    EMPTY_COHORT = 20,
};

[[nodiscard]] constexpr auto error_code_name(ErrorCode code) noexcept -> const char* {
    switch (code) {
        case ErrorCode::OK:                  return "OK";
        case ErrorCode::UNKNOWN:             return "UNKNOWN";
        case ErrorCode::INTERNAL_ERROR:      return "INTERNAL_ERROR";
        case ErrorCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case ErrorCode::DIMENSION_MISMATCH:  return "DIMENSION_MISMATCH";
        case ErrorCode::DOMAIN_ERROR:        return "DOMAIN_ERROR";
        case ErrorCode::RANGE_ERROR:         return "RANGE_ERROR";
        case ErrorCode::INDEX_OUT_OF_BOUNDS: return "INDEX_OUT_OF_BOUNDS";
        case ErrorCode::EMPTY_COHORT:        return "EMPTY_COHORT";
    }
    return "UNKNOWN";
}

// =============================================================================
// Base Exception Class
// =============================================================================

class DEX_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class InternalError : public Exception {
public:
    explicit InternalError(const std::string& msg)
        : Exception(ErrorCode::INTERNAL_ERROR, "Internal dex error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class DomainError : public ValueError {
public:
    explicit DomainError(const std::string& msg)
        : ValueError(ErrorCode::DOMAIN_ERROR, msg) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg)
        : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

// Cohort selection left no samples, or a single level of the sex covariate.
// Fatal for one age stratum only.
class EmptyCohortError : public ValueError {
public:
    explicit EmptyCohortError(const std::string& msg)
        : ValueError(ErrorCode::EMPTY_COHORT, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Assertion for internal invariants (active in all builds)
#define DEX_ASSERT(condition, msg) \
    do { \
        if (DEX_UNLIKELY(!(condition))) { \
            throw dex::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

// Validation for user inputs
#define DEX_CHECK_ARG(condition, msg) \
    do { \
        if (DEX_UNLIKELY(!(condition))) { \
            throw dex::ValueError(msg); \
        } \
    } while(0)

// Validation for dimension mismatches
#define DEX_CHECK_DIM(condition, msg) \
    do { \
        if (DEX_UNLIKELY(!(condition))) { \
            throw dex::DimensionError(msg); \
        } \
    } while(0)

// Validation for index bounds
#define DEX_CHECK_BOUNDS(index, size, msg) \
    do { \
        if (DEX_UNLIKELY(!((index) < (size)))) { \
            throw dex::IndexOutOfBoundsError(msg); \
        } \
    } while(0)

// Validation for range errors
#define DEX_CHECK_RANGE(value, min_val, max_val, msg) \
    do { \
        if (DEX_UNLIKELY((value) < (min_val) || (value) > (max_val))) { \
            throw dex::RangeError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace dex
