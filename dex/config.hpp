#pragma once

#include <cstddef>
#include <cstdint>

// =============================================================================
// FILE: dex/config.hpp
// BRIEF: dex compile-time configuration
// =============================================================================

// =============================================================================
// HWY Scalar-Only Control
// =============================================================================

#ifdef DEX_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define DEX_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define DEX_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define DEX_OS_LINUX
#else
    #define DEX_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

#if !defined(DEX_BACKEND_SERIAL) && !defined(DEX_BACKEND_TBB) && \
    !defined(DEX_BACKEND_OPENMP) && !defined(DEX_BACKEND_BS)
    #if defined(DEX_OS_MAC)
        // macOS: BS::thread_pool unless OpenMP is forced
        #if defined(DEX_MAC_USE_OPENMP)
            #define DEX_BACKEND_OPENMP
        #else
            #define DEX_BACKEND_BS
        #endif
    #elif defined(DEX_OS_WINDOWS) || defined(DEX_OS_LINUX)
        #define DEX_BACKEND_OPENMP
    #else
        #define DEX_BACKEND_BS
    #endif
#endif

#if (defined(DEX_BACKEND_SERIAL) && (defined(DEX_BACKEND_TBB) || defined(DEX_BACKEND_OPENMP) || defined(DEX_BACKEND_BS))) || \
    (defined(DEX_BACKEND_TBB) && (defined(DEX_BACKEND_OPENMP) || defined(DEX_BACKEND_BS))) || \
    (defined(DEX_BACKEND_OPENMP) && defined(DEX_BACKEND_BS))
    #error "dex configuration error: multiple threading backends defined. " \
           "Define only one of DEX_BACKEND_SERIAL, DEX_BACKEND_TBB, " \
           "DEX_BACKEND_OPENMP, DEX_BACKEND_BS."
#endif

#if defined(DEX_BACKEND_OPENMP)
    #define DEX_USE_OPENMP 1
#elif defined(DEX_BACKEND_TBB)
    #define DEX_USE_TBB 1
#elif defined(DEX_BACKEND_BS)
    #define DEX_USE_BS 1
#elif defined(DEX_BACKEND_SERIAL)
    #define DEX_USE_SERIAL 1
#endif

// =============================================================================
// Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default, IRLS and hypergeometric tails need it)
#ifndef DEX_PRECISION
    #define DEX_PRECISION 1
#endif

#if DEX_PRECISION == 0
    #define DEX_USE_FLOAT32
#elif DEX_PRECISION == 1
    #define DEX_USE_FLOAT64
#else
    #error "dex configuration error: invalid DEX_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Index Precision Control
// =============================================================================

// 1: int32
// 2: int64 (default)
#ifndef DEX_INDEX_PRECISION
    #define DEX_INDEX_PRECISION 2
#endif

#if DEX_INDEX_PRECISION == 1
    #define DEX_USE_INT32
#elif DEX_INDEX_PRECISION == 2
    #define DEX_USE_INT64
#else
    #error "dex configuration error: invalid DEX_INDEX_PRECISION value. " \
           "Must be 1 (int32) or 2 (int64)."
#endif

// =============================================================================
// Memory Configuration
// =============================================================================

namespace dex::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;  // AVX-512 friendly
    inline constexpr std::size_t CACHE_LINE_SIZE = 64;
}

// =============================================================================
// Sort Configuration
// =============================================================================

namespace dex::sort::config {
    inline constexpr std::size_t INSERTION_THRESHOLD = 16;  // insertion sort below this
}
