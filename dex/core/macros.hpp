#pragma once

#include "dex/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: dex/core/macros.hpp
// BRIEF: Compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define DEX_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define DEX_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define DEX_FORCE_INLINE __forceinline
    #define DEX_RESTRICT __restrict
    #define DEX_EXPORT __declspec(dllexport)
#else
    #define DEX_FORCE_INLINE inline __attribute__((always_inline))
    #define DEX_RESTRICT __restrict__
    #define DEX_EXPORT __attribute__((visibility("default")))
#endif

// =============================================================================
// SECTION 3: Memory Alignment
// =============================================================================

#define DEX_ALIGNMENT 64  // 64-byte alignment for AVX-512

// =============================================================================
// SECTION 4: Bit Operations
// =============================================================================

// Count leading zeros of a non-zero size_t
#if defined(__clang__) || defined(__GNUC__)
    #define DEX_CLZ(x) (static_cast<std::size_t>(__builtin_clzll(static_cast<unsigned long long>(x))))
#else
    #include <bit>
    #define DEX_CLZ(x) (static_cast<std::size_t>(std::countl_zero(static_cast<unsigned long long>(x))))
#endif

// =============================================================================
// SECTION 5: Optimizer Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define DEX_HOT __attribute__((hot))
#else
    #define DEX_HOT
#endif
