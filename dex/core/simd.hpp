#pragma once

#include "dex/core/type.hpp"

// =============================================================================
// Highway Configuration
// =============================================================================

#if defined(DEX_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>

// =============================================================================
// FILE: dex/core/simd.hpp
// BRIEF: dex SIMD wrapper (Google Highway)
// =============================================================================

namespace dex::simd {

    // Import Highway functions into dex::simd namespace
    using namespace hwy::HWY_NAMESPACE;

    using RealTag = ScalableTag<dex::Real>;

    template <typename T>
    using SimdTagFor = std::conditional_t<
        std::is_same_v<T, Real>, RealTag, ScalableTag<T>>;

} // namespace dex::simd
