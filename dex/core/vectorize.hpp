#pragma once

#include "dex/core/type.hpp"
#include "dex/core/macros.hpp"
#include "dex/core/simd.hpp"

// =============================================================================
// FILE: dex/core/vectorize.hpp
// BRIEF: SIMD reductions over Array views
// NOTE: Views may point into the middle of matrix rows, so loads are unaligned
// =============================================================================

namespace dex::vectorize {

template <typename T>
DEX_FORCE_INLINE T sum(Array<const T> span) {
    namespace s = dex::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    if (N == 0) return T(0);

    auto sum0 = s::Zero(d);
    auto sum1 = s::Zero(d);
    auto sum2 = s::Zero(d);
    auto sum3 = s::Zero(d);

    size_t i = 0;

    for (; i + 4 * lanes <= N; i += 4 * lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
        sum1 = s::Add(sum1, s::LoadU(d, span.ptr + i + lanes));
        sum2 = s::Add(sum2, s::LoadU(d, span.ptr + i + 2 * lanes));
        sum3 = s::Add(sum3, s::LoadU(d, span.ptr + i + 3 * lanes));
    }

    sum0 = s::Add(sum0, sum1);
    sum2 = s::Add(sum2, sum3);
    sum0 = s::Add(sum0, sum2);

    for (; i + lanes <= N; i += lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
    }

    T result = s::GetLane(s::SumOfLanes(d, sum0));

    for (; i < N; ++i) {
        result += span.ptr[i];
    }

    return result;
}

} // namespace dex::vectorize
