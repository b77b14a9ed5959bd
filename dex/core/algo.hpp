#pragma once

#include "dex/core/type.hpp"
#include "dex/core/macros.hpp"

#include <cstring>
#include <utility>

// =============================================================================
// FILE: dex/core/algo.hpp
// BRIEF: Small algorithms without boundary checks
// NOTE: All functions assume valid inputs - caller must ensure preconditions
// =============================================================================

namespace dex::algo {

// =============================================================================
// SECTION 1: Binary Search (unchecked)
// =============================================================================

// Binary search for first element >= target
// PRECONDITION: [first, last) is sorted, first <= last
template <typename T, typename V>
DEX_FORCE_INLINE DEX_HOT
const T* lower_bound(const T* first, const T* last, const V& target) noexcept {
    size_t len = static_cast<size_t>(last - first);

    while (len > 0) {
        size_t half = len >> 1;
        const T* mid = first + half;

        if (*mid < target) {
            first = mid + 1;
            len -= half + 1;
        } else {
            len = half;
        }
    }

    return first;
}

// Membership test on a sorted range
template <typename T, typename V>
DEX_FORCE_INLINE bool contains_sorted(const T* first, const T* last, const V& target) noexcept {
    const T* it = lower_bound(first, last, target);
    return it != last && !(target < *it);
}

// =============================================================================
// SECTION 2: Partial Sorting (nth_element)
// =============================================================================

namespace detail {

template <typename T>
DEX_FORCE_INLINE void insertion_sort(T* first, T* last) noexcept {
    for (T* i = first + 1; i < last; ++i) {
        T key = static_cast<T&&>(*i);
        T* j = i;

        while (j > first && *(j - 1) > key) {
            *j = static_cast<T&&>(*(j - 1));
            --j;
        }

        *j = static_cast<T&&>(key);
    }
}

template <typename T>
DEX_FORCE_INLINE T* median_of_three(T* a, T* b, T* c) noexcept {
    if (*a < *b) {
        if (*b < *c) return b;
        if (*a < *c) return c;
        return a;
    }
    if (*a < *c) return a;
    if (*b < *c) return c;
    return b;
}

template <typename T>
DEX_FORCE_INLINE T* partition(T* first, T* last, T pivot) noexcept {
    while (true) {
        while (*first < pivot) ++first;
        --last;
        while (pivot < *last) --last;

        if (first >= last) return first;

        T tmp = static_cast<T&&>(*first);
        *first = static_cast<T&&>(*last);
        *last = static_cast<T&&>(tmp);
        ++first;
    }
}

} // namespace detail

// Partition around nth element (quickselect)
// PRECONDITION: first <= nth < last, no NaN in range
template <typename T>
void nth_element(T* first, T* nth, T* last) noexcept {
    constexpr std::ptrdiff_t INSERTION_THRESHOLD = 16;

    while (last - first > INSERTION_THRESHOLD) {
        T* mid = first + (last - first) / 2;
        T* pivot_pos = detail::median_of_three(first, mid, last - 1);
        T pivot = *pivot_pos;

        T* cut = detail::partition(first, last, pivot);

        if (cut <= nth) {
            first = cut;
        } else {
            last = cut;
        }
    }

    detail::insertion_sort(first, last);
}

// =============================================================================
// SECTION 3: Scalar Helpers
// =============================================================================

template <typename T>
DEX_FORCE_INLINE constexpr T min2(T a, T b) noexcept {
    return (a < b) ? a : b;
}

template <typename T>
DEX_FORCE_INLINE constexpr T max2(T a, T b) noexcept {
    return (a > b) ? a : b;
}

template <typename T>
DEX_FORCE_INLINE constexpr T clamp(T val, T lo, T hi) noexcept {
    return (val < lo) ? lo : ((val > hi) ? hi : val);
}

} // namespace dex::algo
