#pragma once

#include "dex/config.hpp"
#include "dex/core/type.hpp"
#include "dex/core/macros.hpp"
#include "dex/core/error.hpp"
#include "dex/core/simd.hpp"

#include <algorithm>
#include <concepts>
#include <vector>

// =============================================================================
// FILE: dex/core/sort.hpp
// BRIEF: Key-value sorting (Highway interleave + introsort)
// =============================================================================

namespace dex::sort {

using namespace dex::sort::config;

template <typename Cmp, typename T>
concept Comparator = std::predicate<Cmp, T, T>;

namespace detail {

    template <std::size_t Size> struct RawType;
    template <> struct RawType<4> { using type = std::uint32_t; };
    template <> struct RawType<8> { using type = std::uint64_t; };

    // keys[i], values[i] -> dest[2i], dest[2i+1]
    template <typename Key, typename Value, typename RawT = typename RawType<sizeof(Key)>::type>
    DEX_FORCE_INLINE void pack_interleaved(
        const Key* DEX_RESTRICT keys,
        const Value* DEX_RESTRICT values,
        void* DEX_RESTRICT dest,
        Size size
    ) {
        const hwy::HWY_NAMESPACE::ScalableTag<RawT> d;
        auto* k_ptr = reinterpret_cast<const RawT*>(keys);
        auto* v_ptr = reinterpret_cast<const RawT*>(values);
        auto* d_ptr = reinterpret_cast<RawT*>(dest);

        const Size N = hwy::HWY_NAMESPACE::Lanes(d);
        Size i = 0;

        for (; i + N <= size; i += N) {
            auto vk = hwy::HWY_NAMESPACE::LoadU(d, k_ptr + i);
            auto vv = hwy::HWY_NAMESPACE::LoadU(d, v_ptr + i);
            hwy::HWY_NAMESPACE::StoreInterleaved2(vk, vv, d, d_ptr + 2 * i);
        }

        for (; i < size; ++i) {
            d_ptr[2 * i] = k_ptr[i];
            d_ptr[2 * i + 1] = v_ptr[i];
        }
    }

    template <typename Key, typename Value, typename RawT = typename RawType<sizeof(Key)>::type>
    DEX_FORCE_INLINE void unpack_interleaved(
        const void* DEX_RESTRICT src,
        Key* DEX_RESTRICT keys,
        Value* DEX_RESTRICT values,
        Size size
    ) {
        const hwy::HWY_NAMESPACE::ScalableTag<RawT> d;
        auto* s_ptr = reinterpret_cast<const RawT*>(src);
        auto* k_ptr = reinterpret_cast<RawT*>(keys);
        auto* v_ptr = reinterpret_cast<RawT*>(values);

        const Size N = hwy::HWY_NAMESPACE::Lanes(d);
        Size i = 0;

        for (; i + N <= size; i += N) {
            auto vk = hwy::HWY_NAMESPACE::Undefined(d);
            auto vv = hwy::HWY_NAMESPACE::Undefined(d);
            hwy::HWY_NAMESPACE::LoadInterleaved2(d, s_ptr + 2 * i, vk, vv);
            hwy::HWY_NAMESPACE::StoreU(vk, d, k_ptr + i);
            hwy::HWY_NAMESPACE::StoreU(vv, d, v_ptr + i);
        }

        for (; i < size; ++i) {
            k_ptr[i] = s_ptr[2 * i];
            v_ptr[i] = s_ptr[2 * i + 1];
        }
    }

    template <typename Pair, Comparator<Pair> Comp>
    DEX_FORCE_INLINE void insertion_sort(Pair* data, Size n, Comp comp) {
        for (Size i = 1; i < n; ++i) {
            Pair tmp = data[i];
            Size j = i;
            while (j > 0 && comp(tmp, data[j - 1])) {
                data[j] = data[j - 1];
                --j;
            }
            data[j] = tmp;
        }
    }

    template <typename Pair, Comparator<Pair> Comp>
    void introsort_impl(Pair* data, Size n, int depth_limit, Comp comp) {
        while (n > INSERTION_THRESHOLD) {
            if (depth_limit == 0) {
                std::make_heap(data, data + n, comp);
                std::sort_heap(data, data + n, comp);
                return;
            }
            --depth_limit;

            // Median-of-three pivot moved to the front
            Size mid = n / 2;
            if (comp(data[mid], data[0])) std::swap(data[mid], data[0]);
            if (comp(data[n - 1], data[0])) std::swap(data[n - 1], data[0]);
            if (comp(data[n - 1], data[mid])) std::swap(data[n - 1], data[mid]);
            std::swap(data[0], data[mid]);
            const Pair pivot = data[0];

            // Hoare partition over [1, n)
            Size i = 1;
            Size j = n - 1;
            while (true) {
                while (comp(data[i], pivot)) ++i;
                while (comp(pivot, data[j])) --j;
                if (i >= j) break;
                std::swap(data[i], data[j]);
                ++i;
                --j;
            }
            std::swap(data[0], data[j]);

            // Recurse into the smaller side
            Size left_n = j;
            Size right_n = n - j - 1;
            if (left_n < right_n) {
                introsort_impl(data, left_n, depth_limit, comp);
                data += j + 1;
                n = right_n;
            } else {
                introsort_impl(data + j + 1, right_n, depth_limit, comp);
                n = left_n;
            }
        }
        insertion_sort(data, n, comp);
    }

    template <typename Pair, Comparator<Pair> Comp>
    DEX_FORCE_INLINE void sort_pairs_impl(Pair* data, Size n, Comp comp) {
        if (DEX_UNLIKELY(n <= 1)) return;

        auto depth_limit = static_cast<int>(2 * (sizeof(Size) * 8 - DEX_CLZ(n)));
        introsort_impl(data, n, depth_limit, comp);
    }

    template <typename Key, typename Value, typename Comp>
    void sort_pairs_with(Array<Key> keys, Array<Value> values, Comp comp) {
        DEX_CHECK_DIM(keys.len == values.len, "sort_pairs: keys and values must have same size");
        if (DEX_UNLIKELY(keys.len <= 1)) return;

        struct Pair { Key k; Value v; };

        const Size n = keys.len;
        std::vector<Pair> buffer(n);

        if constexpr (sizeof(Key) == sizeof(Value) && sizeof(Pair) == 2 * sizeof(Key)) {
            pack_interleaved(keys.ptr, values.ptr, buffer.data(), n);
        } else {
            for (Size i = 0; i < n; ++i) {
                buffer[i] = {keys.ptr[i], values.ptr[i]};
            }
        }

        sort_pairs_impl(buffer.data(), n, [&comp](const Pair& a, const Pair& b) {
            return comp(a.k, b.k);
        });

        if constexpr (sizeof(Key) == sizeof(Value) && sizeof(Pair) == 2 * sizeof(Key)) {
            unpack_interleaved(buffer.data(), keys.ptr, values.ptr, n);
        } else {
            for (Size i = 0; i < n; ++i) {
                keys.ptr[i] = buffer[i].k;
                values.ptr[i] = buffer[i].v;
            }
        }
    }

} // namespace detail

// =============================================================================
// Public Key-Value Sorting API
// =============================================================================

// Sorts keys ascending and applies the same permutation to values.
// Not stable. Keys must not contain NaN.
template <std::copyable Key, std::copyable Value>
void sort_pairs(Array<Key> keys, Array<Value> values) {
    detail::sort_pairs_with(keys, values, [](const Key& a, const Key& b) { return a < b; });
}

} // namespace dex::sort
