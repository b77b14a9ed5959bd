#pragma once

#include "dex/config.hpp"
#include "dex/core/macros.hpp"
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <concepts>
#include <cassert>
#include <iterator>
#include <span>
#include <vector>

// =============================================================================
// FILE: dex/core/type.hpp
// BRIEF: Unified type system and zero-overhead views
// =============================================================================

namespace dex {

// =============================================================================
// SECTION 1: Basic Types
// =============================================================================

#if defined(DEX_USE_FLOAT32)
    using Real = float;
    constexpr const char* DTYPE_NAME = "float32";
#elif defined(DEX_USE_FLOAT64)
    using Real = double;
    constexpr const char* DTYPE_NAME = "float64";
#else
    #error "dex: No precision macro defined."
#endif

#if defined(DEX_USE_INT32)
    using Index = std::int32_t;
    constexpr const char* INDEX_DTYPE_NAME = "int32";
#elif defined(DEX_USE_INT64)
    using Index = std::int64_t;
    constexpr const char* INDEX_DTYPE_NAME = "int64";
#else
    #error "dex: No index precision selected."
#endif

using Size = std::size_t;

// Raw read count
using Count = std::uint32_t;

// =============================================================================
// SECTION 2: Array View
// =============================================================================

template <typename T>
struct Array {
    using value_type = T;
    using pointer = T*;
    using const_pointer = const T*;
    using reference = T&;
    using const_reference = const T&;
    using size_type = Size;
    using difference_type = std::ptrdiff_t;
    using iterator = T*;
    using const_iterator = const T*;

    T* ptr;
    Size len;

    constexpr Array() noexcept : ptr(nullptr), len(0) {}
    constexpr Array(T* p, Size s) noexcept : ptr(p), len(s) {}

    // Conversion from non-const to const
    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr Array(const Array<U>& other) noexcept
        : ptr(other.ptr), len(other.len) {}

    template <std::size_t Extent = std::dynamic_extent>
    constexpr Array(std::span<T, Extent> span) noexcept
        : ptr(span.data()), len(static_cast<Size>(span.size())) {}

    DEX_FORCE_INLINE constexpr auto operator[](Index i) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(i >= 0 && static_cast<Size>(i) < len && "Array index out of bounds");
#endif
        return ptr[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] DEX_FORCE_INLINE constexpr auto data() const noexcept -> T* { return ptr; }
    [[nodiscard]] DEX_FORCE_INLINE constexpr auto size() const noexcept -> Size { return len; }
    [[nodiscard]] DEX_FORCE_INLINE constexpr auto empty() const noexcept -> bool { return len == 0; }

    [[nodiscard]] DEX_FORCE_INLINE constexpr auto begin() const noexcept -> T* { return ptr; }
    [[nodiscard]] DEX_FORCE_INLINE constexpr auto end() const noexcept -> T* {
        return ptr + len;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
};

static_assert(std::is_trivially_copyable_v<Array<Real>>);
static_assert(std::is_trivially_copyable_v<Array<const Real>>);
static_assert(std::is_standard_layout_v<Array<Real>>);

// View over a std::vector without copying
template <typename T>
DEX_FORCE_INLINE auto as_array(std::vector<T>& v) noexcept -> Array<T> {
    return Array<T>(v.data(), v.size());
}

template <typename T>
DEX_FORCE_INLINE auto as_array(const std::vector<T>& v) noexcept -> Array<const T> {
    return Array<const T>(v.data(), v.size());
}

// =============================================================================
// SECTION 3: ArrayLike Concept
// =============================================================================

template <typename A>
concept ArrayLike = requires(const A& a, Index i) {
    typename A::value_type;
    { a.size() } -> std::convertible_to<Size>;
    { a[i] } -> std::convertible_to<const typename A::value_type&>;
    { a.begin() };
    { a.end() };
};

static_assert(ArrayLike<Array<Real>>);
static_assert(ArrayLike<Array<const Real>>);

} // namespace dex
