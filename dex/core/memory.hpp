#pragma once

#include "dex/config.hpp"
#include "dex/core/type.hpp"
#include "dex/core/macros.hpp"
#include <new>
#include <memory>
#include <type_traits>

// =============================================================================
// FILE: dex/core/memory.hpp
// BRIEF: Aligned scratch buffers for numeric kernels
// =============================================================================

namespace dex::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (DEX_UNLIKELY(!ptr)) return;
        operator delete[](ptr, std::align_val_t(alignment_));
    }
};

template <typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter<T>>;  // NOLINT(modernize-avoid-c-arrays)

// Zero-initialized aligned array of arithmetic values.
// Throws std::bad_alloc on exhaustion.
template <typename T>
DEX_FORCE_INLINE auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> AlignedPtr<T> {
    static_assert(std::is_arithmetic_v<T>,
                  "aligned_alloc: Type must be arithmetic");

    if (DEX_UNLIKELY(count == 0)) {
        return AlignedPtr<T>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = new (std::align_val_t(alignment)) T[count]();
    return AlignedPtr<T>(raw_ptr, AlignedDeleter<T>(alignment));
}

} // namespace dex::memory
