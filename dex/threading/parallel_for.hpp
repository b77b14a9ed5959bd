#pragma once

#include "dex/config.hpp"
#include "dex/core/macros.hpp"
#include "dex/threading/scheduler.hpp"

#include <cstddef>
#include <utility>
#include <type_traits>
#include <vector>
#include <future>

#if defined(DEX_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(DEX_USE_OPENMP)
    #include <omp.h>
#endif

// =============================================================================
// FILE: dex/threading/parallel_for.hpp
// BRIEF: Backend-independent parallel loop
//
// Callers: per-gene loops in size_factors, dispersion (estimate_raw, shrink)
// and glm (wald_test); per-term loop in enrichment.
//
// Contract relied on by those callers:
//   - the body must not throw; a gene that cannot be fitted records its
//     FitState / ExclusionReason in its own output slot instead
//   - each index writes only its own slot, so no locking is needed
//   - nested calls run serially on the calling thread (OpenMP)
// =============================================================================

namespace dex::threading {

namespace config {
    // OpenMP dynamic schedule chunk
    constexpr int DYNAMIC_CHUNK = 64;
}

// Usage:
//   parallel_for(0, n, [&](size_t i) { ... });
//   parallel_for(0, n, [&](size_t i, size_t thread_rank) { ... });
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func) {
    if (DEX_UNLIKELY(start >= end)) {
        return;
    }

    constexpr bool has_rank_arg = std::is_invocable_v<Func, size_t, size_t>;

#if defined(DEX_USE_SERIAL)
    for (size_t i = start; i < end; ++i) {
        if constexpr (has_rank_arg) {
            func(i, 0);
        } else {
            func(i);
        }
    }

#elif defined(DEX_USE_OPENMP)
    if (omp_in_parallel()) {
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
    } else {
        #pragma omp parallel for schedule(dynamic, config::DYNAMIC_CHUNK)
        for (size_t i = start; i < end; ++i) {
            if constexpr (has_rank_arg) {
                func(i, static_cast<size_t>(omp_get_thread_num()));
            } else {
                func(i);
            }
        }
    }

#elif defined(DEX_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end),
        [&](const tbb::blocked_range<size_t>& r) {
            auto thread_rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
            for (size_t i = r.begin(); i != r.end(); ++i) {
                if constexpr (has_rank_arg) {
                    func(i, thread_rank);
                } else {
                    func(i);
                }
            }
        });

#elif defined(DEX_USE_BS)
    auto& pool = detail::get_global_pool();
    const size_t num_threads = pool.get_thread_count();
    const size_t range_size = end - start;
    const size_t chunk_size = (range_size + num_threads - 1) / num_threads;

    if (chunk_size == 0) return;

    std::vector<std::future<void>> futures;
    futures.reserve(num_threads);

    size_t thread_rank = 0;
    for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk_size) {
        const size_t chunk_end = (chunk_start + chunk_size < end) ? (chunk_start + chunk_size) : end;
        const size_t rank = thread_rank++;

        futures.push_back(pool.submit([&func, chunk_start, chunk_end, rank]() {
            for (size_t i = chunk_start; i < chunk_end; ++i) {
                if constexpr (has_rank_arg) {
                    func(i, rank);
                } else {
                    func(i);
                }
            }
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

#endif
}

} // namespace dex::threading
