#pragma once

#include <memory>
#include <thread>
#include <cstddef>

#include "dex/config.hpp"
#include "dex/core/macros.hpp"

// =============================================================================
// FILE: dex/threading/scheduler.hpp
// BRIEF: Thread count control across threading backends
//
// run_stratum applies PipelineConfig::num_threads here before the first
// parallel stage; 0 keeps the backend default.
// =============================================================================

#if defined(DEX_USE_BS)
    #include "BS_thread_pool.hpp"
#elif defined(DEX_USE_OPENMP)
    #include <omp.h>
#elif defined(DEX_USE_TBB)
    #include <tbb/global_control.h>
#endif

namespace dex::threading {

namespace detail {
#if defined(DEX_USE_BS)
    // Process-wide pool, never destroyed
    inline BS::thread_pool& get_global_pool() {
        static BS::thread_pool pool;
        return pool;
    }
#endif
}

class Scheduler {
public:
    // Hardware threads, at least 1
    DEX_FORCE_INLINE static size_t hardware_concurrency() noexcept {
        size_t hw = std::thread::hardware_concurrency();
        return (hw > 0) ? hw : 1;
    }

    // n == 0 selects hardware_concurrency()
    // BS backend: recreates the pool, do not call in hot loops
    static void set_num_threads(size_t n) {
        if (n == 0) {
            n = hardware_concurrency();
        }

        constexpr size_t MAX_THREADS = 1024;
        if (n > MAX_THREADS) {
            n = MAX_THREADS;
        }

#if defined(DEX_USE_SERIAL)
        (void)n;

#elif defined(DEX_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));

#elif defined(DEX_USE_BS)
        detail::get_global_pool().reset(n);

#elif defined(DEX_USE_TBB)
        // global_control is scoped; keep the latest one alive
        static ::std::unique_ptr<tbb::global_control> gc;
        gc = ::std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<int>(n));

#else
        (void)n;
#endif
    }

    static size_t get_num_threads() noexcept {
#if defined(DEX_USE_SERIAL)
        return 1;

#elif defined(DEX_USE_OPENMP)
        int n = omp_get_max_threads();
        return (n > 0) ? static_cast<size_t>(n) : 1;

#elif defined(DEX_USE_BS)
        size_t n = detail::get_global_pool().get_thread_count();
        return (n > 0) ? n : 1;

#elif defined(DEX_USE_TBB)
        auto n = tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
        return (n > 0) ? static_cast<size_t>(n) : 1;

#else
        return 1;
#endif
    }
};

} // namespace dex::threading
