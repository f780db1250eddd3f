#pragma once

#include "dcv/config.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <thread>

#if defined(DCV_USE_BS)
    #include "BS_thread_pool.hpp"
#elif defined(DCV_USE_OPENMP)
    #include <omp.h>
#elif defined(DCV_USE_TBB)
    #include <tbb/global_control.h>
#endif

// =============================================================================
// FILE: dcv/threading/scheduler.hpp
// BRIEF: Process-wide worker budget shared by every per-sample parallel map
// =============================================================================

namespace dcv::threading {

namespace config {
    inline constexpr size_t MAX_WORKERS = 1024;
}

namespace detail {

#if defined(DCV_USE_BS)
// Lives for the whole process; resized by Scheduler::set_num_threads
inline BS::thread_pool& get_global_pool() {
    static BS::thread_pool pool;
    return pool;
}
#endif

inline void backend_set_workers(size_t n) {
#if defined(DCV_USE_OPENMP)
    omp_set_num_threads(static_cast<int>(n));
#elif defined(DCV_USE_BS)
    get_global_pool().reset(n);
#elif defined(DCV_USE_TBB)
    // global_control is scoped; keep the latest one alive
    static std::unique_ptr<tbb::global_control> limit;
    limit.reset();
    limit = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, n);
#else
    (void)n;
#endif
}

inline size_t backend_workers() noexcept {
#if defined(DCV_USE_OPENMP)
    const int n = omp_get_max_threads();
    return n > 0 ? static_cast<size_t>(n) : 0;
#elif defined(DCV_USE_BS)
    return static_cast<size_t>(get_global_pool().get_thread_count());
#elif defined(DCV_USE_TBB)
    return tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
#else
    return 1;
#endif
}

} // namespace detail

class Scheduler {
public:
    static constexpr const char* backend_name() noexcept {
#if defined(DCV_USE_OPENMP)
        return "openmp";
#elif defined(DCV_USE_BS)
        return "bs";
#elif defined(DCV_USE_TBB)
        return "tbb";
#else
        return "serial";
#endif
    }

    static size_t hardware_concurrency() noexcept {
        return std::max<size_t>(std::thread::hardware_concurrency(), 1);
    }

    // 0 restores the hardware default. Not for hot paths: the BS backend
    // rebuilds its pool.
    static void set_num_threads(size_t n) {
        if (n == 0) n = hardware_concurrency();
        detail::backend_set_workers(std::min(n, config::MAX_WORKERS));
    }

    static size_t get_num_threads() noexcept {
        return std::max<size_t>(detail::backend_workers(), 1);
    }

    // Workers a single call may use; 0 asks for the whole budget
    static size_t resolve(size_t requested) noexcept {
        const size_t budget = get_num_threads();
        return requested == 0 ? budget : std::min(requested, budget);
    }
};

} // namespace dcv::threading
