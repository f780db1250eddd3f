#pragma once

#include "dcv/config.hpp"
#include "dcv/core/macros.hpp"
#include "dcv/threading/scheduler.hpp"

#include <cstddef>
#include <exception>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>
#include <future>

// =============================================================================
// Backend Specific Headers
// =============================================================================

#if defined(DCV_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(DCV_USE_OPENMP)
    #include <omp.h>
#endif

// =============================================================================
// FILE: dcv/threading/parallel_for.hpp
// BRIEF: Parallel loop over independent items with a per-call thread count
// =============================================================================

namespace dcv::threading {

namespace detail {

// Keeps the first exception raised by any worker so it can be rethrown on the
// calling thread once the loop has joined.
class FirstException {
public:
    void capture() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) {
            error_ = std::current_exception();
        }
    }

    void rethrow_if_any() const {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

private:
    std::mutex mutex_;
    std::exception_ptr error_;
};

template <typename Func>
DCV_FORCE_INLINE void invoke_guarded(Func& func, size_t i, size_t rank, FirstException& errors) noexcept {
    try {
        if constexpr (std::is_invocable_v<Func, size_t, size_t>) {
            func(i, rank);
        } else {
            func(i);
        }
    } catch (...) {
        errors.capture();
    }
}

} // namespace detail

// =============================================================================
// Parallel Loop Interface
// =============================================================================

// Runs func over [start, end) with at most n_threads workers.
//   n_threads == 1: plain sequential loop on the calling thread
//   n_threads == 0: every thread configured through Scheduler
// Accepts func(i) or func(i, thread_rank). Every index is visited exactly once
// even when some of them throw; the first exception is rethrown afterwards.
template <typename Func>
inline void parallel_for(size_t start, size_t end, size_t n_threads, Func&& func) {
    if (DCV_UNLIKELY(start >= end)) {
        return;
    }

    detail::FirstException errors;
    const size_t workers = Scheduler::resolve(n_threads);

    if (workers <= 1 || end - start == 1) {
        for (size_t i = start; i < end; ++i) {
            detail::invoke_guarded(func, i, 0, errors);
        }
        errors.rethrow_if_any();
        return;
    }

#if defined(DCV_USE_OPENMP)
    if (omp_in_parallel()) {
        for (size_t i = start; i < end; ++i) {
            detail::invoke_guarded(func, i, static_cast<size_t>(omp_get_thread_num()), errors);
        }
    } else {
        #pragma omp parallel for schedule(dynamic, 1) num_threads(static_cast<int>(workers))
        for (size_t i = start; i < end; ++i) {
            detail::invoke_guarded(func, i, static_cast<size_t>(omp_get_thread_num()), errors);
        }
    }

#elif defined(DCV_USE_TBB)
    tbb::task_arena arena(static_cast<int>(workers));
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<size_t>(start, end),
            [&](const tbb::blocked_range<size_t>& r) {
                const auto rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
                for (size_t i = r.begin(); i != r.end(); ++i) {
                    detail::invoke_guarded(func, i, rank, errors);
                }
            });
    });

#elif defined(DCV_USE_BS)
    auto& pool = detail::get_global_pool();
    const size_t range_size = end - start;
    const size_t chunk_size = (range_size + workers - 1) / workers;

    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    size_t thread_rank = 0;
    for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk_size) {
        const size_t chunk_end = (chunk_start + chunk_size < end) ? (chunk_start + chunk_size) : end;
        const size_t rank = thread_rank++;

        futures.push_back(pool.submit([&func, &errors, chunk_start, chunk_end, rank]() {
            for (size_t i = chunk_start; i < chunk_end; ++i) {
                detail::invoke_guarded(func, i, rank, errors);
            }
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

#else
    for (size_t i = start; i < end; ++i) {
        detail::invoke_guarded(func, i, 0, errors);
    }
#endif

    errors.rethrow_if_any();
}

} // namespace dcv::threading
