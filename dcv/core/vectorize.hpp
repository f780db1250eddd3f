#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/macros.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/simd.hpp"

#include <cmath>

// =============================================================================
// FILE: dcv/core/vectorize.hpp
// BRIEF: SIMD reductions and element-wise updates over Array views
// =============================================================================
//
// Eigen column segments are not guaranteed to be vector-aligned, so every
// kernel here uses unaligned loads and stores.

namespace dcv::vectorize {

// =============================================================================
// 1. Reductions
// =============================================================================

template <typename T>
DCV_FORCE_INLINE T sum(Array<const T> span) {
    namespace s = dcv::simd;
    const s::SimdTagFor<T> d;
    const Size N = span.len;
    const Size lanes = s::Lanes(d);

    if (N == 0) return T(0);

    auto sum0 = s::Zero(d);
    auto sum1 = s::Zero(d);
    auto sum2 = s::Zero(d);
    auto sum3 = s::Zero(d);

    Size i = 0;
    for (; i + 4 * lanes <= N; i += 4 * lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
        sum1 = s::Add(sum1, s::LoadU(d, span.ptr + i + lanes));
        sum2 = s::Add(sum2, s::LoadU(d, span.ptr + i + 2 * lanes));
        sum3 = s::Add(sum3, s::LoadU(d, span.ptr + i + 3 * lanes));
    }

    sum0 = s::Add(s::Add(sum0, sum1), s::Add(sum2, sum3));

    for (; i + lanes <= N; i += lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
    }

    T result = s::GetLane(s::SumOfLanes(d, sum0));

    for (; i < N; ++i) {
        result += span.ptr[i];
    }

    return result;
}

// sum((a - b)^2)
template <typename T>
DCV_FORCE_INLINE T sum_squared_diff(Array<const T> a, Array<const T> b) {
    DCV_CHECK_INVARIANT(a.len == b.len, "sum_squared_diff: Size mismatch");

    namespace s = dcv::simd;
    const s::SimdTagFor<T> d;
    const Size N = a.len;
    const Size lanes = s::Lanes(d);

    auto acc = s::Zero(d);

    Size i = 0;
    for (; i + lanes <= N; i += lanes) {
        const auto diff = s::Sub(s::LoadU(d, a.ptr + i), s::LoadU(d, b.ptr + i));
        acc = s::MulAdd(diff, diff, acc);
    }

    T result = s::GetLane(s::SumOfLanes(d, acc));

    for (; i < N; ++i) {
        const T diff = a.ptr[i] - b.ptr[i];
        result += diff * diff;
    }

    return result;
}

// sum(|a - b|)
template <typename T>
DCV_FORCE_INLINE T sum_abs_diff(Array<const T> a, Array<const T> b) {
    DCV_CHECK_INVARIANT(a.len == b.len, "sum_abs_diff: Size mismatch");

    namespace s = dcv::simd;
    const s::SimdTagFor<T> d;
    const Size N = a.len;
    const Size lanes = s::Lanes(d);

    auto acc = s::Zero(d);

    Size i = 0;
    for (; i + lanes <= N; i += lanes) {
        acc = s::Add(acc, s::Abs(s::Sub(s::LoadU(d, a.ptr + i), s::LoadU(d, b.ptr + i))));
    }

    T result = s::GetLane(s::SumOfLanes(d, acc));

    for (; i < N; ++i) {
        result += std::abs(a.ptr[i] - b.ptr[i]);
    }

    return result;
}

// =============================================================================
// 2. In-place Updates
// =============================================================================

// x[i] = max(x[i], lo)
template <typename T>
DCV_FORCE_INLINE void clamp_min(Array<T> span, T lo) {
    namespace s = dcv::simd;
    const s::SimdTagFor<T> d;
    const Size N = span.len;
    const Size lanes = s::Lanes(d);
    const auto v_lo = s::Set(d, lo);

    Size i = 0;
    for (; i + lanes <= N; i += lanes) {
        s::StoreU(s::Max(s::LoadU(d, span.ptr + i), v_lo), d, span.ptr + i);
    }

    for (; i < N; ++i) {
        if (span.ptr[i] < lo) span.ptr[i] = lo;
    }
}

template <typename T>
DCV_FORCE_INLINE void scale(Array<T> span, T factor) {
    namespace s = dcv::simd;
    const s::SimdTagFor<T> d;
    const Size N = span.len;
    const Size lanes = s::Lanes(d);
    const auto v_f = s::Set(d, factor);

    Size i = 0;
    for (; i + lanes <= N; i += lanes) {
        s::StoreU(s::Mul(s::LoadU(d, span.ptr + i), v_f), d, span.ptr + i);
    }

    for (; i < N; ++i) {
        span.ptr[i] *= factor;
    }
}

} // namespace dcv::vectorize
