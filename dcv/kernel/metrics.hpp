#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/macros.hpp"
#include "dcv/core/vectorize.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <vector>

// =============================================================================
// FILE: dcv/kernel/metrics.hpp
// BRIEF: Agreement statistics between an observed and a predicted vector
//
// Every statistic is optional: an empty input, a constant vector under a
// correlation, or a zero total sum of squares under R^2 yields std::nullopt
// rather than NaN, so callers never have to inspect floating-point payloads.
// =============================================================================

namespace dcv::kernel::metrics {

struct FitMetrics {
    std::optional<Real> rmse;
    std::optional<Real> mae;
    std::optional<Real> r2;
    std::optional<Real> pearson;
    std::optional<Real> spearman;
};

namespace detail {

DCV_FORCE_INLINE bool is_constant(Array<const Real> x) noexcept {
    if (x.len == 0) return true;
    const auto [lo, hi] = std::minmax_element(x.begin(), x.end());
    return *lo == *hi;
}

DCV_FORCE_INLINE Real mean(Array<const Real> x) {
    return vectorize::sum(x) / static_cast<Real>(x.len);
}

DCV_FORCE_INLINE bool all_finite(Array<const Real> x) noexcept {
    return std::all_of(x.begin(), x.end(), [](Real v) { return std::isfinite(v); });
}

} // namespace detail

inline std::optional<Real> rmse(Array<const Real> actual, Array<const Real> predicted) {
    DCV_CHECK_DIM(actual.len == predicted.len, "rmse: length mismatch");
    if (actual.len == 0) return std::nullopt;
    const Real ss = vectorize::sum_squared_diff(actual, predicted);
    if (!std::isfinite(ss)) return std::nullopt;
    return std::sqrt(ss / static_cast<Real>(actual.len));
}

inline std::optional<Real> mae(Array<const Real> actual, Array<const Real> predicted) {
    DCV_CHECK_DIM(actual.len == predicted.len, "mae: length mismatch");
    if (actual.len == 0) return std::nullopt;
    const Real sa = vectorize::sum_abs_diff(actual, predicted);
    if (!std::isfinite(sa)) return std::nullopt;
    return sa / static_cast<Real>(actual.len);
}

/// @brief Coefficient of determination 1 - SSres / SStot.
/// Undefined (nullopt) when the actual values are constant.
inline std::optional<Real> r_squared(Array<const Real> actual, Array<const Real> predicted) {
    DCV_CHECK_DIM(actual.len == predicted.len, "r_squared: length mismatch");
    if (detail::is_constant(actual) || !detail::all_finite(actual) || !detail::all_finite(predicted)) {
        return std::nullopt;
    }
    const Real mu = detail::mean(actual);
    Real ss_tot = Real(0);
    for (Size i = 0; i < actual.len; ++i) {
        const Real dv = actual.ptr[i] - mu;
        ss_tot += dv * dv;
    }
    if (!(ss_tot > Real(0))) return std::nullopt;
    const Real ss_res = vectorize::sum_squared_diff(actual, predicted);
    return Real(1) - ss_res / ss_tot;
}

/// @brief Pearson correlation, clamped to [-1, 1].
inline std::optional<Real> pearson(Array<const Real> x, Array<const Real> y) {
    DCV_CHECK_DIM(x.len == y.len, "pearson: length mismatch");
    if (x.len < 2 || detail::is_constant(x) || detail::is_constant(y) ||
        !detail::all_finite(x) || !detail::all_finite(y)) {
        return std::nullopt;
    }
    const Real mx = detail::mean(x);
    const Real my = detail::mean(y);
    Real sxy = Real(0);
    Real sxx = Real(0);
    Real syy = Real(0);
    for (Size i = 0; i < x.len; ++i) {
        const Real dx = x.ptr[i] - mx;
        const Real dy = y.ptr[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    const Real denom = std::sqrt(sxx * syy);
    if (!(denom > Real(0))) return std::nullopt;
    return std::clamp(sxy / denom, Real(-1), Real(1));
}

/// @brief 1-based ranks; tied values share the average of their ranks.
inline std::vector<Real> average_ranks(Array<const Real> x) {
    const Size n = x.len;
    std::vector<Size> order(n);
    std::iota(order.begin(), order.end(), Size(0));
    std::stable_sort(order.begin(), order.end(),
                     [&](Size a, Size b) { return x.ptr[a] < x.ptr[b]; });

    std::vector<Real> ranks(n);
    Size i = 0;
    while (i < n) {
        Size j = i + 1;
        while (j < n && x.ptr[order[j]] == x.ptr[order[i]]) ++j;
        // positions i..j-1 hold ranks i+1..j
        const Real avg = static_cast<Real>(i + 1 + j) / Real(2);
        for (Size k = i; k < j; ++k) ranks[order[k]] = avg;
        i = j;
    }
    return ranks;
}

inline std::optional<Real> spearman(Array<const Real> x, Array<const Real> y) {
    DCV_CHECK_DIM(x.len == y.len, "spearman: length mismatch");
    if (!detail::all_finite(x) || !detail::all_finite(y)) return std::nullopt;
    const auto rx = average_ranks(x);
    const auto ry = average_ranks(y);
    return pearson(Array<const Real>(rx.data(), rx.size()), Array<const Real>(ry.data(), ry.size()));
}

inline FitMetrics compute(Array<const Real> actual, Array<const Real> predicted) {
    FitMetrics m;
    m.rmse = rmse(actual, predicted);
    m.mae = mae(actual, predicted);
    m.r2 = r_squared(actual, predicted);
    m.pearson = pearson(actual, predicted);
    m.spearman = spearman(actual, predicted);
    return m;
}

/// @brief Mean of the defined R^2 values, nullopt if none is defined.
inline std::optional<Real> mean_r2(const std::vector<FitMetrics>& per_sample) {
    Real total = Real(0);
    Size n = 0;
    for (const auto& m : per_sample) {
        if (m.r2) {
            total += *m.r2;
            ++n;
        }
    }
    if (n == 0) return std::nullopt;
    return total / static_cast<Real>(n);
}

} // namespace dcv::kernel::metrics
