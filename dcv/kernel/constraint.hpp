#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/macros.hpp"
#include "dcv/core/vectorize.hpp"

#include <cmath>
#include <limits>

// =============================================================================
// FILE: dcv/kernel/constraint.hpp
// BRIEF: Non-negativity, minimum-fraction and sum-to-one post-processing
//
// Applied after every solve, whatever produced the coefficients:
//   0. non-finite entries become 0
//   1. negative entries are clipped to 0
//   2. entries holding less than min_fraction of the total are zeroed
//   3. if sum-to-one is active and the total is positive, rescale to sum 1
//
// Thresholding is relative to the total, and rescaling after removing small
// entries only grows the survivors, so a second pass is a no-op.
// =============================================================================

namespace dcv::kernel::constraint {

namespace config {
    constexpr Real DEFAULT_MIN_FRACTION = Real(0);
    // Tolerance used by callers checking the sum-to-one invariant
    constexpr Real SUM_TOLERANCE = Real(1e-6);
}

struct EnforceReport {
    bool valid = false;       // at least one positive entry survived
    Size n_nonfinite = 0;
    Size n_clipped = 0;
    Size n_thresholded = 0;
};

/// @brief Enforce the proportion constraints in place.
/// @param x            coefficients, modified in place
/// @param min_fraction entries with x_i / sum(x) < min_fraction are zeroed, in [0, 1)
/// @param sum_to_one   rescale the survivors to sum 1
/// @return report; valid == false means x is all zero
inline EnforceReport enforce(Array<Real> x, Real min_fraction = config::DEFAULT_MIN_FRACTION,
                             bool sum_to_one = true) {
    DCV_CHECK_FRACTION(min_fraction, "enforce");

    EnforceReport report;
    const Size n = x.len;

    for (Size i = 0; i < n; ++i) {
        if (DCV_UNLIKELY(!std::isfinite(x.ptr[i]))) {
            x.ptr[i] = Real(0);
            ++report.n_nonfinite;
        } else if (x.ptr[i] < Real(0)) {
            ++report.n_clipped;
        }
    }
    vectorize::clamp_min(x, Real(0));

    Real total = vectorize::sum(Array<const Real>(x));
    if (total <= Real(0)) {
        return report;
    }

    if (min_fraction > Real(0)) {
        const Real cutoff = min_fraction * total;
        for (Size i = 0; i < n; ++i) {
            if (x.ptr[i] > Real(0) && x.ptr[i] < cutoff) {
                x.ptr[i] = Real(0);
                ++report.n_thresholded;
            }
        }
        if (report.n_thresholded > 0) {
            total = vectorize::sum(Array<const Real>(x));
        }
    }

    report.valid = total > Real(0);

    // Leave an already normalized vector untouched so repeated calls are exact
    const Real drift_tol = std::numeric_limits<Real>::epsilon() * static_cast<Real>(n + 1);
    if (sum_to_one && report.valid && std::abs(total - Real(1)) > drift_tol) {
        vectorize::scale(x, Real(1) / total);
    }

    return report;
}

/// @brief True when every entry is finite and non-negative and, if requested,
/// the entries sum to 1 within config::SUM_TOLERANCE.
inline bool satisfied(Array<const Real> x, bool sum_to_one = true) {
    for (Size i = 0; i < x.len; ++i) {
        if (!std::isfinite(x.ptr[i]) || x.ptr[i] < Real(0)) {
            return false;
        }
    }
    if (!sum_to_one) {
        return true;
    }
    return std::abs(vectorize::sum(x) - Real(1)) <= config::SUM_TOLERANCE;
}

} // namespace dcv::kernel::constraint
