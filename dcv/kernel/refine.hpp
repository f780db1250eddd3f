#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/log.hpp"
#include "dcv/core/matrix.hpp"
#include "dcv/core/vectorize.hpp"
#include "dcv/kernel/solver.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>

// =============================================================================
// FILE: dcv/kernel/refine.hpp
// BRIEF: Residual-reweighted re-solving of one sample
//
// Features that the current fit explains badly are down-weighted:
//
//   r_f = b_f - (R x)_f
//   w_f = base_f * exp(-|r_f| / (mean|r| + eps))
//
// and the sample is solved again with rows scaled by sqrt(w_f). Iteration
// stops when the L1 change of the normalized coefficients drops below the
// tolerance, or after max_iterations.
// =============================================================================

namespace dcv::kernel::refine {

namespace config {
    constexpr Index DEFAULT_MAX_ITERATIONS = 50;
    constexpr Real DEFAULT_TOLERANCE = Real(1e-6);
    constexpr Real DEFAULT_EPSILON = Real(1e-8);
}

struct Options {
    Index max_iterations = config::DEFAULT_MAX_ITERATIONS;
    Real tolerance = config::DEFAULT_TOLERANCE;
    Real epsilon = config::DEFAULT_EPSILON;
};

enum class Termination : std::uint8_t {
    Converged,
    MaxIterations,
    Aborted,       // a reweighted solve was invalid; the previous iterate is kept
    Skipped        // initial solve produced no valid coefficients
};

inline auto termination_name(Termination t) noexcept -> const char* {
    switch (t) {
        case Termination::Converged:     return "converged";
        case Termination::MaxIterations: return "max_iterations";
        case Termination::Aborted:       return "aborted";
        case Termination::Skipped:       return "skipped";
    }
    return "unknown";
}

struct Result {
    solver::SolverResult solution;
    Index iterations = 0;
    Termination termination = Termination::Skipped;
    Real last_change = std::numeric_limits<Real>::quiet_NaN();
};

namespace detail {

// Weights from the residual of the current raw fit. Non-finite weights are
// replaced by the smallest finite weight of this round so that no feature is
// ever dropped entirely; if none is finite the base weights are used.
inline auto residual_weights(const Mat& reference, const Vec& target, const Vec& raw,
                             const Vec& base, Real epsilon) -> Vec {
    const Vec abs_r = (target - reference * raw).cwiseAbs();
    const Real mean_abs = vectorize::sum(cview(abs_r)) / static_cast<Real>(abs_r.size());
    const Real denom = mean_abs + epsilon;

    Vec w(abs_r.size());
    Real min_finite = std::numeric_limits<Real>::infinity();
    for (Index f = 0; f < w.size(); ++f) {
        w(f) = base(f) * std::exp(-abs_r(f) / denom);
        if (std::isfinite(w(f))) {
            min_finite = std::min(min_finite, w(f));
        }
    }

    if (!std::isfinite(min_finite)) {
        return base;
    }
    for (Index f = 0; f < w.size(); ++f) {
        if (!std::isfinite(w(f))) {
            w(f) = min_finite;
        }
    }
    return w;
}

} // namespace detail

/// @brief Iteratively reweighted solve of one sample.
/// @param s            shared solver holding the reference
/// @param target        mixture column
/// @param base_weights  per-feature prior weights; empty means all ones
/// @param opts          iteration controls
/// @param context       label used in log records
inline Result refine(const solver::LinearSolver& s, const Vec& target,
                     const Vec& base_weights = Vec(), const Options& opts = {},
                     std::string_view context = {}) {
    DCV_CHECK_ARG(opts.max_iterations >= 0, "refine: max_iterations must be non-negative");
    DCV_CHECK_ARG(opts.tolerance >= Real(0) && opts.epsilon > Real(0),
                  "refine: tolerance must be >= 0 and epsilon > 0");

    const Index n_features = s.n_features();
    Vec base = base_weights.size() == 0 ? Vec::Ones(n_features) : base_weights;
    DCV_CHECK_DIM(base.size() == n_features, "refine: base weights length must equal the feature count");
    DCV_CHECK_ARG(base.allFinite() && base.minCoeff() >= Real(0),
                  "refine: base weights must be finite and non-negative");

    Result result;
    // The first iterate ignores the base weights; they enter through w_f
    result.solution = s.solve(target, context);
    if (!result.solution.valid) {
        result.termination = Termination::Skipped;
        return result;
    }

    result.termination = Termination::MaxIterations;
    for (Index it = 0; it < opts.max_iterations; ++it) {
        const Vec w = detail::residual_weights(s.reference(), target, result.solution.raw, base, opts.epsilon);
        solver::SolverResult next = s.solve(target, w, context);
        ++result.iterations;

        if (!next.valid) {
            DCV_LOG_WARN("refine: '" << context << "' reweighted solve invalid at iteration "
                         << result.iterations << ", keeping previous estimate");
            result.termination = Termination::Aborted;
            break;
        }

        const Real change = vectorize::sum_abs_diff(cview(next.coefficients),
                                                    cview(result.solution.coefficients));
        result.solution = std::move(next);
        result.last_change = change;

        if (change < opts.tolerance) {
            result.termination = Termination::Converged;
            break;
        }
    }

    if (result.termination == Termination::MaxIterations && opts.max_iterations > 0) {
        DCV_LOG_INFO("refine: '" << context << "' stopped after " << result.iterations
                     << " iterations, last change " << result.last_change);
    }

    // Final renormalization, harmless when sum-to-one already holds
    if (s.constraints().sum_to_one) {
        const Real total = vectorize::sum(cview(result.solution.coefficients));
        if (total > Real(0)) {
            result.solution.coefficients /= total;
        }
    }
    return result;
}

} // namespace dcv::kernel::refine
