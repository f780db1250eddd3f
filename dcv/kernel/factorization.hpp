#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/log.hpp"
#include "dcv/core/matrix.hpp"
#include "dcv/kernel/matching.hpp"
#include "dcv/kernel/nnls.hpp"
#include "dcv/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

// =============================================================================
// FILE: dcv/kernel/factorization.hpp
// BRIEF: Reference-anchored non-negative factorization of a mixture matrix
//
// All samples are fitted jointly, letting the signatures drift from the
// reference where the mixtures disagree with it:
//
//   min ||M - W H||_F^2 + lambda ||W - R||_F^2   s.t. W, H >= 0
//
// with lambda = anchor_weight * ||M||_F^2 / ||R||_F^2 so that the anchor does
// not depend on data units. W starts at R, H at the per-sample NNLS fit.
// Lee-Seung multiplicative updates keep both factors non-negative.
// After fitting, factors are re-anchored to reference columns by profile
// correlation so that row k of H always refers to reference cell type k.
// =============================================================================

namespace dcv::kernel::factorization {

namespace config {
    constexpr Index DEFAULT_MAX_ITERATIONS = 200;
    constexpr Real DEFAULT_TOLERANCE = Real(1e-6);
    constexpr Real DEFAULT_ANCHOR_WEIGHT = Real(1);
    // Denominator floor of the multiplicative updates
    constexpr Real EPSILON = Real(1e-12);
    // Share of the column mass spread over every entry of the initial H,
    // since multiplicative updates cannot revive exact zeros
    constexpr Real INIT_FLOOR = Real(1e-3);
}

struct Options {
    Index max_iterations = config::DEFAULT_MAX_ITERATIONS;
    Real tolerance = config::DEFAULT_TOLERANCE;
    Real anchor_weight = config::DEFAULT_ANCHOR_WEIGHT;
};

struct Result {
    Mat signatures;                 // W, features x cell types
    Mat weights;                    // H, cell types x samples (unnormalized)
    Index iterations = 0;
    bool converged = false;
    Real objective = Real(0);
    matching::IdentityAssignment identity;
};

namespace detail {

inline Real objective(const Mat& m, const Mat& w, const Mat& h, const Mat& r, Real lambda) {
    return (m - w * h).squaredNorm() + lambda * (w - r).squaredNorm();
}

} // namespace detail

/// @brief Joint factorization of every mixture column.
/// @throws DomainError on negative or non-finite entries, or an all-zero reference
/// @throws DimensionError if the feature counts differ
inline Result factorize(const Mat& reference, const Mat& mixture, const Options& opts = {},
                        size_t n_threads = 1) {
    DCV_CHECK_DIM(reference.rows() == mixture.rows(),
                  "factorize: reference and mixture differ in feature count");
    DCV_CHECK_ARG(opts.max_iterations >= 0 && opts.tolerance >= Real(0) && opts.anchor_weight >= Real(0),
                  "factorize: iteration count, tolerance and anchor weight must be non-negative");
    if (!reference.allFinite() || !mixture.allFinite() ||
        reference.minCoeff() < Real(0) || mixture.minCoeff() < Real(0)) {
        throw DomainError("factorize: joint factorization requires finite non-negative input");
    }

    const Real ref_norm2 = reference.squaredNorm();
    if (!(ref_norm2 > Real(0))) {
        throw DomainError("factorize: reference is all zero");
    }

    const Index k = reference.cols();
    const Index n = mixture.cols();
    const Real lambda = opts.anchor_weight * mixture.squaredNorm() / ref_norm2;

    Result out;
    Mat& w = out.signatures;
    Mat& h = out.weights;
    w = reference;
    h = Mat::Zero(k, n);

    // Warm start from independent per-sample fits
    const Mat gram = reference.transpose() * reference;
    const Mat rtm = reference.transpose() * mixture;
    threading::parallel_for(0, static_cast<size_t>(n), n_threads, [&](size_t j) {
        const auto col = static_cast<Index>(j);
        auto fit = nnls::solve_normal(gram, rtm.col(col));
        Vec x = fit.status == nnls::Status::NonFinite ? Vec::Zero(k) : fit.x;
        const Real mass = x.sum();
        if (mass > Real(0)) {
            x.array() += config::INIT_FLOOR * mass / static_cast<Real>(k);
        }
        h.col(col) = x;
    });

    Real prev = detail::objective(mixture, w, h, reference, lambda);
    out.objective = prev;

    for (Index it = 0; it < opts.max_iterations; ++it) {
        // H <- H * (W^T M) / (W^T W H)
        const Mat wtm = w.transpose() * mixture;
        const Mat wtw = w.transpose() * w;
        threading::parallel_for(0, static_cast<size_t>(n), n_threads, [&](size_t j) {
            const auto col = static_cast<Index>(j);
            const Vec denom = ((wtw * h.col(col)).array() + config::EPSILON).matrix();
            h.col(col) = h.col(col).cwiseProduct(wtm.col(col)).cwiseQuotient(denom);
        });

        // W <- W * (M H^T + lambda R) / (W H H^T + lambda W)
        const Mat hht = h * h.transpose();
        const Mat numer = mixture * h.transpose() + lambda * reference;
        const Mat denom = ((w * hht + lambda * w).array() + config::EPSILON).matrix();
        w = w.cwiseProduct(numer).cwiseQuotient(denom);

        ++out.iterations;
        const Real curr = detail::objective(mixture, w, h, reference, lambda);
        out.objective = curr;
        if (!std::isfinite(curr)) {
            throw NumericalError("factorize: objective became non-finite");
        }
        if (std::abs(prev - curr) <= opts.tolerance * std::max(prev, std::numeric_limits<Real>::min())) {
            out.converged = true;
            break;
        }
        prev = curr;
    }

    if (!out.converged) {
        DCV_LOG_INFO("factorize: stopped after " << out.iterations << " iterations");
    }

    out.identity = matching::assign_identities(w, reference);
    if (!out.identity.is_identity()) {
        DCV_LOG_WARN("factorize: factors drifted from their reference cell types, re-anchoring by correlation");
        Mat w_aligned = Mat::Zero(w.rows(), k);
        Mat h_aligned = Mat::Zero(k, n);
        for (Index e = 0; e < k; ++e) {
            const Index target = out.identity.mapping[static_cast<Size>(e)];
            if (target < 0) continue;
            w_aligned.col(target) = w.col(e);
            h_aligned.row(target) = h.row(e);
        }
        w = std::move(w_aligned);
        h = std::move(h_aligned);
    }

    return out;
}

} // namespace dcv::kernel::factorization
