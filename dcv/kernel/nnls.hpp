#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/matrix.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

// =============================================================================
// FILE: dcv/kernel/nnls.hpp
// BRIEF: Lawson-Hanson active-set non-negative least squares
//
// min ||A x - b||^2  s.t.  x >= 0
//
// Works on the normal equations (G = A^T A, c = A^T b) so that one Gram
// matrix can be shared by every sample solved against the same reference.
// Columns that are linearly dependent on the current passive set are blocked
// instead of being admitted, which keeps every subproblem full rank.
// =============================================================================

namespace dcv::kernel::nnls {

namespace config {
    // Outer iteration cap is MAX_ITER_PER_VARIABLE * n_variables
    constexpr Index MAX_ITER_PER_VARIABLE = 3;
    constexpr Index MIN_MAX_ITER = 30;
    // Gradient tolerance, scaled by machine epsilon and problem size
    constexpr Real TOL_FACTOR = Real(10);
}

enum class Status : std::uint8_t {
    Converged,
    MaxIterations,
    NonFinite
};

struct Result {
    Vec x;
    Index iterations = 0;
    Status status = Status::Converged;
    Size n_blocked = 0;   // dependent columns never admitted to the passive set
};

namespace detail {

inline auto gather(const std::vector<char>& passive) -> std::vector<Index> {
    std::vector<Index> idx;
    for (Index j = 0; j < static_cast<Index>(passive.size()); ++j) {
        if (passive[static_cast<Size>(j)]) idx.push_back(j);
    }
    return idx;
}

// Unconstrained least squares restricted to the passive set.
// Returns false when G_PP is rank deficient.
inline bool solve_passive(const Mat& gram, const Vec& atb,
                          const std::vector<Index>& idx, Vec& z_p) {
    const auto p = static_cast<Index>(idx.size());
    Mat g_pp(p, p);
    Vec c_p(p);
    for (Index a = 0; a < p; ++a) {
        c_p(a) = atb(idx[static_cast<Size>(a)]);
        for (Index b = 0; b < p; ++b) {
            g_pp(a, b) = gram(idx[static_cast<Size>(a)], idx[static_cast<Size>(b)]);
        }
    }

    Eigen::ColPivHouseholderQR<Mat> qr(g_pp);
    if (qr.rank() < p) {
        return false;
    }
    z_p = qr.solve(c_p);
    return true;
}

} // namespace detail

/// @brief NNLS on precomputed normal equations.
/// @param gram     A^T A, K x K symmetric positive semi-definite
/// @param atb      A^T b, length K
/// @param max_iter 0 selects config::MAX_ITER_PER_VARIABLE * K
inline Result solve_normal(const Mat& gram, const Vec& atb, Index max_iter = 0) {
    const Index k = gram.rows();
    DCV_CHECK_DIM(gram.cols() == k && atb.size() == k,
                  "nnls: gram must be K x K and atb length K");

    Result result;
    result.x = Vec::Zero(k);
    if (k == 0) {
        return result;
    }

    if (max_iter <= 0) {
        max_iter = std::max(config::MAX_ITER_PER_VARIABLE * k, config::MIN_MAX_ITER);
    }

    const Real scale = std::max(gram.diagonal().cwiseAbs().maxCoeff(), atb.cwiseAbs().maxCoeff());
    const Real tol = config::TOL_FACTOR * std::numeric_limits<Real>::epsilon() *
                     static_cast<Real>(k) * std::max(scale, Real(1));

    std::vector<char> passive(static_cast<Size>(k), 0);
    std::vector<char> blocked(static_cast<Size>(k), 0);
    Vec& x = result.x;
    Vec w = atb;
    Vec z_p;

    while (true) {
        // Most violated KKT condition among the free, admissible variables
        Index t = -1;
        Real best = tol;
        for (Index j = 0; j < k; ++j) {
            if (!passive[static_cast<Size>(j)] && !blocked[static_cast<Size>(j)] && w(j) > best) {
                best = w(j);
                t = j;
            }
        }
        if (t < 0) {
            result.status = Status::Converged;
            break;
        }
        if (result.iterations >= max_iter) {
            result.status = Status::MaxIterations;
            break;
        }

        passive[static_cast<Size>(t)] = 1;
        bool first_pass = true;

        while (true) {
            ++result.iterations;
            const auto idx = detail::gather(passive);

            if (!detail::solve_passive(gram, atb, idx, z_p)) {
                // The entering column adds no new direction
                passive[static_cast<Size>(t)] = 0;
                blocked[static_cast<Size>(t)] = 1;
                ++result.n_blocked;
                break;
            }
            if (!z_p.allFinite()) {
                result.status = Status::NonFinite;
                return result;
            }

            if (z_p.minCoeff() > Real(0)) {
                x.setZero();
                for (Size a = 0; a < idx.size(); ++a) x(idx[a]) = z_p(static_cast<Index>(a));
                break;
            }

            // Step towards z until the first passive variable hits zero
            Real alpha = std::numeric_limits<Real>::max();
            Index leaving = -1;
            for (Size a = 0; a < idx.size(); ++a) {
                const Real zi = z_p(static_cast<Index>(a));
                if (zi <= Real(0)) {
                    const Real xi = x(idx[a]);
                    const Real step = xi / (xi - zi);
                    if (step < alpha) {
                        alpha = step;
                        leaving = idx[a];
                    }
                }
            }

            if (first_pass && leaving == t) {
                // Rounding can make the entering variable non-positive right away
                passive[static_cast<Size>(t)] = 0;
                blocked[static_cast<Size>(t)] = 1;
                ++result.n_blocked;
                break;
            }
            first_pass = false;

            for (Size a = 0; a < idx.size(); ++a) {
                const Index i = idx[a];
                x(i) += alpha * (z_p(static_cast<Index>(a)) - x(i));
                if (i == leaving || x(i) <= Real(0)) {
                    x(i) = Real(0);
                    passive[static_cast<Size>(i)] = 0;
                }
            }

            if (result.iterations >= max_iter) {
                result.status = Status::MaxIterations;
                return result;
            }
        }

        w.noalias() = atb - gram * x;
    }

    return result;
}

/// @brief NNLS on the design matrix directly.
inline Result solve(const Mat& a, const Vec& b, Index max_iter = 0) {
    DCV_CHECK_DIM(a.rows() == b.size(), "nnls: A rows must match b length");
    const Mat gram = a.transpose() * a;
    const Vec atb = a.transpose() * b;
    return solve_normal(gram, atb, max_iter);
}

} // namespace dcv::kernel::nnls
