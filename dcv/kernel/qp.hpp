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
// FILE: dcv/kernel/qp.hpp
// BRIEF: Dense convex quadratic programs
//
// solve_simplex: primal active-set method for
//     min 1/2 x^T H x - c^T x   s.t.  sum(x) = 1, x >= 0
//   starting from the barycenter, one KKT system per iteration.
//
// solve_dual: Goldfarb-Idnani dual active-set method for
//     min 1/2 x^T G x + g0^T x  s.t.  CE^T x + ce0 = 0, CI^T x + ci0 >= 0
//   starting from the unconstrained minimum. G must be positive definite.
//   Factorizations of the active set are updated with Givens rotations.
// =============================================================================

namespace dcv::kernel::qp {

namespace config {
    constexpr Index MAX_ITER_PER_VARIABLE = 10;
    constexpr Index MIN_MAX_ITER = 50;
    // Search direction below this is treated as zero (variables live on [0, 1])
    constexpr Real STEP_TOLERANCE = Real(1e-12);
    // Bound multipliers above -MULTIPLIER_TOLERANCE are accepted as optimal
    constexpr Real MULTIPLIER_TOLERANCE = Real(1e-10);
    // Squared ratio of smallest to largest Cholesky pivot below which G is singular
    constexpr Real MIN_PIVOT_RATIO = Real(1e-12);
}

enum class Status : std::uint8_t {
    Optimal,
    Infeasible,
    NotPositiveDefinite,
    Singular,
    MaxIterations,
    NonFinite
};

inline auto status_name(Status s) noexcept -> const char* {
    switch (s) {
        case Status::Optimal:             return "optimal";
        case Status::Infeasible:          return "infeasible";
        case Status::NotPositiveDefinite: return "not positive definite";
        case Status::Singular:            return "singular KKT system";
        case Status::MaxIterations:       return "iteration limit reached";
        case Status::NonFinite:           return "non-finite iterate";
    }
    return "unknown";
}

struct Result {
    Vec x;
    Real objective = Real(0);
    Status status = Status::Optimal;
    Index iterations = 0;
    Index n_active = 0;
};

// =============================================================================
// Primal active set on the probability simplex
// =============================================================================

/// @brief min 1/2 x^T H x - c^T x over the probability simplex.
/// @param h        K x K symmetric positive semi-definite
/// @param c        length K
/// @param max_iter 0 selects config::MAX_ITER_PER_VARIABLE * K
inline Result solve_simplex(const Mat& h, const Vec& c, Index max_iter = 0) {
    const Index k = h.rows();
    DCV_CHECK_DIM(h.cols() == k && c.size() == k, "solve_simplex: H must be K x K and c length K");
    DCV_CHECK_ARG(k > 0, "solve_simplex: empty problem");

    if (max_iter <= 0) {
        max_iter = std::max(config::MAX_ITER_PER_VARIABLE * k, config::MIN_MAX_ITER);
    }

    Result result;
    Vec& x = result.x;
    x = Vec::Constant(k, Real(1) / static_cast<Real>(k));

    // free[i] == 0 means x_i is held at its bound
    std::vector<char> free(static_cast<Size>(k), 1);
    std::vector<Index> idx;

    for (result.iterations = 0; result.iterations < max_iter; ++result.iterations) {
        idx.clear();
        for (Index i = 0; i < k; ++i) {
            if (free[static_cast<Size>(i)]) idx.push_back(i);
        }
        const auto nf = static_cast<Index>(idx.size());

        const Vec g = h * x - c;

        // [H_FF 1; 1^T 0] [p_F; mu] = [-g_F; 0]
        Mat kkt = Mat::Zero(nf + 1, nf + 1);
        Vec rhs = Vec::Zero(nf + 1);
        for (Index a = 0; a < nf; ++a) {
            for (Index b = 0; b < nf; ++b) {
                kkt(a, b) = h(idx[static_cast<Size>(a)], idx[static_cast<Size>(b)]);
            }
            kkt(a, nf) = Real(1);
            kkt(nf, a) = Real(1);
            rhs(a) = -g(idx[static_cast<Size>(a)]);
        }

        Eigen::FullPivLU<Mat> lu(kkt);
        if (!lu.isInvertible()) {
            result.status = Status::Singular;
            return result;
        }
        const Vec sol = lu.solve(rhs);
        if (!sol.allFinite()) {
            result.status = Status::NonFinite;
            return result;
        }
        const Real mu = sol(nf);

        if (sol.head(nf).cwiseAbs().maxCoeff() <= config::STEP_TOLERANCE) {
            // Stationary on the current face: release the bound with the most
            // negative multiplier lambda_i = g_i + mu, or stop
            Index release = -1;
            Real most_negative = -config::MULTIPLIER_TOLERANCE;
            for (Index i = 0; i < k; ++i) {
                if (free[static_cast<Size>(i)]) continue;
                const Real lambda = g(i) + mu;
                if (lambda < most_negative) {
                    most_negative = lambda;
                    release = i;
                }
            }
            if (release < 0) {
                result.status = Status::Optimal;
                result.n_active = k - nf;
                result.objective = Real(0.5) * x.dot(h * x) - c.dot(x);
                return result;
            }
            free[static_cast<Size>(release)] = 1;
            continue;
        }

        // Longest feasible step along p, capped at the full Newton step
        Real alpha = Real(1);
        Index blocking = -1;
        for (Index a = 0; a < nf; ++a) {
            const Real pa = sol(a);
            if (pa < Real(0)) {
                const Real step = -x(idx[static_cast<Size>(a)]) / pa;
                if (step < alpha) {
                    alpha = step;
                    blocking = idx[static_cast<Size>(a)];
                }
            }
        }

        for (Index a = 0; a < nf; ++a) {
            x(idx[static_cast<Size>(a)]) += alpha * sol(a);
        }
        if (blocking >= 0) {
            x(blocking) = Real(0);
            free[static_cast<Size>(blocking)] = 0;
        }
    }

    result.status = Status::MaxIterations;
    return result;
}

// =============================================================================
// Goldfarb-Idnani dual active set
// =============================================================================

namespace detail {

// Appends the constraint whose transformed normal is d to the active set.
// Returns false when the new normal is linearly dependent on the active ones.
inline bool add_constraint(Mat& r, Mat& j, Vec& d, Index& iq, Real& r_norm) {
    const Index n = d.size();

    for (Index col = n - 1; col >= iq + 1; --col) {
        Real cc = d(col - 1);
        Real ss = d(col);
        const Real h = std::hypot(cc, ss);
        if (h == Real(0)) continue;

        d(col) = Real(0);
        ss /= h;
        cc /= h;
        if (cc < Real(0)) {
            cc = -cc;
            ss = -ss;
            d(col - 1) = -h;
        } else {
            d(col - 1) = h;
        }
        const Real xny = ss / (Real(1) + cc);
        for (Index k = 0; k < n; ++k) {
            const Real t1 = j(k, col - 1);
            const Real t2 = j(k, col);
            j(k, col - 1) = t1 * cc + t2 * ss;
            j(k, col) = xny * (t1 + j(k, col - 1)) - t2;
        }
    }

    ++iq;
    for (Index i = 0; i < iq; ++i) {
        r(i, iq - 1) = d(i);
    }

    if (std::abs(d(iq - 1)) <= std::numeric_limits<Real>::epsilon() * r_norm) {
        return false;
    }
    r_norm = std::max(r_norm, std::abs(d(iq - 1)));
    return true;
}

// Removes inequality constraint l from the active set and restores the
// triangular shape of R.
inline void delete_constraint(Mat& r, Mat& j, std::vector<Index>& active, Vec& u,
                              Index n_eq, Index& iq, Index l) {
    const Index n = r.rows();
    Index qq = -1;
    for (Index i = n_eq; i < iq; ++i) {
        if (active[static_cast<Size>(i)] == l) {
            qq = i;
            break;
        }
    }
    DCV_CHECK_INVARIANT(qq >= 0, "delete_constraint: constraint not in active set");

    for (Index i = qq; i < iq - 1; ++i) {
        active[static_cast<Size>(i)] = active[static_cast<Size>(i + 1)];
        u(i) = u(i + 1);
        r.col(i) = r.col(i + 1);
    }
    active[static_cast<Size>(iq - 1)] = active[static_cast<Size>(iq)];
    u(iq - 1) = u(iq);
    active[static_cast<Size>(iq)] = 0;
    u(iq) = Real(0);
    for (Index row = 0; row < iq; ++row) {
        r(row, iq - 1) = Real(0);
    }
    --iq;

    if (iq == 0) return;

    for (Index col = qq; col < iq; ++col) {
        Real cc = r(col, col);
        Real ss = r(col + 1, col);
        const Real h = std::hypot(cc, ss);
        if (h == Real(0)) continue;

        cc /= h;
        ss /= h;
        r(col + 1, col) = Real(0);
        if (cc < Real(0)) {
            r(col, col) = -h;
            cc = -cc;
            ss = -ss;
        } else {
            r(col, col) = h;
        }
        const Real xny = ss / (Real(1) + cc);
        for (Index k = col + 1; k < iq; ++k) {
            const Real t1 = r(col, k);
            const Real t2 = r(col + 1, k);
            r(col, k) = t1 * cc + t2 * ss;
            r(col + 1, k) = xny * (t1 + r(col, k)) - t2;
        }
        for (Index k = 0; k < n; ++k) {
            const Real t1 = j(k, col);
            const Real t2 = j(k, col + 1);
            j(k, col) = t1 * cc + t2 * ss;
            j(k, col + 1) = xny * (j(k, col) + t1) - t2;
        }
    }
}

// z = J[:, iq:] d[iq:],  r = R[:iq, :iq]^{-1} d[:iq]
inline void step_direction(const Mat& r_mat, const Mat& j, const Vec& d, Index iq, Vec& z, Vec& r) {
    const Index n = j.rows();
    z = j.rightCols(n - iq) * d.tail(n - iq);
    if (iq > 0) {
        r.head(iq) = r_mat.topLeftCorner(iq, iq).triangularView<Eigen::Upper>().solve(d.head(iq));
    }
}

} // namespace detail

/// @brief Goldfarb-Idnani dual method.
/// @param g        n x n symmetric positive definite
/// @param g0       linear term, length n
/// @param ce, ce0  equality constraints, n x p and length p (p may be 0)
/// @param ci, ci0  inequality constraints, n x m and length m
inline Result solve_dual(const Mat& g, const Vec& g0,
                         const Mat& ce, const Vec& ce0,
                         const Mat& ci, const Vec& ci0,
                         Index max_iter = 0) {
    const Index n = g.rows();
    const Index p = ce.cols();
    const Index m = ci.cols();
    DCV_CHECK_DIM(g.cols() == n && g0.size() == n, "solve_dual: G must be n x n and g0 length n");
    DCV_CHECK_DIM((p == 0 || ce.rows() == n) && ce0.size() == p, "solve_dual: CE must be n x p and ce0 length p");
    DCV_CHECK_DIM((m == 0 || ci.rows() == n) && ci0.size() == m, "solve_dual: CI must be n x m and ci0 length m");
    DCV_CHECK_ARG(n > 0, "solve_dual: empty problem");

    if (max_iter <= 0) {
        max_iter = std::max(config::MAX_ITER_PER_VARIABLE * (n + m), config::MIN_MAX_ITER);
    }

    constexpr Real inf = std::numeric_limits<Real>::infinity();
    constexpr Real eps = std::numeric_limits<Real>::epsilon();

    Result result;
    Vec& x = result.x;
    x = Vec::Zero(n);

    Eigen::LLT<Mat> chol(g);
    if (chol.info() != Eigen::Success) {
        result.status = Status::NotPositiveDefinite;
        return result;
    }
    const Mat lower = chol.matrixL();
    const Real pivot_ratio = lower.diagonal().minCoeff() / lower.diagonal().maxCoeff();
    if (!(pivot_ratio * pivot_ratio > config::MIN_PIVOT_RATIO)) {
        result.status = Status::NotPositiveDefinite;
        return result;
    }

    // J = L^{-T}; columns iq.. span the null space of the active normals
    Mat j = lower.transpose().triangularView<Eigen::Upper>().solve(Mat::Identity(n, n));
    const Real c1 = g.trace();
    const Real c2 = j.trace();

    x = chol.solve(-g0);
    Real f = Real(0.5) * g0.dot(x);

    Mat r_mat = Mat::Zero(n, n);
    Real r_norm = Real(1);
    Vec d = Vec::Zero(n);
    Vec z = Vec::Zero(n);
    Vec r = Vec::Zero(n + p + m);
    Vec u = Vec::Zero(n + p + m);
    Vec u_old = Vec::Zero(n + p + m);
    std::vector<Index> active(static_cast<Size>(n + p + m + 1), 0);
    std::vector<Index> active_old(active.size(), 0);
    Index iq = 0;

    // Equalities enter first and never leave
    for (Index i = 0; i < p; ++i) {
        const Vec np = ce.col(i);
        d = j.transpose() * np;
        detail::step_direction(r_mat, j, d, iq, z, r);

        Real t2 = Real(0);
        if (z.squaredNorm() > eps) {
            t2 = (-np.dot(x) - ce0(i)) / z.dot(np);
        }
        x += t2 * z;
        u(iq) = t2;
        u.head(iq) -= t2 * r.head(iq);
        f += Real(0.5) * t2 * t2 * z.dot(np);
        active[static_cast<Size>(i)] = -i - 1;

        if (!detail::add_constraint(r_mat, j, d, iq, r_norm)) {
            result.status = Status::Singular;
            return result;
        }
    }

    // iai[i] == -1 marks inequality i as active; iaexcl[i] == 0 excludes it
    // from selection until the next full step
    std::vector<Index> iai(static_cast<Size>(m));
    std::vector<char> iaexcl(static_cast<Size>(m), 1);
    for (Index i = 0; i < m; ++i) iai[static_cast<Size>(i)] = i;
    Vec s = Vec::Zero(m);
    Vec x_old = x;
    Vec np(n);
    Index ip = 0;

    enum class Phase { Select, Pick, Step };
    Phase phase = Phase::Select;

    while (true) {
        if (result.iterations >= max_iter) {
            result.status = Status::MaxIterations;
            return result;
        }

        if (phase == Phase::Select) {
            ++result.iterations;
            for (Index i = p; i < iq; ++i) {
                iai[static_cast<Size>(active[static_cast<Size>(i)])] = -1;
            }

            Real psi = Real(0);
            for (Index i = 0; i < m; ++i) {
                iaexcl[static_cast<Size>(i)] = 1;
                s(i) = ci.col(i).dot(x) + ci0(i);
                psi += std::min(Real(0), s(i));
            }
            if (std::abs(psi) <= static_cast<Real>(m) * eps * c1 * c2 * Real(100)) {
                break;
            }

            u_old.head(iq) = u.head(iq);
            std::copy_n(active.begin(), iq, active_old.begin());
            x_old = x;
            phase = Phase::Pick;
            continue;
        }

        if (phase == Phase::Pick) {
            Real ss = Real(0);
            for (Index i = 0; i < m; ++i) {
                const auto si = static_cast<Size>(i);
                if (s(i) < ss && iai[si] != -1 && iaexcl[si]) {
                    ss = s(i);
                    ip = i;
                }
            }
            if (ss >= Real(0)) {
                break;
            }
            np = ci.col(ip);
            u(iq) = Real(0);
            active[static_cast<Size>(iq)] = ip;
            phase = Phase::Step;
            continue;
        }

        // Phase::Step
        ++result.iterations;
        d = j.transpose() * np;
        detail::step_direction(r_mat, j, d, iq, z, r);

        // Partial step: largest dual step keeping active multipliers >= 0
        Real t1 = inf;
        Index l = -1;
        for (Index k = p; k < iq; ++k) {
            if (r(k) > Real(0) && u(k) / r(k) < t1) {
                t1 = u(k) / r(k);
                l = active[static_cast<Size>(k)];
            }
        }
        // Full step: primal step making constraint ip active
        Real t2 = inf;
        if (z.squaredNorm() > eps) {
            t2 = -s(ip) / z.dot(np);
            if (t2 < Real(0)) t2 = inf;
        }
        const Real t = std::min(t1, t2);

        if (t >= inf) {
            result.status = Status::Infeasible;
            return result;
        }

        if (t2 >= inf) {
            // Step in dual space only
            u.head(iq) -= t * r.head(iq);
            u(iq) += t;
            iai[static_cast<Size>(l)] = l;
            detail::delete_constraint(r_mat, j, active, u, p, iq, l);
            continue;
        }

        x += t * z;
        f += t * z.dot(np) * (Real(0.5) * t + u(iq));
        u.head(iq) -= t * r.head(iq);
        u(iq) += t;

        if (!x.allFinite()) {
            result.status = Status::NonFinite;
            return result;
        }

        if (std::abs(t - t2) < eps) {
            if (!detail::add_constraint(r_mat, j, d, iq, r_norm)) {
                // Degenerate: drop ip for this round and restore the last state
                iaexcl[static_cast<Size>(ip)] = 0;
                detail::delete_constraint(r_mat, j, active, u, p, iq, ip);
                for (Index i = 0; i < m; ++i) iai[static_cast<Size>(i)] = i;
                for (Index i = p; i < iq; ++i) {
                    active[static_cast<Size>(i)] = active_old[static_cast<Size>(i)];
                    u(i) = u_old(i);
                    iai[static_cast<Size>(active[static_cast<Size>(i)])] = -1;
                }
                x = x_old;
                phase = Phase::Pick;
            } else {
                iai[static_cast<Size>(ip)] = -1;
                phase = Phase::Select;
            }
            continue;
        }

        // Partial step: constraint l leaves, keep working on ip
        iai[static_cast<Size>(l)] = l;
        detail::delete_constraint(r_mat, j, active, u, p, iq, l);
        s(ip) = ci.col(ip).dot(x) + ci0(ip);
    }

    result.status = Status::Optimal;
    result.objective = f;
    result.n_active = iq;
    return result;
}

} // namespace dcv::kernel::qp
