#include "dcv/kernel/solver.hpp"

#include "dcv/core/log.hpp"
#include "dcv/kernel/constraint.hpp"
#include "dcv/kernel/nnls.hpp"
#include "dcv/kernel/qp.hpp"

#include <Eigen/Dense>

#include <string>
#include <utility>

namespace dcv::kernel::solver {

namespace {

constexpr std::array<Tier, 3> FULL_CHAIN = {Tier::Primary, Tier::Ridge, Tier::MeanProfile};
constexpr std::array<Tier, 1> PRIMARY_ONLY = {Tier::Primary};
constexpr std::array<Tier, 2> LAST_RESORT_CHAIN = {Tier::Ridge, Tier::MeanProfile};

auto from_qp(qp::Status s) noexcept -> Reason {
    switch (s) {
        case qp::Status::Optimal:             return Reason::None;
        case qp::Status::Infeasible:          return Reason::Infeasible;
        case qp::Status::NotPositiveDefinite: return Reason::NotPositiveDefinite;
        case qp::Status::Singular:            return Reason::Singular;
        case qp::Status::MaxIterations:       return Reason::NotConverged;
        case qp::Status::NonFinite:           return Reason::NonFinite;
    }
    return Reason::NonFinite;
}

// Mean Gram diagonal; zero only for an all-zero reference
auto gram_scale(const Mat& gram) -> Real {
    return gram.rows() > 0 ? gram.trace() / static_cast<Real>(gram.rows()) : Real(0);
}

auto finish(Attempt a) -> Attempt {
    if (a.ok && !a.x.allFinite()) {
        a.ok = false;
        a.reason = Reason::NonFinite;
    } else if (a.ok && !(a.x.maxCoeff() > Real(0))) {
        a.ok = false;
        a.reason = Reason::EmptySolution;
    }
    return a;
}

[[noreturn]] void raise_primary_failure(Method method, Reason reason, std::string_view context) {
    std::string msg = std::string("solver: ") + method_name(method) + " failed";
    if (!context.empty()) {
        msg += " on '" + std::string(context) + "'";
    }
    msg += std::string(": ") + reason_name(reason);

    switch (reason) {
        case Reason::Singular:
        case Reason::NotPositiveDefinite:
            throw SingularMatrixError(msg);
        case Reason::NotConverged:
            throw ConvergenceError(msg);
        default:
            throw NumericalError(msg);
    }
}

} // namespace

// =============================================================================
// Names
// =============================================================================

auto method_name(Method m) noexcept -> const char* {
    switch (m) {
        case Method::Nnls:      return "nnls";
        case Method::SimplexQp: return "simplex_qp";
        case Method::DualQp:    return "dual_qp";
    }
    return "unknown";
}

auto tier_name(Tier t) noexcept -> const char* {
    switch (t) {
        case Tier::Primary:     return "primary";
        case Tier::Ridge:       return "ridge";
        case Tier::MeanProfile: return "mean_profile";
        case Tier::Skipped:     return "skipped";
    }
    return "unknown";
}

auto reason_name(Reason r) noexcept -> const char* {
    switch (r) {
        case Reason::None:                return "none";
        case Reason::ZeroTarget:          return "all-zero target";
        case Reason::NonFiniteInput:      return "non-finite target";
        case Reason::Singular:            return "singular system";
        case Reason::NotPositiveDefinite: return "Hessian not positive definite";
        case Reason::NotConverged:        return "not converged";
        case Reason::NonFinite:           return "non-finite solution";
        case Reason::Infeasible:          return "infeasible";
        case Reason::EmptySolution:       return "empty solution";
    }
    return "unknown";
}

// =============================================================================
// LinearSolver
// =============================================================================

LinearSolver::LinearSolver(Mat reference, Method method, Constraints constraints)
    : reference_(std::move(reference)), method_(method), constraints_(constraints) {
    DCV_CHECK_DIM(reference_.rows() > 0 && reference_.cols() > 0,
                  "LinearSolver: reference must have at least one feature and one cell type");
    DCV_CHECK_ARG(reference_.allFinite(), "LinearSolver: reference contains non-finite values");
    DCV_CHECK_ARG(method_ != Method::SimplexQp || constraints_.sum_to_one,
                  "LinearSolver: simplex_qp requires sum-to-one");
    DCV_CHECK_FRACTION(constraints_.min_fraction, "LinearSolver");

    gram_.noalias() = reference_.transpose() * reference_;

    mean_profile_ = reference_.colwise().mean().transpose();
    mean_profile_ = mean_profile_.cwiseMax(Real(0));
}

bool LinearSolver::check_target(const Vec& target, SolverResult& out, std::string_view context) const {
    DCV_CHECK_DIM(target.size() == reference_.rows(),
                  "LinearSolver: target has " + std::to_string(target.size()) +
                  " features, reference has " + std::to_string(reference_.rows()));

    Reason reason = Reason::None;
    if (!target.allFinite()) {
        reason = Reason::NonFiniteInput;
    } else if (target.isZero(Real(0))) {
        reason = Reason::ZeroTarget;
    }
    if (reason == Reason::None) {
        return true;
    }

    out.coefficients = Vec::Zero(reference_.cols());
    out.raw = out.coefficients;
    out.valid = false;
    out.diagnostic.method = method_;
    out.diagnostic.tier = Tier::Skipped;
    out.diagnostic.reason = reason;
    DCV_LOG_WARN("solver: skipping '" << context << "': " << reason_name(reason));
    return false;
}

SolverResult LinearSolver::solve(const Vec& target, std::string_view context) const {
    SolverResult out;
    if (!check_target(target, out, context)) {
        return out;
    }
    if (constraints_.allow_fallback) {
        return run_chain(reference_, target, gram_, FULL_CHAIN, context);
    }
    return run_chain(reference_, target, gram_, PRIMARY_ONLY, context);
}

SolverResult LinearSolver::solve(const Vec& target, const Vec& weights, std::string_view context) const {
    DCV_CHECK_DIM(weights.size() == reference_.rows(),
                  "LinearSolver: weights length must equal the feature count");
    DCV_CHECK_ARG(weights.allFinite() && weights.minCoeff() >= Real(0),
                  "LinearSolver: weights must be finite and non-negative");

    SolverResult out;
    if (!check_target(target, out, context)) {
        return out;
    }

    const Vec sw = weights.cwiseSqrt();
    const Mat design = sw.asDiagonal() * reference_;
    const Vec b = sw.cwiseProduct(target);
    const Mat gram = design.transpose() * design;

    if (constraints_.allow_fallback) {
        return run_chain(design, b, gram, FULL_CHAIN, context);
    }
    return run_chain(design, b, gram, PRIMARY_ONLY, context);
}

SolverResult LinearSolver::solve_last_resort(const Vec& target, std::string_view context) const {
    SolverResult out;
    if (!check_target(target, out, context)) {
        return out;
    }
    return run_chain(reference_, target, gram_, LAST_RESORT_CHAIN, context);
}

SolverResult LinearSolver::run_chain(const Mat& design, const Vec& b, const Mat& gram,
                                     std::span<const Tier> tiers, std::string_view context) const {
    const Vec atb = design.transpose() * b;

    SolverResult out;
    out.diagnostic.method = method_;

    Attempt chosen;
    Tier chosen_tier = Tier::Skipped;
    for (const Tier tier : tiers) {
        Attempt a = attempt(tier, gram, atb);
        if (a.ok) {
            chosen = std::move(a);
            chosen_tier = tier;
            break;
        }
        if (tier == Tier::Primary) {
            out.diagnostic.reason = a.reason;
            if (!constraints_.allow_fallback) {
                raise_primary_failure(method_, a.reason, context);
            }
        }
        DCV_LOG_WARN("solver: " << method_name(method_) << " " << tier_name(tier)
                     << " tier failed on '" << context << "': " << reason_name(a.reason));
    }

    if (chosen_tier == Tier::Skipped) {
        throw NumericalError("solver: every fallback tier failed on '" + std::string(context) + "'");
    }

    if (chosen_tier != tiers.front()) {
        DCV_LOG_WARN("solver: '" << context << "' resolved by " << tier_name(chosen_tier) << " tier");
    }

    out.raw = chosen.x;
    out.coefficients = chosen.x;
    out.diagnostic.tier = chosen_tier;
    out.diagnostic.ridge = chosen.ridge;
    out.diagnostic.iterations = chosen.iterations;
    if (chosen_tier != Tier::MeanProfile) {
        out.diagnostic.residual_norm = (design * out.raw - b).norm();
    }

    const auto report = constraint::enforce(view(out.coefficients),
                                            constraints_.min_fraction, constraints_.sum_to_one);
    out.valid = report.valid;
    return out;
}

Attempt LinearSolver::attempt(Tier tier, const Mat& gram, const Vec& atb) const {
    switch (tier) {
        case Tier::Primary:     return finish(primary(gram, atb));
        case Tier::Ridge:       return finish(ridge(gram, atb));
        case Tier::MeanProfile: return finish(mean_profile());
        case Tier::Skipped:     break;
    }
    Attempt a;
    a.reason = Reason::EmptySolution;
    return a;
}

Attempt LinearSolver::primary(const Mat& gram, const Vec& atb) const {
    Attempt a;
    const Index k = gram.rows();

    if (method_ == Method::Nnls) {
        auto r = nnls::solve_normal(gram, atb, constraints_.max_iterations);
        a.iterations = r.iterations;
        switch (r.status) {
            case nnls::Status::Converged:
                a.ok = true;
                a.x = std::move(r.x);
                break;
            case nnls::Status::MaxIterations:
                a.reason = Reason::NotConverged;
                break;
            case nnls::Status::NonFinite:
                a.reason = Reason::NonFinite;
                break;
        }
        return a;
    }

    // Scale the objective so the QP tolerances do not depend on data units
    const Real s = gram_scale(gram);
    if (!(s > Real(0))) {
        a.reason = Reason::Singular;
        return a;
    }
    const Mat h = gram / s;
    const Vec c = atb / s;

    qp::Result r;
    if (method_ == Method::SimplexQp) {
        r = qp::solve_simplex(h, c, constraints_.max_iterations);
    } else {
        Mat ce(k, constraints_.sum_to_one ? 1 : 0);
        Vec ce0(constraints_.sum_to_one ? 1 : 0);
        if (constraints_.sum_to_one) {
            ce.setOnes();
            ce0(0) = Real(-1);
        }
        const Mat ci = Mat::Identity(k, k);
        const Vec ci0 = Vec::Zero(k);
        r = qp::solve_dual(h, -c, ce, ce0, ci, ci0, constraints_.max_iterations);
    }

    a.iterations = r.iterations;
    a.reason = from_qp(r.status);
    a.ok = r.status == qp::Status::Optimal;
    if (a.ok) {
        a.x = std::move(r.x);
    }
    return a;
}

Attempt LinearSolver::ridge(const Mat& gram, const Vec& atb) const {
    Attempt a;
    a.reason = Reason::Singular;

    const Real s = gram_scale(gram);
    if (!(s > Real(0))) {
        return a;
    }

    for (const Real eps : config::RIDGE_EPSILONS) {
        Mat regularized = gram;
        regularized.diagonal().array() += eps * s;

        Eigen::LLT<Mat> llt(regularized);
        if (llt.info() != Eigen::Success) {
            a.reason = Reason::NotPositiveDefinite;
            continue;
        }
        Vec x = llt.solve(atb);
        if (!x.allFinite()) {
            a.reason = Reason::NonFinite;
            continue;
        }
        x = x.cwiseMax(Real(0));
        if (!(x.maxCoeff() > Real(0))) {
            a.reason = Reason::EmptySolution;
            continue;
        }
        a.ok = true;
        a.reason = Reason::None;
        a.x = std::move(x);
        a.ridge = eps;
        a.iterations = 1;
        return a;
    }
    return a;
}

Attempt LinearSolver::mean_profile() const {
    Attempt a;
    a.x = mean_profile_;
    a.ok = mean_profile_.maxCoeff() > Real(0);
    if (!a.ok) {
        a.reason = Reason::EmptySolution;
    }
    return a;
}

} // namespace dcv::kernel::solver
