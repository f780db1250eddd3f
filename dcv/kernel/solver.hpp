#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/macros.hpp"
#include "dcv/core/matrix.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>

// =============================================================================
// FILE: dcv/kernel/solver.hpp
// BRIEF: Per-sample constrained linear inverse with a tiered fallback chain
//
// One LinearSolver is built per (reference, method) and shared read-only by
// every sample. A solve walks an ordered list of tiers and stops at the first
// tier that produces a usable coefficient vector:
//
//   Primary      method-specific constrained solve (NNLS / simplex QP / dual QP)
//   Ridge        (G + eps s I) x = R^T b for eps in RIDGE_EPSILONS, then max(x, 0)
//   MeanProfile  per-cell-type mean of the reference, low confidence
//
// Each tier returns a typed Attempt instead of throwing. The result
// always passes through constraint::enforce().
// =============================================================================

namespace dcv::kernel::solver {

namespace config {
    constexpr std::array<Real, 3> RIDGE_EPSILONS = {Real(1e-10), Real(1e-6), Real(1e-2)};
}

enum class Method : std::uint8_t {
    Nnls,       // Lawson-Hanson, sum-to-one by renormalization
    SimplexQp,  // primal active set on the simplex
    DualQp      // Goldfarb-Idnani dual active set
};

enum class Tier : std::uint8_t {
    Primary,
    Ridge,
    MeanProfile,
    Skipped
};

enum class Reason : std::uint8_t {
    None,
    ZeroTarget,
    NonFiniteInput,
    Singular,
    NotPositiveDefinite,
    NotConverged,
    NonFinite,
    Infeasible,
    EmptySolution
};

DCV_EXPORT auto method_name(Method m) noexcept -> const char*;
DCV_EXPORT auto tier_name(Tier t) noexcept -> const char*;
DCV_EXPORT auto reason_name(Reason r) noexcept -> const char*;

struct Constraints {
    bool sum_to_one = true;
    Real min_fraction = Real(0);
    // false: a failed primary tier throws instead of falling back
    bool allow_fallback = true;
    // 0 selects the method's default
    Index max_iterations = 0;
};

struct Diagnostic {
    Method method = Method::Nnls;
    Tier tier = Tier::Primary;
    Reason reason = Reason::None;   // why the primary tier was abandoned or the sample skipped
    Real ridge = Real(0);           // epsilon used by the ridge tier
    Real residual_norm = std::numeric_limits<Real>::quiet_NaN();
    Index iterations = 0;

    [[nodiscard]] bool fell_back() const noexcept {
        return tier == Tier::Ridge || tier == Tier::MeanProfile;
    }
    [[nodiscard]] bool low_confidence() const noexcept { return tier == Tier::MeanProfile; }
};

struct SolverResult {
    Vec coefficients;   // after constraint enforcement
    Vec raw;            // as produced by the winning tier
    bool valid = false;
    Diagnostic diagnostic;
};

// Outcome of a single tier
struct Attempt {
    bool ok = false;
    Reason reason = Reason::None;
    Vec x;
    Index iterations = 0;
    Real ridge = Real(0);
};

class DCV_EXPORT LinearSolver {
public:
    /// @throws DimensionError if the reference has no features or no cell types
    /// @throws ValueError on non-finite reference entries, or SimplexQp without sum-to-one
    /// @throws RangeError if min_fraction is outside [0, 1)
    explicit LinearSolver(Mat reference, Method method = Method::Nnls, Constraints constraints = {});

    /// @brief Solve one mixture column.
    /// @param context label used in log records (usually the sample name)
    /// @throws DimensionError if target length differs from the feature count
    [[nodiscard]] SolverResult solve(const Vec& target, std::string_view context = {}) const;

    /// @brief Solve with per-feature weights (rows scaled by sqrt(w)).
    /// @throws ValueError on negative or non-finite weights
    [[nodiscard]] SolverResult solve(const Vec& target, const Vec& weights,
                                     std::string_view context = {}) const;

    /// @brief Ridge with clipping, then mean profile. Used when every
    /// strategy of an ensemble came back empty.
    [[nodiscard]] SolverResult solve_last_resort(const Vec& target, std::string_view context = {}) const;

    [[nodiscard]] auto reference() const noexcept -> const Mat& { return reference_; }
    [[nodiscard]] auto method() const noexcept -> Method { return method_; }
    [[nodiscard]] auto constraints() const noexcept -> const Constraints& { return constraints_; }
    [[nodiscard]] auto n_features() const noexcept -> Index { return reference_.rows(); }
    [[nodiscard]] auto n_cell_types() const noexcept -> Index { return reference_.cols(); }

private:
    SolverResult run_chain(const Mat& design, const Vec& b, const Mat& gram,
                           std::span<const Tier> tiers, std::string_view context) const;
    Attempt attempt(Tier tier, const Mat& gram, const Vec& atb) const;
    Attempt primary(const Mat& gram, const Vec& atb) const;
    Attempt ridge(const Mat& gram, const Vec& atb) const;
    Attempt mean_profile() const;
    bool check_target(const Vec& target, SolverResult& out, std::string_view context) const;

    Mat reference_;
    Method method_;
    Constraints constraints_;
    Mat gram_;
    Vec mean_profile_;
};

} // namespace dcv::kernel::solver
