#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/macros.hpp"
#include "dcv/core/matrix.hpp"
#include "dcv/kernel/evaluate.hpp"
#include "dcv/kernel/factorization.hpp"
#include "dcv/kernel/metrics.hpp"
#include "dcv/kernel/refine.hpp"
#include "dcv/kernel/solver.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: dcv/kernel/ensemble.hpp
// BRIEF: Running several deconvolution strategies and choosing one result
//
// Each requested strategy solves every sample. A strategy that throws is
// excluded and reported; it never aborts the run. Selection:
//
//   1. ground truth given and comparable: highest mean R^2 against it
//   2. otherwise: first strategy of PRIORITY_ORDER with a valid sample
//   3. otherwise: ridge with clipping per sample (then mean profile)
//
// Ties in 1 are resolved by PRIORITY_ORDER.
// =============================================================================

namespace dcv::kernel::ensemble {

enum class Strategy : std::uint8_t {
    Nnls,
    ConstrainedQp,
    DualSimplexQp,
    IterativeReweighted,
    JointFactorization
};

inline constexpr std::array<Strategy, 5> PRIORITY_ORDER = {
    Strategy::Nnls,
    Strategy::ConstrainedQp,
    Strategy::DualSimplexQp,
    Strategy::IterativeReweighted,
    Strategy::JointFactorization
};

DCV_EXPORT auto strategy_name(Strategy s) noexcept -> const char*;

/// @brief Inverse of strategy_name(), case-insensitive; nullopt if unknown.
DCV_EXPORT std::optional<Strategy> parse_strategy(std::string_view name);

enum class SelectionMode : std::uint8_t {
    GroundTruth,
    Priority,
    LastResort
};

DCV_EXPORT auto selection_mode_name(SelectionMode m) noexcept -> const char*;

struct Options {
    std::vector<Strategy> strategies{PRIORITY_ORDER.begin(), PRIORITY_ORDER.end()};
    solver::Constraints constraints;
    refine::Options refine;
    factorization::Options factorization;
    // Degree of parallelism over samples; 1 = sequential, 0 = all configured threads
    size_t n_threads = 1;
    // Strategies not yet started when the budget runs out are skipped
    std::optional<std::chrono::milliseconds> time_budget;
};

struct SampleProvenance {
    std::optional<Strategy> strategy;   // nullopt: last-resort solve
    solver::Diagnostic diagnostic;
    bool valid = false;
    // Set by the iterative-reweighted strategy only
    std::optional<refine::Termination> refine_termination;
    Index refine_iterations = 0;
};

struct StrategyOutput {
    Strategy strategy = Strategy::Nnls;
    ProportionsMatrix proportions;
    std::vector<SampleProvenance> provenance;
    Index n_valid = 0;
};

enum class StrategyStatus : std::uint8_t {
    Completed,
    Failed,
    SkippedByBudget
};

DCV_EXPORT auto strategy_status_name(StrategyStatus s) noexcept -> const char*;

struct StrategyReport {
    Strategy strategy = Strategy::Nnls;
    StrategyStatus status = StrategyStatus::Completed;
    std::string failure;
    Index n_valid = 0;
    Index n_invalid = 0;
    Index n_fallback = 0;
    std::optional<Real> mean_fit_r2;
    std::optional<Real> mean_truth_r2;
    double elapsed_ms = 0.0;
};

struct EnsembleResult {
    ProportionsMatrix proportions;          // cell types x samples
    std::optional<Strategy> chosen;         // nullopt in LastResort mode
    SelectionMode mode = SelectionMode::LastResort;
    std::vector<StrategyReport> reports;    // one per requested strategy, request order
    std::vector<SampleProvenance> provenance;
    std::vector<metrics::FitMetrics> fit;
    std::optional<evaluate::TruthComparison> truth;
    bool budget_exhausted = false;

    /// @brief Strategies that threw and were left out of selection.
    [[nodiscard]] std::vector<Strategy> excluded() const;
    [[nodiscard]] Index n_valid() const noexcept;
};

/// @brief Run one strategy over every sample.
/// @throws any dcv::Exception raised by the strategy; run() catches these
DCV_EXPORT StrategyOutput run_strategy(Strategy strategy, const ReferenceMatrix& reference,
                                       const MixtureMatrix& mixture, const Options& opts);

/// @brief Run the requested strategies and select one result.
/// @param truth optional known proportions (cell types x samples), may be null
/// @throws DimensionError if reference and mixture differ in feature count
/// @throws ValueError / RangeError on invalid options or a non-finite reference
DCV_EXPORT EnsembleResult run(const ReferenceMatrix& reference, const MixtureMatrix& mixture,
                              const Options& opts = {}, const GroundTruthMatrix* truth = nullptr);

} // namespace dcv::kernel::ensemble
