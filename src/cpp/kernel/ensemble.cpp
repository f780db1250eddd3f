#include "dcv/kernel/ensemble.hpp"

#include "dcv/core/error.hpp"
#include "dcv/core/log.hpp"
#include "dcv/kernel/constraint.hpp"
#include "dcv/threading/parallel_for.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

namespace dcv::kernel::ensemble {

namespace {

using Clock = std::chrono::steady_clock;

auto elapsed_ms(Clock::time_point since) -> double {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

void validate(const ReferenceMatrix& reference, const MixtureMatrix& mixture, const Options& opts,
              const GroundTruthMatrix* truth) {
    DCV_CHECK_DIM(reference.rows() == mixture.rows(),
                  "ensemble: reference has " + std::to_string(reference.rows()) +
                  " features, mixture has " + std::to_string(mixture.rows()));
    DCV_CHECK_ARG(reference.values().allFinite(), "ensemble: reference contains non-finite values");
    DCV_CHECK_FRACTION(opts.constraints.min_fraction, "ensemble");
    DCV_CHECK_ARG(opts.refine.max_iterations >= 0 && opts.refine.tolerance >= Real(0) &&
                  opts.refine.epsilon > Real(0),
                  "ensemble: invalid refinement options");
    if (truth != nullptr) {
        DCV_CHECK_ARG(truth->values().allFinite() && (truth->values().array() >= Real(0)).all(),
                      "ensemble: ground truth must be finite and non-negative");
    }

    if (reference.row_names() != mixture.row_names()) {
        DCV_LOG_WARN("ensemble: reference and mixture feature labels differ, assuming the caller aligned them");
    }
}

bool degenerate_reference(const ReferenceMatrix& reference) {
    return reference.rows() == 0 || reference.cols() == 0 || reference.values().isZero(Real(0));
}

auto to_method(Strategy s) -> solver::Method {
    switch (s) {
        case Strategy::Nnls:                return solver::Method::Nnls;
        case Strategy::ConstrainedQp:       return solver::Method::SimplexQp;
        case Strategy::DualSimplexQp:       return solver::Method::DualQp;
        case Strategy::IterativeReweighted: return solver::Method::Nnls;
        case Strategy::JointFactorization:  return solver::Method::Nnls;
    }
    return solver::Method::Nnls;
}

auto count_valid(const std::vector<SampleProvenance>& provenance) -> Index {
    return static_cast<Index>(std::count_if(provenance.begin(), provenance.end(),
                                            [](const SampleProvenance& p) { return p.valid; }));
}

// Independent per-sample solves through a shared LinearSolver
StrategyOutput run_per_sample(Strategy strategy, const ReferenceMatrix& reference,
                              const MixtureMatrix& mixture, const Options& opts) {
    const solver::LinearSolver s(reference.values(), to_method(strategy), opts.constraints);
    const Index k = reference.cols();
    const Index n = mixture.cols();

    Mat proportions = Mat::Zero(k, n);
    std::vector<SampleProvenance> provenance(static_cast<Size>(n));

    threading::parallel_for(0, static_cast<size_t>(n), opts.n_threads, [&](size_t j) {
        const auto col = static_cast<Index>(j);
        const Vec target = mixture.values().col(col);
        const std::string& name = mixture.col_names()[j];

        SampleProvenance& p = provenance[j];
        p.strategy = strategy;

        if (strategy == Strategy::IterativeReweighted) {
            auto r = refine::refine(s, target, Vec(), opts.refine, name);
            p.diagnostic = r.solution.diagnostic;
            p.valid = r.solution.valid;
            p.refine_iterations = r.iterations;
            p.refine_termination = r.termination;
            proportions.col(col) = r.solution.coefficients;
        } else {
            auto r = s.solve(target, name);
            p.diagnostic = r.diagnostic;
            p.valid = r.valid;
            proportions.col(col) = r.coefficients;
        }
    });

    StrategyOutput out;
    out.strategy = strategy;
    out.proportions = ProportionsMatrix(std::move(proportions), reference.col_names(), mixture.col_names());
    out.n_valid = count_valid(provenance);
    out.provenance = std::move(provenance);
    return out;
}

StrategyOutput run_joint(const ReferenceMatrix& reference, const MixtureMatrix& mixture, const Options& opts) {
    const auto fit = factorization::factorize(reference.values(), mixture.values(),
                                              opts.factorization, opts.n_threads);
    const Index n = mixture.cols();

    Mat proportions = fit.weights;
    std::vector<SampleProvenance> provenance(static_cast<Size>(n));

    for (Index col = 0; col < n; ++col) {
        SampleProvenance& p = provenance[static_cast<Size>(col)];
        p.strategy = Strategy::JointFactorization;
        p.diagnostic.method = solver::Method::Nnls;
        p.diagnostic.iterations = fit.iterations;

        const auto target = mixture.values().col(col);
        if (target.isZero(Real(0))) {
            proportions.col(col).setZero();
            p.diagnostic.tier = solver::Tier::Skipped;
            p.diagnostic.reason = solver::Reason::ZeroTarget;
            DCV_LOG_WARN("ensemble: skipping '" << mixture.col_names()[static_cast<Size>(col)]
                         << "': " << solver::reason_name(solver::Reason::ZeroTarget));
            continue;
        }

        p.diagnostic.residual_norm = (target - fit.signatures * fit.weights.col(col)).norm();
        Vec coef = proportions.col(col);
        const auto report = constraint::enforce(view(coef), opts.constraints.min_fraction,
                                                opts.constraints.sum_to_one);
        p.valid = report.valid;
        if (!report.valid) {
            p.diagnostic.reason = solver::Reason::EmptySolution;
        }
        proportions.col(col) = coef;
    }

    StrategyOutput out;
    out.strategy = Strategy::JointFactorization;
    out.proportions = ProportionsMatrix(std::move(proportions), reference.col_names(), mixture.col_names());
    out.n_valid = count_valid(provenance);
    out.provenance = std::move(provenance);
    return out;
}

EnsembleResult last_resort(const ReferenceMatrix& reference, const MixtureMatrix& mixture, const Options& opts) {
    EnsembleResult result;
    result.mode = SelectionMode::LastResort;

    const Index k = reference.cols();
    const Index n = mixture.cols();
    Mat proportions = Mat::Zero(k, n);
    result.provenance.resize(static_cast<Size>(n));

    if (degenerate_reference(reference)) {
        DCV_LOG_ERROR("ensemble: reference is empty or all zero, every sample is left invalid");
        for (auto& p : result.provenance) {
            p.diagnostic.tier = solver::Tier::Skipped;
            p.diagnostic.reason = solver::Reason::EmptySolution;
        }
    } else if (n > 0) {
        DCV_LOG_WARN("ensemble: no strategy produced a result, applying ridge with clipping");
        const solver::LinearSolver s(reference.values(), solver::Method::Nnls, opts.constraints);
        threading::parallel_for(0, static_cast<size_t>(n), opts.n_threads, [&](size_t j) {
            const auto col = static_cast<Index>(j);
            auto r = s.solve_last_resort(mixture.values().col(col), mixture.col_names()[j]);
            result.provenance[j].diagnostic = r.diagnostic;
            result.provenance[j].valid = r.valid;
            proportions.col(col) = r.coefficients;
        });
    }

    result.proportions = ProportionsMatrix(std::move(proportions), reference.col_names(), mixture.col_names());
    return result;
}

} // namespace

// =============================================================================
// Names
// =============================================================================

auto strategy_name(Strategy s) noexcept -> const char* {
    switch (s) {
        case Strategy::Nnls:                return "nnls";
        case Strategy::ConstrainedQp:       return "constrained_qp";
        case Strategy::DualSimplexQp:       return "dual_simplex_qp";
        case Strategy::IterativeReweighted: return "iterative_reweighted";
        case Strategy::JointFactorization:  return "joint_factorization";
    }
    return "unknown";
}

std::optional<Strategy> parse_strategy(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(key.begin(), key.end(), '-', '_');
    for (const Strategy s : PRIORITY_ORDER) {
        if (key == strategy_name(s)) {
            return s;
        }
    }
    return std::nullopt;
}

auto selection_mode_name(SelectionMode m) noexcept -> const char* {
    switch (m) {
        case SelectionMode::GroundTruth: return "ground_truth";
        case SelectionMode::Priority:    return "priority";
        case SelectionMode::LastResort:  return "last_resort";
    }
    return "unknown";
}

auto strategy_status_name(StrategyStatus s) noexcept -> const char* {
    switch (s) {
        case StrategyStatus::Completed:       return "completed";
        case StrategyStatus::Failed:          return "failed";
        case StrategyStatus::SkippedByBudget: return "skipped_by_budget";
    }
    return "unknown";
}

std::vector<Strategy> EnsembleResult::excluded() const {
    std::vector<Strategy> out;
    for (const auto& r : reports) {
        if (r.status == StrategyStatus::Failed) {
            out.push_back(r.strategy);
        }
    }
    return out;
}

Index EnsembleResult::n_valid() const noexcept {
    return count_valid(provenance);
}

// =============================================================================
// Strategy dispatch
// =============================================================================

StrategyOutput run_strategy(Strategy strategy, const ReferenceMatrix& reference,
                            const MixtureMatrix& mixture, const Options& opts) {
    DCV_CHECK_DIM(reference.rows() == mixture.rows(),
                  "run_strategy: reference and mixture differ in feature count");

    switch (strategy) {
        case Strategy::Nnls:
        case Strategy::ConstrainedQp:
        case Strategy::DualSimplexQp:
        case Strategy::IterativeReweighted:
            return run_per_sample(strategy, reference, mixture, opts);
        case Strategy::JointFactorization:
            return run_joint(reference, mixture, opts);
    }
    throw InternalError("run_strategy: unhandled strategy");
}

// =============================================================================
// Ensemble
// =============================================================================

EnsembleResult run(const ReferenceMatrix& reference, const MixtureMatrix& mixture,
                   const Options& opts, const GroundTruthMatrix* truth) {
    validate(reference, mixture, opts, truth);

    const auto start = Clock::now();
    std::vector<StrategyReport> reports;
    std::vector<StrategyOutput> outputs;

    if (degenerate_reference(reference)) {
        EnsembleResult result = last_resort(reference, mixture, opts);
        for (const Strategy s : opts.strategies) {
            StrategyReport r;
            r.strategy = s;
            r.status = StrategyStatus::Failed;
            r.failure = "reference is empty or all zero";
            r.n_invalid = mixture.cols();
            result.reports.push_back(std::move(r));
        }
        return result;
    }

    if (mixture.cols() == 0) {
        DCV_LOG_INFO("ensemble: mixture has no samples");
        EnsembleResult result;
        result.mode = SelectionMode::LastResort;
        result.proportions = ProportionsMatrix(Mat::Zero(reference.cols(), 0), reference.col_names(), Labels{});
        return result;
    }

    bool budget_exhausted = false;
    for (const Strategy s : opts.strategies) {
        StrategyReport report;
        report.strategy = s;

        const bool duplicate = std::any_of(reports.begin(), reports.end(),
                                           [s](const StrategyReport& r) { return r.strategy == s; });
        if (duplicate) {
            DCV_LOG_WARN("ensemble: strategy " << strategy_name(s) << " requested twice, running it once");
            continue;
        }

        if (budget_exhausted ||
            (opts.time_budget && Clock::now() - start >= *opts.time_budget)) {
            if (!budget_exhausted) {
                DCV_LOG_WARN("ensemble: time budget of " << opts.time_budget->count()
                             << " ms exhausted, skipping remaining strategies");
            }
            budget_exhausted = true;
            report.status = StrategyStatus::SkippedByBudget;
            reports.push_back(std::move(report));
            continue;
        }

        const auto t0 = Clock::now();
        try {
            StrategyOutput out = run_strategy(s, reference, mixture, opts);
            report.status = StrategyStatus::Completed;
            report.n_valid = out.n_valid;
            report.n_invalid = mixture.cols() - out.n_valid;
            report.n_fallback = static_cast<Index>(std::count_if(
                out.provenance.begin(), out.provenance.end(),
                [](const SampleProvenance& p) { return p.diagnostic.fell_back(); }));
            report.mean_fit_r2 = metrics::mean_r2(
                evaluate::evaluate_fit(reference, mixture, out.proportions, opts.n_threads));
            outputs.push_back(std::move(out));
        } catch (const std::exception& e) {
            report.status = StrategyStatus::Failed;
            report.failure = e.what();
            report.n_invalid = mixture.cols();
            const auto* known = dynamic_cast<const Exception*>(&e);
            DCV_LOG_WARN("ensemble: strategy " << strategy_name(s) << " excluded ("
                         << (known != nullptr ? error_code_name(known->code()) : "unknown")
                         << " error): " << e.what());
        }
        report.elapsed_ms = elapsed_ms(t0);
        DCV_LOG_DEBUG("ensemble: " << strategy_name(s) << " " << strategy_status_name(report.status)
                      << " in " << report.elapsed_ms << " ms");
        reports.push_back(std::move(report));
    }

    auto find_report = [&](Strategy s) -> StrategyReport& {
        for (auto& r : reports) {
            if (r.strategy == s) return r;
        }
        throw InternalError("ensemble: missing report");
    };

    const StrategyOutput* chosen = nullptr;
    SelectionMode mode = SelectionMode::Priority;
    std::optional<evaluate::TruthComparison> chosen_truth;

    if (truth != nullptr) {
        std::optional<Real> best;
        for (const Strategy s : PRIORITY_ORDER) {
            for (const auto& out : outputs) {
                if (out.strategy != s || out.n_valid == 0) continue;
                auto cmp = evaluate::compare_to_truth(out.proportions, *truth);
                find_report(s).mean_truth_r2 = cmp.mean_r2;
                if (cmp.available && cmp.mean_r2 && (!best || *cmp.mean_r2 > *best)) {
                    best = cmp.mean_r2;
                    chosen = &out;
                    chosen_truth = std::move(cmp);
                }
            }
        }
        if (chosen != nullptr) {
            mode = SelectionMode::GroundTruth;
        } else {
            DCV_LOG_WARN("ensemble: ground truth not comparable with any strategy, using priority order");
        }
    }

    if (chosen == nullptr) {
        for (const Strategy s : PRIORITY_ORDER) {
            for (const auto& out : outputs) {
                if (out.strategy == s && out.n_valid > 0) {
                    chosen = &out;
                    break;
                }
            }
            if (chosen != nullptr) break;
        }
    }

    EnsembleResult result;
    if (chosen != nullptr) {
        result.proportions = chosen->proportions;
        result.provenance = chosen->provenance;
        result.chosen = chosen->strategy;
        result.mode = mode;
        result.truth = std::move(chosen_truth);
        DCV_LOG_INFO("ensemble: selected " << strategy_name(chosen->strategy)
                     << " by " << selection_mode_name(mode));
    } else {
        result = last_resort(reference, mixture, opts);
    }

    if (truth != nullptr && !result.truth) {
        result.truth = evaluate::compare_to_truth(result.proportions, *truth);
    }

    result.reports = std::move(reports);
    result.budget_exhausted = budget_exhausted;
    result.fit = evaluate::evaluate_fit(reference, mixture, result.proportions, opts.n_threads);
    return result;
}

} // namespace dcv::kernel::ensemble
