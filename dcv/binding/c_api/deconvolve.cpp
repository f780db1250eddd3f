// =============================================================================
// FILE: dcv/binding/c_api/deconvolve.cpp
// BRIEF: C ABI wrappers over dcv::kernel::ensemble, solver and evaluate
// =============================================================================

#include "dcv/binding/c_api/deconvolve.h"
#include "dcv/binding/c_api/internal.hpp"
#include "dcv/kernel/ensemble.hpp"
#include "dcv/kernel/evaluate.hpp"
#include "dcv/kernel/solver.hpp"

#include <chrono>
#include <limits>
#include <optional>
#include <string>

namespace dcv::binding {

namespace {

using kernel::ensemble::Strategy;

static_assert(DCV_STRATEGY_COUNT == kernel::ensemble::PRIORITY_ORDER.size());

auto to_ensemble_options(const dcv_options_t& in) -> kernel::ensemble::Options {
    kernel::ensemble::Options out;

    if (in.strategy_mask != 0) {
        out.strategies.clear();
        for (int id = 0; id < DCV_STRATEGY_COUNT; ++id) {
            if ((in.strategy_mask & (1U << id)) != 0) {
                out.strategies.push_back(static_cast<Strategy>(id));
            }
        }
    }
    DCV_CHECK_ARG((in.strategy_mask >> DCV_STRATEGY_COUNT) == 0, "strategy_mask has unknown bits set");

    out.constraints.sum_to_one = in.sum_to_one != DCV_FALSE;
    out.constraints.min_fraction = in.min_fraction;
    out.constraints.allow_fallback = in.allow_fallback != DCV_FALSE;
    out.refine.max_iterations = in.refine_max_iterations;
    out.refine.tolerance = in.refine_tolerance;
    out.factorization.max_iterations = in.factorization_max_iterations;
    out.factorization.tolerance = in.factorization_tolerance;
    out.n_threads = in.n_threads;
    if (in.time_budget_ms > 0) {
        out.time_budget = std::chrono::milliseconds(in.time_budget_ms);
    }
    return out;
}

auto to_method(int32_t method) -> kernel::solver::Method {
    switch (method) {
        case DCV_METHOD_NNLS:       return kernel::solver::Method::Nnls;
        case DCV_METHOD_SIMPLEX_QP: return kernel::solver::Method::SimplexQp;
        case DCV_METHOD_DUAL_QP:    return kernel::solver::Method::DualQp;
        default:
            throw ValueError("unknown method id " + std::to_string(method));
    }
}

inline auto or_nan(const std::optional<Real>& v) -> Real {
    return v.value_or(std::numeric_limits<Real>::quiet_NaN());
}

} // anonymous namespace

} // namespace dcv::binding

extern "C" {

DCV_C_EXPORT void dcv_options_default(dcv_options_t* opts) {
    if (opts == nullptr) {
        return;
    }
    const dcv::kernel::ensemble::Options defaults;
    opts->strategy_mask = 0;
    opts->sum_to_one = defaults.constraints.sum_to_one ? DCV_TRUE : DCV_FALSE;
    opts->min_fraction = defaults.constraints.min_fraction;
    opts->allow_fallback = defaults.constraints.allow_fallback ? DCV_TRUE : DCV_FALSE;
    opts->refine_max_iterations = defaults.refine.max_iterations;
    opts->refine_tolerance = defaults.refine.tolerance;
    opts->factorization_max_iterations = defaults.factorization.max_iterations;
    opts->factorization_tolerance = defaults.factorization.tolerance;
    opts->n_threads = defaults.n_threads;
    opts->time_budget_ms = 0;
}

DCV_C_EXPORT dcv_error_t dcv_deconvolve(
    const dcv_real_t* reference,
    dcv_index_t n_features,
    dcv_index_t n_cell_types,
    const dcv_real_t* mixture,
    dcv_index_t n_samples,
    const dcv_real_t* truth,
    const dcv_options_t* opts,
    dcv_real_t* proportions_out,
    dcv_bool_t* valid_out,
    int32_t* chosen_strategy,
    int32_t* selection_mode,
    uint32_t* excluded_mask
) {
    if (n_cell_types * n_samples > 0) {
        DCV_C_API_CHECK_NULL(proportions_out, "proportions_out is null");
    }

    DCV_C_API_TRY
        using namespace dcv;
        using namespace dcv::kernel;

        dcv_options_t local;
        dcv_options_default(&local);
        const auto options = binding::to_ensemble_options(opts != nullptr ? *opts : local);

        const ReferenceMatrix ref(binding::copy_matrix(reference, n_features, n_cell_types, "reference"));
        const MixtureMatrix mix(binding::copy_matrix(mixture, n_features, n_samples, "mixture"));

        std::optional<GroundTruthMatrix> gt;
        if (truth != nullptr) {
            gt.emplace(binding::copy_matrix(truth, n_cell_types, n_samples, "truth"),
                       ref.col_names(), mix.col_names());
        }

        const auto result = ensemble::run(ref, mix, options, gt ? &*gt : nullptr);

        binding::write_matrix(result.proportions.values(), proportions_out);
        if (valid_out != nullptr) {
            for (std::size_t j = 0; j < result.provenance.size(); ++j) {
                valid_out[j] = result.provenance[j].valid ? DCV_TRUE : DCV_FALSE;
            }
        }
        if (chosen_strategy != nullptr) {
            *chosen_strategy = result.chosen ? static_cast<int32_t>(*result.chosen)
                                             : DCV_STRATEGY_LAST_RESORT;
        }
        if (selection_mode != nullptr) {
            *selection_mode = static_cast<int32_t>(result.mode);
        }
        if (excluded_mask != nullptr) {
            uint32_t mask = 0;
            for (const auto s : result.excluded()) {
                mask |= 1U << static_cast<uint32_t>(s);
            }
            *excluded_mask = mask;
        }
        DCV_C_API_RETURN_OK;
    DCV_C_API_CATCH
}

DCV_C_EXPORT dcv_error_t dcv_solve_sample(
    const dcv_real_t* reference,
    dcv_index_t n_features,
    dcv_index_t n_cell_types,
    const dcv_real_t* target,
    int32_t method,
    const dcv_options_t* opts,
    dcv_real_t* coefficients_out,
    dcv_real_t* raw_out,
    dcv_bool_t* valid_out,
    int32_t* tier_out
) {
    DCV_C_API_CHECK_NULL(target, "target is null");
    DCV_C_API_CHECK_NULL(coefficients_out, "coefficients_out is null");

    DCV_C_API_TRY
        using namespace dcv;

        dcv_options_t local;
        dcv_options_default(&local);
        const auto options = binding::to_ensemble_options(opts != nullptr ? *opts : local);

        const kernel::solver::LinearSolver s(binding::copy_matrix(reference, n_features, n_cell_types, "reference"),
                                             binding::to_method(method), options.constraints);
        const Vec b = Eigen::Map<const Vec>(target, n_features);
        const auto r = s.solve(b);

        Eigen::Map<Vec>(coefficients_out, n_cell_types) = r.coefficients;
        if (raw_out != nullptr) {
            Eigen::Map<Vec>(raw_out, n_cell_types) = r.raw;
        }
        if (valid_out != nullptr) {
            *valid_out = r.valid ? DCV_TRUE : DCV_FALSE;
        }
        if (tier_out != nullptr) {
            *tier_out = static_cast<int32_t>(r.diagnostic.tier);
        }
        DCV_C_API_RETURN_OK;
    DCV_C_API_CATCH
}

DCV_C_EXPORT dcv_error_t dcv_evaluate_fit(
    const dcv_real_t* reference,
    dcv_index_t n_features,
    dcv_index_t n_cell_types,
    const dcv_real_t* mixture,
    dcv_index_t n_samples,
    const dcv_real_t* proportions,
    dcv_size_t n_threads,
    dcv_real_t* rmse_out,
    dcv_real_t* mae_out,
    dcv_real_t* r2_out,
    dcv_real_t* pearson_out,
    dcv_real_t* spearman_out
) {
    DCV_C_API_TRY
        using namespace dcv;

        const Mat ref = binding::copy_matrix(reference, n_features, n_cell_types, "reference");
        const Mat mix = binding::copy_matrix(mixture, n_features, n_samples, "mixture");
        const Mat props = binding::copy_matrix(proportions, n_cell_types, n_samples, "proportions");

        const auto fit = kernel::evaluate::evaluate_fit(ref, mix, props, n_threads);

        for (std::size_t j = 0; j < fit.size(); ++j) {
            if (rmse_out != nullptr) rmse_out[j] = binding::or_nan(fit[j].rmse);
            if (mae_out != nullptr) mae_out[j] = binding::or_nan(fit[j].mae);
            if (r2_out != nullptr) r2_out[j] = binding::or_nan(fit[j].r2);
            if (pearson_out != nullptr) pearson_out[j] = binding::or_nan(fit[j].pearson);
            if (spearman_out != nullptr) spearman_out[j] = binding::or_nan(fit[j].spearman);
        }
        DCV_C_API_RETURN_OK;
    DCV_C_API_CATCH
}

} // extern "C"
