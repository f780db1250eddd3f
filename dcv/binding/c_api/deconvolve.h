#pragma once

// =============================================================================
// FILE: dcv/binding/c_api/deconvolve.h
// BRIEF: C ABI for ensemble deconvolution, single-sample solves and fit scoring
// =============================================================================
//
// Shapes (all column-major):
//   reference   n_features x n_cell_types
//   mixture     n_features x n_samples
//   proportions n_cell_types x n_samples
//   truth       n_cell_types x n_samples, rows/columns matched by position
//
// Undefined metrics are reported as NaN.

#include "dcv/binding/c_api/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// Strategy ids, in priority order
#define DCV_STRATEGY_NNLS 0
#define DCV_STRATEGY_CONSTRAINED_QP 1
#define DCV_STRATEGY_DUAL_SIMPLEX_QP 2
#define DCV_STRATEGY_ITERATIVE_REWEIGHTED 3
#define DCV_STRATEGY_JOINT_FACTORIZATION 4
#define DCV_STRATEGY_COUNT 5

// Reported as chosen_strategy when no strategy produced a result
#define DCV_STRATEGY_LAST_RESORT (-1)

#define DCV_SELECTION_GROUND_TRUTH 0
#define DCV_SELECTION_PRIORITY 1
#define DCV_SELECTION_LAST_RESORT 2

#define DCV_METHOD_NNLS 0
#define DCV_METHOD_SIMPLEX_QP 1
#define DCV_METHOD_DUAL_QP 2

typedef struct dcv_options {
    // Bit i enables strategy id i; 0 enables all
    uint32_t strategy_mask;
    dcv_bool_t sum_to_one;
    dcv_real_t min_fraction;
    dcv_bool_t allow_fallback;
    dcv_index_t refine_max_iterations;
    dcv_real_t refine_tolerance;
    dcv_index_t factorization_max_iterations;
    dcv_real_t factorization_tolerance;
    // 1 = sequential, 0 = all configured threads
    dcv_size_t n_threads;
    // <= 0 disables the budget
    int64_t time_budget_ms;
} dcv_options_t;

DCV_C_EXPORT void dcv_options_default(dcv_options_t* opts);

// Run the ensemble and write the selected proportions.
//
//   truth             nullable
//   proportions_out   n_cell_types * n_samples
//   valid_out         n_samples, nullable
//   chosen_strategy   nullable; DCV_STRATEGY_LAST_RESORT if none was chosen
//   selection_mode    nullable
//   excluded_mask     nullable; bit i set when strategy i threw
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
);

// Solve one mixture column with one method and the fallback chain.
//
//   coefficients_out  n_cell_types, constrained
//   raw_out           n_cell_types, nullable
//   tier_out          nullable; 0 primary, 1 ridge, 2 mean profile, 3 skipped
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
);

// Per-sample reconstruction metrics; each output is n_samples long and nullable.
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
);

#ifdef __cplusplus
}
#endif
