// =============================================================================
// DCV Core - C API Tests
// =============================================================================
//
// Exercises the C ABI in core.h and deconvolve.h: error reporting, global
// settings, ensemble deconvolution, single-sample solves and fit scoring.
//
// =============================================================================

#include "test.hpp"

#include "dcv/binding/c_api/core.h"
#include "dcv/binding/c_api/deconvolve.h"

#include <cmath>
#include <string>
#include <vector>

using namespace dcv::test;

namespace {

// 3 features x 2 cell types, column-major
const std::vector<dcv_real_t> TINY_REF = {1, 0, 1,
                                          0, 1, 1};
const std::vector<dcv_real_t> TINY_TARGET = {2, 3, 5};

} // namespace

DCV_TEST_BEGIN

DCV_TEST_SUITE(core)

DCV_TEST_UNIT(version_and_build_config) {
    const char* version = dcv_get_version();
    DCV_ASSERT_NOT_NULL(version);
    DCV_ASSERT_TRUE(version[0] != '\0');

    const char* config = dcv_get_build_config();
    DCV_ASSERT_NOT_NULL(config);
    DCV_ASSERT_STR_CONTAINS(std::string(config), DCV_REAL_TYPE_NAME);
}

DCV_TEST_UNIT(clear_error_resets_state) {
    dcv_clear_error();
    DCV_ASSERT_EQ(dcv_get_last_error_code(), DCV_OK);
    DCV_ASSERT_STR_EQ("No error", dcv_get_last_error());
}

DCV_TEST_UNIT(log_level_is_range_checked) {
    const int saved = dcv_get_log_level();

    DCV_ASSERT_EQ(dcv_set_log_level(3), DCV_OK);
    DCV_ASSERT_EQ(dcv_get_log_level(), 3);
    DCV_ASSERT_EQ(dcv_set_log_level(7), DCV_ERROR_RANGE_ERROR);
    DCV_ASSERT_EQ(dcv_get_log_level(), 3);

    DCV_ASSERT_EQ(dcv_set_log_level(saved), DCV_OK);
}

DCV_TEST_UNIT(thread_count_round_trip) {
    DCV_ASSERT_EQ(dcv_set_num_threads(2), DCV_OK);
    DCV_ASSERT_GE(dcv_get_num_threads(), dcv_size_t(1));
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(deconvolve)

DCV_TEST_UNIT(default_options) {
    dcv_options_t opts;
    dcv_options_default(&opts);

    DCV_ASSERT_EQ(opts.strategy_mask, uint32_t(0));
    DCV_ASSERT_EQ(opts.sum_to_one, DCV_TRUE);
    DCV_ASSERT_EQ(opts.allow_fallback, DCV_TRUE);
    DCV_ASSERT_EQ(opts.n_threads, dcv_size_t(1));
    DCV_ASSERT_LE(opts.time_budget_ms, int64_t(0));
}

DCV_TEST_UNIT(tiny_mixture) {
    std::vector<dcv_real_t> props(2, dcv_real_t(-1));
    dcv_bool_t valid = DCV_FALSE;
    int32_t chosen = -2;
    int32_t mode = -1;
    uint32_t excluded = 0xFFFFFFFFU;

    const dcv_error_t err = dcv_deconvolve(TINY_REF.data(), 3, 2, TINY_TARGET.data(), 1,
                                           nullptr, nullptr, props.data(), &valid,
                                           &chosen, &mode, &excluded);

    DCV_ASSERT_EQ(err, DCV_OK);
    DCV_ASSERT_NEAR(0.4, props[0], 1e-9);
    DCV_ASSERT_NEAR(0.6, props[1], 1e-9);
    DCV_ASSERT_EQ(valid, DCV_TRUE);
    DCV_ASSERT_EQ(chosen, DCV_STRATEGY_NNLS);
    DCV_ASSERT_EQ(mode, DCV_SELECTION_PRIORITY);
    DCV_ASSERT_EQ(excluded, uint32_t(0));
}

DCV_TEST_UNIT(ground_truth_selection) {
    // Two samples: 0.4/0.6 and 0.7/0.3
    const std::vector<dcv_real_t> mix = {2, 3, 5,
                                         7, 3, 10};
    const std::vector<dcv_real_t> truth = {0.4, 0.6,
                                           0.7, 0.3};
    std::vector<dcv_real_t> props(4);
    int32_t mode = -1;

    DCV_ASSERT_EQ(dcv_deconvolve(TINY_REF.data(), 3, 2, mix.data(), 2, truth.data(), nullptr,
                                 props.data(), nullptr, nullptr, &mode, nullptr), DCV_OK);
    DCV_ASSERT_EQ(mode, DCV_SELECTION_GROUND_TRUTH);
    DCV_ASSERT_NEAR(0.7, props[2], 1e-6);
}

DCV_TEST_UNIT(singular_reference_reports_exclusions) {
    // Columns 0 and 1 identical
    const std::vector<dcv_real_t> ref = {1, 2, 0, 1,
                                         1, 2, 0, 1,
                                         0, 1, 3, 1};
    const std::vector<dcv_real_t> mix = {1, 2.5, 1.5, 1.5};
    std::vector<dcv_real_t> props(3);
    int32_t chosen = -2;
    uint32_t excluded = 0;

    dcv_options_t opts;
    dcv_options_default(&opts);
    opts.allow_fallback = DCV_FALSE;

    DCV_ASSERT_EQ(dcv_deconvolve(ref.data(), 4, 3, mix.data(), 1, nullptr, &opts,
                                 props.data(), nullptr, &chosen, nullptr, &excluded), DCV_OK);
    DCV_ASSERT_TRUE((excluded & (1U << DCV_STRATEGY_CONSTRAINED_QP)) != 0);
    DCV_ASSERT_TRUE((excluded & (1U << DCV_STRATEGY_DUAL_SIMPLEX_QP)) != 0);
    DCV_ASSERT_EQ(chosen, DCV_STRATEGY_NNLS);
    DCV_ASSERT_NEAR(1.0, props[0] + props[1] + props[2], 1e-6);
}

DCV_TEST_UNIT(null_output_is_rejected) {
    dcv_clear_error();
    const dcv_error_t err = dcv_deconvolve(TINY_REF.data(), 3, 2, TINY_TARGET.data(), 1,
                                           nullptr, nullptr, nullptr, nullptr,
                                           nullptr, nullptr, nullptr);
    DCV_ASSERT_EQ(err, DCV_ERROR_NULL_POINTER);
    DCV_ASSERT_EQ(dcv_get_last_error_code(), DCV_ERROR_NULL_POINTER);
}

DCV_TEST_UNIT(invalid_arguments_map_to_codes) {
    std::vector<dcv_real_t> props(2);

    // Negative feature count
    DCV_ASSERT_EQ(dcv_deconvolve(TINY_REF.data(), -3, 2, TINY_TARGET.data(), 1, nullptr, nullptr,
                                 props.data(), nullptr, nullptr, nullptr, nullptr),
                  DCV_ERROR_INVALID_ARGUMENT);

    dcv_options_t opts;
    dcv_options_default(&opts);
    opts.min_fraction = dcv_real_t(1.5);
    DCV_ASSERT_EQ(dcv_deconvolve(TINY_REF.data(), 3, 2, TINY_TARGET.data(), 1, nullptr, &opts,
                                 props.data(), nullptr, nullptr, nullptr, nullptr),
                  DCV_ERROR_RANGE_ERROR);
    DCV_ASSERT_STR_CONTAINS(std::string(dcv_get_last_error()), "min_fraction");

    dcv_options_default(&opts);
    opts.strategy_mask = 1U << 9;
    DCV_ASSERT_EQ(dcv_deconvolve(TINY_REF.data(), 3, 2, TINY_TARGET.data(), 1, nullptr, &opts,
                                 props.data(), nullptr, nullptr, nullptr, nullptr),
                  DCV_ERROR_INVALID_ARGUMENT);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(solve_sample)

DCV_TEST_UNIT(exact_tiny_case) {
    std::vector<dcv_real_t> coef(2);
    std::vector<dcv_real_t> raw(2);
    dcv_bool_t valid = DCV_FALSE;
    int32_t tier = -1;

    DCV_ASSERT_EQ(dcv_solve_sample(TINY_REF.data(), 3, 2, TINY_TARGET.data(), DCV_METHOD_NNLS,
                                   nullptr, coef.data(), raw.data(), &valid, &tier), DCV_OK);
    DCV_ASSERT_NEAR(2.0, raw[0], 1e-9);
    DCV_ASSERT_NEAR(3.0, raw[1], 1e-9);
    DCV_ASSERT_NEAR(0.4, coef[0], 1e-9);
    DCV_ASSERT_NEAR(0.6, coef[1], 1e-9);
    DCV_ASSERT_EQ(valid, DCV_TRUE);
    DCV_ASSERT_EQ(tier, 0);
}

DCV_TEST_UNIT(zero_target_is_flagged) {
    const std::vector<dcv_real_t> zero(3, dcv_real_t(0));
    std::vector<dcv_real_t> coef(2, dcv_real_t(-1));
    dcv_bool_t valid = DCV_TRUE;
    int32_t tier = -1;

    DCV_ASSERT_EQ(dcv_solve_sample(TINY_REF.data(), 3, 2, zero.data(), DCV_METHOD_DUAL_QP,
                                   nullptr, coef.data(), nullptr, &valid, &tier), DCV_OK);
    DCV_ASSERT_EQ(valid, DCV_FALSE);
    DCV_ASSERT_EQ(tier, 3);
    DCV_ASSERT_TRUE(std::isfinite(coef[0]) && std::isfinite(coef[1]));
}

DCV_TEST_UNIT(unknown_method) {
    std::vector<dcv_real_t> coef(2);
    DCV_ASSERT_EQ(dcv_solve_sample(TINY_REF.data(), 3, 2, TINY_TARGET.data(), 42,
                                   nullptr, coef.data(), nullptr, nullptr, nullptr),
                  DCV_ERROR_INVALID_ARGUMENT);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(evaluate_fit)

DCV_TEST_UNIT(perfect_and_constant_fits) {
    // Sample 0 reconstructs exactly, sample 1 is constant
    const std::vector<dcv_real_t> mix = {2, 3, 5,
                                         1, 1, 1};
    const std::vector<dcv_real_t> props = {2, 3,
                                           0, 0};
    std::vector<dcv_real_t> rmse(2), mae(2), r2(2), pearson(2), spearman(2);

    DCV_ASSERT_EQ(dcv_evaluate_fit(TINY_REF.data(), 3, 2, mix.data(), 2, props.data(), 1,
                                   rmse.data(), mae.data(), r2.data(), pearson.data(),
                                   spearman.data()), DCV_OK);
    DCV_ASSERT_NEAR(0.0, rmse[0], 1e-12);
    DCV_ASSERT_NEAR(0.0, mae[0], 1e-12);
    DCV_ASSERT_NEAR(1.0, r2[0], 1e-12);
    DCV_ASSERT_NEAR(1.0, pearson[0], 1e-12);
    DCV_ASSERT_NEAR(1.0, rmse[1], 1e-12);
    DCV_ASSERT_TRUE(std::isnan(r2[1]));
    DCV_ASSERT_TRUE(std::isnan(pearson[1]));
}

DCV_TEST_UNIT(null_and_negative_inputs) {
    std::vector<dcv_real_t> mix(3, 1), props(2, 1), r2(1);

    dcv_clear_error();
    DCV_ASSERT_EQ(dcv_evaluate_fit(nullptr, 3, 2, mix.data(), 1, props.data(), 1,
                                   nullptr, nullptr, r2.data(), nullptr, nullptr),
                  DCV_ERROR_NULL_POINTER);
    DCV_ASSERT_STR_CONTAINS(std::string(dcv_get_last_error()), "reference");

    DCV_ASSERT_EQ(dcv_evaluate_fit(TINY_REF.data(), 3, 2, mix.data(), -1, props.data(), 1,
                                   nullptr, nullptr, r2.data(), nullptr, nullptr),
                  DCV_ERROR_INVALID_ARGUMENT);
}

DCV_TEST_SUITE_END

DCV_TEST_END

DCV_TEST_MAIN()
