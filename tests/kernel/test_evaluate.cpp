// =============================================================================
// DCV Core - evaluate.hpp Tests
// =============================================================================

#include "test.hpp"

#include "dcv/kernel/evaluate.hpp"

using namespace dcv;
using namespace dcv::test;
namespace evaluate = dcv::kernel::evaluate;

namespace {

Mat three_by_two() {
    Mat p(3, 2);
    p << 0.6, 0.1,
         0.3, 0.2,
         0.1, 0.7;
    return p;
}

} // namespace

DCV_TEST_BEGIN

DCV_TEST_SUITE(evaluate_fit)

DCV_TEST_CASE(exact_reconstruction_scores_perfectly) {
    Random rng(61);
    const Mat ref = random_reference(rng, 25, 3);
    const Mat props = random_proportions(rng, 3, 4);
    const Mat mix = ref * props;

    const auto fit = evaluate::evaluate_fit(ref, mix, props);

    DCV_ASSERT_EQ(fit.size(), std::size_t(4));
    for (const auto& m : fit) {
        DCV_ASSERT_TRUE(m.r2.has_value());
        DCV_ASSERT_NEAR(1.0, *m.r2, 1e-10);
        DCV_ASSERT_NEAR(0.0, *m.rmse, 1e-10);
        DCV_ASSERT_NEAR(1.0, *m.pearson, 1e-10);
    }
}

DCV_TEST_CASE(parallel_evaluation_preserves_order) {
    Random rng(62);
    const Mat ref = random_reference(rng, 30, 4);
    const Mat props = random_proportions(rng, 4, 17);
    const Mat mix = make_mixture(rng, ref, props, 0.2);

    const auto seq = evaluate::evaluate_fit(ref, mix, props, 1);
    const auto par = evaluate::evaluate_fit(ref, mix, props, 4);

    DCV_ASSERT_EQ(seq.size(), par.size());
    for (std::size_t j = 0; j < seq.size(); ++j) {
        DCV_ASSERT_EQ(*seq[j].rmse, *par[j].rmse);
        DCV_ASSERT_EQ(*seq[j].spearman, *par[j].spearman);
    }
}

DCV_TEST_CASE(shape_mismatches_throw) {
    const Mat ref = fixture::tiny_reference();
    const Mat mix = Mat::Ones(3, 2);

    DCV_ASSERT_THROWS(evaluate::evaluate_fit(ref, Mat::Ones(4, 2), Mat::Ones(2, 2)), DimensionError);
    DCV_ASSERT_THROWS(evaluate::evaluate_fit(ref, mix, Mat::Ones(3, 2)), DimensionError);
    DCV_ASSERT_THROWS(evaluate::evaluate_fit(ref, mix, Mat::Ones(2, 3)), DimensionError);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(compare_to_truth)

DCV_TEST_CASE(reconciles_labels_and_sample_names) {
    const ProportionsMatrix est(three_by_two(), {"T_cells", "B_cells", "Monocytes"}, {"mix_a", "mix_b"});

    // Truth rows permuted and spelled differently, samples carry a prefix
    Mat t(3, 2);
    t << 0.1, 0.7,
         0.6, 0.1,
         0.3, 0.2;
    const Labels truth_rows = {"monocyte", "T cells", "B cells"};
    const GroundTruthMatrix truth(t, truth_rows, {"GSM_mix_a", "GSM_mix_b"});
    const GroundTruthMatrix crossed(t, truth_rows, {"GSM_mix_b", "GSM_mix_a"});

    LogCapture logs;
    const auto cmp = evaluate::compare_to_truth(est, truth);

    DCV_ASSERT_TRUE(cmp.available);
    DCV_ASSERT_EQ(cmp.cell_types.size(), std::size_t(3));
    DCV_ASSERT_EQ(cmp.samples.size(), std::size_t(2));
    DCV_ASSERT_EQ(cmp.per_sample.size(), std::size_t(2));
    DCV_ASSERT_TRUE(cmp.mean_r2.has_value());
    DCV_ASSERT_NEAR(1.0, *cmp.mean_r2, 1e-12);
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "substring"));

    // Mismatched pairing gives a worse score
    const auto off = evaluate::compare_to_truth(est, crossed);
    DCV_ASSERT_TRUE(off.available);
    DCV_ASSERT_LT(*off.mean_r2, *cmp.mean_r2);
}

DCV_TEST_CASE(samples_by_cell_types_layout) {
    const ProportionsMatrix est(three_by_two(), {"A", "B", "C"}, {"s1", "s2"});
    const GroundTruthMatrix truth = GroundTruthMatrix::from_entity_rows(
        three_by_two().transpose(), {"s1", "s2"}, {"A", "B", "C"});

    const auto cmp = evaluate::compare_to_truth(est, truth);

    DCV_ASSERT_TRUE(cmp.available);
    DCV_ASSERT_NEAR(1.0, *cmp.mean_r2, 1e-12);
}

DCV_TEST_CASE(truth_scale_does_not_change_the_ranking) {
    Mat exact(3, 1);
    exact << 0.5, 0.3, 0.2;
    Mat wrong(3, 1);
    wrong << 0.9, 0.1, 0.0;
    Mat percent(3, 1);
    percent << 50, 30, 20;

    const Labels types = {"A", "B", "C"};
    const GroundTruthMatrix truth(percent, types, {"s1"});
    const auto good = evaluate::compare_to_truth(ProportionsMatrix(exact, types, {"s1"}), truth);
    const auto bad = evaluate::compare_to_truth(ProportionsMatrix(wrong, types, {"s1"}), truth);

    DCV_ASSERT_NEAR(1.0, *good.mean_r2, 1e-12);
    DCV_ASSERT_NEAR(0.0, *good.per_sample[0].rmse, 1e-12);
    DCV_ASSERT_LT(*bad.mean_r2, *good.mean_r2);
}

DCV_TEST_CASE(zero_truth_sample_is_not_scored) {
    Mat t(3, 2);
    t << 6, 0,
         3, 0,
         1, 0;
    const ProportionsMatrix est(three_by_two(), {"A", "B", "C"}, {"s1", "s2"});
    const GroundTruthMatrix truth(t, {"A", "B", "C"}, {"s1", "s2"});

    LogCapture logs;
    const auto cmp = evaluate::compare_to_truth(est, truth);

    DCV_ASSERT_TRUE(cmp.available);
    DCV_ASSERT_EQ(cmp.per_sample.size(), std::size_t(2));
    DCV_ASSERT_NEAR(1.0, *cmp.per_sample[0].r2, 1e-12);
    DCV_ASSERT_FALSE(cmp.per_sample[1].r2.has_value());
    DCV_ASSERT_NEAR(1.0, *cmp.mean_r2, 1e-12);
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "sums to zero"));
}

DCV_TEST_CASE(unmatched_truth_is_unavailable) {
    const ProportionsMatrix est(three_by_two(), {"A", "B", "C"}, {"s1", "s2"});
    const GroundTruthMatrix truth(three_by_two(), {"A", "B", "C"}, {"other1", "other2"});

    LogCapture logs;
    const auto cmp = evaluate::compare_to_truth(est, truth);

    DCV_ASSERT_FALSE(cmp.available);
    DCV_ASSERT_FALSE(cmp.mean_r2.has_value());
    DCV_ASSERT_STR_CONTAINS(cmp.reason, "sample");
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "comparison unavailable"));
}

DCV_TEST_SUITE_END

DCV_TEST_END

DCV_TEST_MAIN()
