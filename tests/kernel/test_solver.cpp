// =============================================================================
// DCV Core - solver.hpp Tests
// =============================================================================
//
// LinearSolver across methods, the fallback chain, weighted solves and
// skipped targets.
//
// =============================================================================

#include "test.hpp"

#include "dcv/kernel/solver.hpp"

#include <array>
#include <limits>

using namespace dcv;
using namespace dcv::test;
using namespace dcv::kernel::solver;

namespace {

constexpr std::array<Method, 3> ALL_METHODS = {Method::Nnls, Method::SimplexQp, Method::DualQp};

} // namespace

DCV_TEST_BEGIN

DCV_TEST_SUITE(exact)

DCV_TEST_CASE(tiny_system_nnls) {
    const LinearSolver s(fixture::tiny_reference());
    const auto r = s.solve(fixture::tiny_target(), "tiny");

    DCV_ASSERT_TRUE(r.valid);
    DCV_ASSERT_TRUE(r.diagnostic.tier == Tier::Primary);
    DCV_ASSERT_TRUE(r.diagnostic.reason == Reason::None);
    DCV_ASSERT_NEAR(2.0, r.raw(0), 1e-10);
    DCV_ASSERT_NEAR(3.0, r.raw(1), 1e-10);
    DCV_ASSERT_NEAR(0.4, r.coefficients(0), 1e-10);
    DCV_ASSERT_NEAR(0.6, r.coefficients(1), 1e-10);
    DCV_ASSERT_NEAR(0.0, r.diagnostic.residual_norm, 1e-9);
}

DCV_TEST_CASE(every_method_recovers_simplex_proportions) {
    Random rng(21);
    const Mat ref = random_reference(rng, 50, 4);
    const Mat props = random_proportions(rng, 4, 1);
    const Vec b = ref * props.col(0);

    for (const Method m : ALL_METHODS) {
        const LinearSolver s(ref, m);
        const auto r = s.solve(b, method_name(m));

        DCV_ASSERT_TRUE(r.valid);
        DCV_ASSERT_TRUE(r.diagnostic.method == m);
        DCV_ASSERT_TRUE(r.diagnostic.tier == Tier::Primary);
        DCV_ASSERT_TRUE(precision::on_simplex(r.coefficients, 1e-8));
        DCV_ASSERT_TRUE(precision::dense_equal(r.coefficients, props.col(0), precision::Tolerance::iterative()));
    }
}

DCV_TEST_CASE(output_satisfies_constraints_for_noisy_targets) {
    Random rng(22);
    const Mat ref = random_reference(rng, 30, 5);
    const Mat mix = make_mixture(rng, ref, random_proportions(rng, 5, 8), 0.2);

    for (const Method m : ALL_METHODS) {
        const LinearSolver s(ref, m);
        for (Index j = 0; j < mix.cols(); ++j) {
            const auto r = s.solve(mix.col(j));
            DCV_ASSERT_TRUE(r.valid);
            DCV_ASSERT_TRUE(precision::on_simplex(r.coefficients, 1e-8));
        }
    }
}

DCV_TEST_CASE(min_fraction_drops_small_components) {
    Mat ref = Mat::Identity(3, 3);
    Vec b(3);
    b << 0.6, 0.39, 0.01;

    Constraints c;
    c.min_fraction = Real(0.05);
    const LinearSolver s(ref, Method::Nnls, c);
    const auto r = s.solve(b);

    DCV_ASSERT_TRUE(r.valid);
    DCV_ASSERT_EQ(r.coefficients(2), Real(0));
    DCV_ASSERT_NEAR(0.6 / 0.99, r.coefficients(0), 1e-12);
    DCV_ASSERT_NEAR(0.01, r.raw(2), 1e-12);
}

DCV_TEST_CASE(unnormalized_output_keeps_scale) {
    Constraints c;
    c.sum_to_one = false;
    const LinearSolver s(fixture::tiny_reference(), Method::DualQp, c);
    const auto r = s.solve(fixture::tiny_target());

    DCV_ASSERT_TRUE(r.valid);
    DCV_ASSERT_NEAR(2.0, r.coefficients(0), 1e-8);
    DCV_ASSERT_NEAR(3.0, r.coefficients(1), 1e-8);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(fallback)

DCV_TEST_CASE(singular_qp_falls_back_to_ridge) {
    const Mat ref = fixture::duplicate_column_reference();
    Vec p(3);
    p << 0.25, 0.25, 0.5;

    const LinearSolver s(ref, Method::SimplexQp);
    LogCapture logs;
    const auto r = s.solve(ref * p, "dup");

    DCV_ASSERT_TRUE(r.valid);
    DCV_ASSERT_TRUE(r.diagnostic.tier == Tier::Ridge);
    DCV_ASSERT_TRUE(r.diagnostic.reason == Reason::Singular);
    DCV_ASSERT_TRUE(r.diagnostic.fell_back());
    DCV_ASSERT_FALSE(r.diagnostic.low_confidence());
    DCV_ASSERT_GT(r.diagnostic.ridge, Real(0));
    DCV_ASSERT_TRUE(precision::on_simplex(r.coefficients, 1e-8));
    DCV_ASSERT_NEAR(0.5, r.coefficients(2), 1e-3);
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "dup"));
}

DCV_TEST_CASE(dual_qp_not_positive_definite_falls_back) {
    const Mat ref = fixture::duplicate_column_reference();
    const LinearSolver s(ref, Method::DualQp);
    const auto r = s.solve(ref * Vec::Constant(3, Real(1) / 3));

    DCV_ASSERT_TRUE(r.valid);
    DCV_ASSERT_TRUE(r.diagnostic.tier == Tier::Ridge);
    DCV_ASSERT_TRUE(r.diagnostic.reason == Reason::NotPositiveDefinite);
}

DCV_TEST_CASE(mean_profile_is_the_last_tier) {
    // A negative target leaves NNLS and ridge with nothing positive
    const LinearSolver s(fixture::tiny_reference());
    const auto r = s.solve(-fixture::tiny_target(), "negative");

    DCV_ASSERT_TRUE(r.valid);
    DCV_ASSERT_TRUE(r.diagnostic.tier == Tier::MeanProfile);
    DCV_ASSERT_TRUE(r.diagnostic.reason == Reason::EmptySolution);
    DCV_ASSERT_TRUE(r.diagnostic.low_confidence());
    DCV_ASSERT_TRUE(std::isnan(r.diagnostic.residual_norm));
    DCV_ASSERT_NEAR(0.5, r.coefficients(0), 1e-12);
    DCV_ASSERT_NEAR(0.5, r.coefficients(1), 1e-12);
}

DCV_TEST_CASE(disabled_fallback_raises) {
    Constraints c;
    c.allow_fallback = false;
    const Mat ref = fixture::duplicate_column_reference();

    const LinearSolver simplex(ref, Method::SimplexQp, c);
    DCV_ASSERT_THROWS((void)simplex.solve(ref * Vec::Constant(3, Real(1) / 3)), SingularMatrixError);

    const LinearSolver dual(ref, Method::DualQp, c);
    DCV_ASSERT_THROWS((void)dual.solve(ref * Vec::Constant(3, Real(1) / 3)), SingularMatrixError);

    const LinearSolver nnls(fixture::tiny_reference(), Method::Nnls, c);
    DCV_ASSERT_THROWS((void)nnls.solve(-fixture::tiny_target()), NumericalError);
}

DCV_TEST_CASE(last_resort_skips_primary) {
    const LinearSolver s(fixture::tiny_reference());
    const auto r = s.solve_last_resort(fixture::tiny_target());

    DCV_ASSERT_TRUE(r.valid);
    DCV_ASSERT_TRUE(r.diagnostic.tier == Tier::Ridge);
    DCV_ASSERT_NEAR(0.4, r.coefficients(0), 1e-6);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(skipped)

DCV_TEST_CASE(zero_target) {
    const LinearSolver s(fixture::tiny_reference());
    LogCapture logs;
    const auto r = s.solve(Vec::Zero(3), "empty");

    DCV_ASSERT_FALSE(r.valid);
    DCV_ASSERT_TRUE(r.diagnostic.tier == Tier::Skipped);
    DCV_ASSERT_TRUE(r.diagnostic.reason == Reason::ZeroTarget);
    DCV_ASSERT_TRUE(r.coefficients.isZero(0));
    DCV_ASSERT_EQ(r.coefficients.size(), Index(2));
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "empty"));
}

DCV_TEST_CASE(nonfinite_target) {
    const LinearSolver s(fixture::tiny_reference());
    Vec b = fixture::tiny_target();
    b(1) = std::numeric_limits<Real>::quiet_NaN();

    const auto r = s.solve(b);

    DCV_ASSERT_FALSE(r.valid);
    DCV_ASSERT_TRUE(r.diagnostic.reason == Reason::NonFiniteInput);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(weighted)

DCV_TEST_CASE(unit_weights_match_unweighted) {
    Random rng(23);
    const Mat ref = random_reference(rng, 20, 3);
    const Vec b = make_mixture(rng, ref, random_proportions(rng, 3, 1), 0.1).col(0);
    const LinearSolver s(ref);

    const auto plain = s.solve(b);
    const auto weighted = s.solve(b, Vec::Ones(20));

    DCV_ASSERT_TRUE(precision::dense_equal(plain.coefficients, weighted.coefficients,
                                           precision::Tolerance::relaxed()));
}

DCV_TEST_CASE(zero_weight_ignores_outlier) {
    const Mat ref = fixture::tiny_reference();
    Vec b = fixture::tiny_target();
    b(2) = Real(100);   // corrupt the third feature
    Vec w = Vec::Ones(3);
    w(2) = Real(0);

    const LinearSolver s(ref);
    const auto r = s.solve(b, w);

    DCV_ASSERT_NEAR(0.4, r.coefficients(0), 1e-10);
    DCV_ASSERT_NEAR(0.6, r.coefficients(1), 1e-10);
}

DCV_TEST_CASE(rejects_negative_weights) {
    const LinearSolver s(fixture::tiny_reference());
    Vec w = Vec::Ones(3);
    w(0) = Real(-1);
    DCV_ASSERT_THROWS((void)s.solve(fixture::tiny_target(), w), ValueError);
    DCV_ASSERT_THROWS((void)s.solve(fixture::tiny_target(), Vec::Ones(2)), DimensionError);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(construction)

DCV_TEST_CASE(invalid_inputs) {
    DCV_ASSERT_THROWS(LinearSolver(Mat(0, 2)), DimensionError);

    Mat bad = fixture::tiny_reference();
    bad(0, 0) = std::numeric_limits<Real>::infinity();
    DCV_ASSERT_THROWS(LinearSolver{bad}, ValueError);

    Constraints no_sum;
    no_sum.sum_to_one = false;
    DCV_ASSERT_THROWS(LinearSolver(fixture::tiny_reference(), Method::SimplexQp, no_sum), ValueError);

    Constraints bad_fraction;
    bad_fraction.min_fraction = Real(1.5);
    DCV_ASSERT_THROWS(LinearSolver(fixture::tiny_reference(), Method::Nnls, bad_fraction), RangeError);

    const LinearSolver s(fixture::tiny_reference());
    DCV_ASSERT_THROWS((void)s.solve(Vec::Ones(4)), DimensionError);
}

DCV_TEST_CASE(names) {
    DCV_ASSERT_STR_EQ("nnls", method_name(Method::Nnls));
    DCV_ASSERT_STR_EQ("dual_qp", method_name(Method::DualQp));
    DCV_ASSERT_STR_EQ("mean_profile", tier_name(Tier::MeanProfile));
    DCV_ASSERT_STR_EQ("all-zero target", reason_name(Reason::ZeroTarget));
}

DCV_TEST_SUITE_END

DCV_TEST_END

DCV_TEST_MAIN()
