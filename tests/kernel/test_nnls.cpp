// =============================================================================
// DCV Core - nnls.hpp Tests
// =============================================================================

#include "test.hpp"

#include "dcv/kernel/nnls.hpp"

using namespace dcv;
using namespace dcv::test;
namespace nnls = dcv::kernel::nnls;

DCV_TEST_BEGIN

DCV_TEST_SUITE(nnls_solve)

DCV_TEST_CASE(exact_consistent_system) {
    const auto r = nnls::solve(fixture::tiny_reference(), fixture::tiny_target());

    DCV_ASSERT_TRUE(r.status == nnls::Status::Converged);
    DCV_ASSERT_NEAR(2.0, r.x(0), 1e-10);
    DCV_ASSERT_NEAR(3.0, r.x(1), 1e-10);
}

DCV_TEST_CASE(negative_unconstrained_component_is_zeroed) {
    const Mat a = Mat::Identity(2, 2);
    Vec b(2);
    b << 1, -1;

    const auto r = nnls::solve(a, b);

    DCV_ASSERT_TRUE(r.status == nnls::Status::Converged);
    DCV_ASSERT_NEAR(1.0, r.x(0), 1e-12);
    DCV_ASSERT_EQ(r.x(1), Real(0));
}

DCV_TEST_CASE(all_negative_target_gives_zero) {
    const Mat a = fixture::tiny_reference();
    const Vec b = -fixture::tiny_target();

    const auto r = nnls::solve(a, b);

    DCV_ASSERT_TRUE(r.x.isZero(0));
    DCV_ASSERT_EQ(r.iterations, Index(0));
}

DCV_TEST_CASE(recovers_random_nonnegative_coefficients) {
    Random rng(11);
    const Mat a = random_reference(rng, 40, 5);
    Vec truth(5);
    truth << 0.7, 0.0, 1.3, 0.2, 0.0;
    const Vec b = a * truth;

    const auto r = nnls::solve(a, b);

    DCV_ASSERT_TRUE(r.status == nnls::Status::Converged);
    DCV_ASSERT_TRUE(precision::dense_equal(r.x, truth, precision::Tolerance::relaxed()));
    DCV_ASSERT_GE(r.x.minCoeff(), Real(0));
}

DCV_TEST_CASE(kkt_conditions_hold_for_noisy_target) {
    Random rng(12);
    const Mat a = random_reference(rng, 30, 4);
    Vec b(30);
    for (Index i = 0; i < b.size(); ++i) {
        b(i) = static_cast<Real>(rng.normal(0.0, 2.0));
    }

    const auto r = nnls::solve(a, b);
    const Vec w = a.transpose() * (b - a * r.x);

    DCV_ASSERT_GE(r.x.minCoeff(), Real(0));
    for (Index j = 0; j < r.x.size(); ++j) {
        // Gradient vanishes on the passive set and points outward on the bound
        if (r.x(j) > Real(0)) {
            DCV_ASSERT_NEAR(0.0, w(j), 1e-8);
        } else {
            DCV_ASSERT_LE(w(j), Real(1e-8));
        }
    }
}

DCV_TEST_CASE(duplicate_columns_fit_the_target) {
    const Mat a = fixture::duplicate_column_reference();
    Vec p(3);
    p << 0.3, 0.3, 0.4;
    const Vec b = a * p;

    const auto r = nnls::solve(a, b);

    DCV_ASSERT_TRUE(r.status == nnls::Status::Converged);
    DCV_ASSERT_GE(r.x.minCoeff(), Real(0));
    DCV_ASSERT_NEAR(0.0, (a * r.x - b).norm(), 1e-9);
    DCV_ASSERT_NEAR(0.6, r.x(0) + r.x(1), 1e-9);
}

DCV_TEST_CASE(dimension_mismatch_throws) {
    const Mat a = Mat::Ones(3, 2);
    const Vec b = Vec::Ones(4);
    DCV_ASSERT_THROWS(nnls::solve(a, b), DimensionError);
}

DCV_TEST_SUITE_END

DCV_TEST_END

DCV_TEST_MAIN()
