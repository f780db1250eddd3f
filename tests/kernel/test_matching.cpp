// =============================================================================
// DCV Core - matching.hpp Tests
// =============================================================================
//
//   edit_distance / label_similarity
//   match_labels      : exact, then edit distance
//   match_samples     : exact, then unique substring containment
//   assign_identities : correlation-based profile pairing
//
// =============================================================================

#include "test.hpp"

#include "dcv/kernel/matching.hpp"

using namespace dcv;
using namespace dcv::test;
using namespace dcv::kernel::matching;

DCV_TEST_BEGIN

DCV_TEST_SUITE(strings)

DCV_TEST_CASE(edit_distance_basics) {
    DCV_ASSERT_EQ(edit_distance("kitten", "sitting"), Index(3));
    DCV_ASSERT_EQ(edit_distance("", "abc"), Index(3));
    DCV_ASSERT_EQ(edit_distance("same", "same"), Index(0));
}

DCV_TEST_CASE(normalization_ignores_case_and_punctuation) {
    DCV_ASSERT_STR_EQ("cd4tcells", normalize_key("CD4+ T-cells"));
    DCV_ASSERT_NEAR(1.0, label_similarity("B cells", "b_cells"), 1e-15);
    DCV_ASSERT_NEAR(0.0, label_similarity("", "--"), 1e-15);
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(labels)

DCV_TEST_CASE(exact_matches_first) {
    const Labels est = {"T", "B", "NK"};
    const Labels truth = {"NK", "T", "B"};

    const auto m = match_labels(est, truth);

    DCV_ASSERT_EQ(m.size(), std::size_t(3));
    DCV_ASSERT_EQ(m[0].target, Index(1));
    DCV_ASSERT_EQ(m[1].target, Index(2));
    DCV_ASSERT_EQ(m[2].target, Index(0));
    DCV_ASSERT_TRUE(m[0].kind == MatchKind::Exact);
}

DCV_TEST_CASE(edit_distance_reconciles_spelling) {
    const Labels est = {"Monocytes", "T_cells", "Neutrophil"};
    const Labels truth = {"T cells", "monocyte", "Eosinophil", "neutrophils"};

    LogCapture logs;
    const auto m = match_labels(est, truth);

    DCV_ASSERT_EQ(m.size(), std::size_t(3));
    DCV_ASSERT_EQ(m[0].source, Index(0));
    DCV_ASSERT_EQ(m[0].target, Index(1));
    DCV_ASSERT_TRUE(m[0].kind == MatchKind::EditDistance);
    DCV_ASSERT_EQ(m[1].target, Index(0));
    DCV_ASSERT_EQ(m[2].target, Index(3));
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "edit distance"));
}

DCV_TEST_CASE(dissimilar_labels_stay_unmatched) {
    const Labels est = {"Fibroblast"};
    const Labels truth = {"Platelet"};

    LogCapture logs;
    const auto m = match_labels(est, truth);

    DCV_ASSERT_TRUE(m.empty());
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "Fibroblast"));
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(samples)

DCV_TEST_CASE(substring_containment) {
    const Labels est = {"S1", "patient_07", "S3"};
    const Labels truth = {"S3", "GSM001_patient_07_rep1", "S1"};

    const auto m = match_samples(est, truth);

    DCV_ASSERT_EQ(m.size(), std::size_t(3));
    DCV_ASSERT_EQ(m[0].target, Index(2));
    DCV_ASSERT_EQ(m[1].target, Index(1));
    DCV_ASSERT_TRUE(m[1].kind == MatchKind::Substring);
    DCV_ASSERT_EQ(m[2].target, Index(0));
}

DCV_TEST_CASE(ambiguous_containment_is_rejected) {
    const Labels est = {"rep"};
    const Labels truth = {"rep1", "rep2"};

    LogCapture logs;
    const auto m = match_samples(est, truth);

    DCV_ASSERT_TRUE(m.empty());
    DCV_ASSERT_TRUE(logs.contains(log::Level::Warning, "left unmatched"));
}

DCV_TEST_SUITE_END

DCV_TEST_SUITE(identities)

DCV_TEST_CASE(recovers_permutation) {
    Random rng(41);
    const Mat ref = random_reference(rng, 30, 4);
    Mat est(30, 4);
    est.col(0) = ref.col(2);
    est.col(1) = ref.col(0) * Real(3);
    est.col(2) = ref.col(3);
    est.col(3) = ref.col(1);

    const auto a = assign_identities(est, ref);

    DCV_ASSERT_EQ(a.mapping[0], Index(2));
    DCV_ASSERT_EQ(a.mapping[1], Index(0));
    DCV_ASSERT_EQ(a.mapping[2], Index(3));
    DCV_ASSERT_EQ(a.mapping[3], Index(1));
    DCV_ASSERT_FALSE(a.is_identity());
    DCV_ASSERT_NEAR(1.0, *a.correlation[1], 1e-12);
}

DCV_TEST_CASE(identity_when_aligned) {
    Random rng(42);
    const Mat ref = random_reference(rng, 20, 3);
    const auto a = assign_identities(ref, ref);
    DCV_ASSERT_TRUE(a.is_identity());
}

DCV_TEST_CASE(feature_mismatch_throws) {
    DCV_ASSERT_THROWS(assign_identities(Mat::Ones(3, 2), Mat::Ones(4, 2)), DimensionError);
}

DCV_TEST_SUITE_END

DCV_TEST_END

DCV_TEST_MAIN()
