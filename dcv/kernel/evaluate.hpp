#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"
#include "dcv/core/log.hpp"
#include "dcv/core/matrix.hpp"
#include "dcv/kernel/matching.hpp"
#include "dcv/kernel/metrics.hpp"
#include "dcv/threading/parallel_for.hpp"

#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: dcv/kernel/evaluate.hpp
// BRIEF: Scoring proportions by reconstruction and against ground truth
// =============================================================================

namespace dcv::kernel::evaluate {

/// @brief Per-sample fit of reference x proportions against the mixture.
/// @param reference   features x cell types
/// @param mixture     features x samples
/// @param proportions cell types x samples
/// @param n_threads   degree of parallelism over samples, 1 = sequential
inline std::vector<metrics::FitMetrics> evaluate_fit(const Mat& reference, const Mat& mixture,
                                                     const Mat& proportions, size_t n_threads = 1) {
    DCV_CHECK_DIM(reference.rows() == mixture.rows(),
                  "evaluate_fit: reference and mixture differ in feature count");
    DCV_CHECK_DIM(proportions.rows() == reference.cols(),
                  "evaluate_fit: proportions rows must equal the number of cell types");
    DCV_CHECK_DIM(proportions.cols() == mixture.cols(),
                  "evaluate_fit: proportions columns must equal the number of samples");

    const Index n_samples = mixture.cols();
    std::vector<metrics::FitMetrics> out(static_cast<Size>(n_samples));

    threading::parallel_for(0, static_cast<size_t>(n_samples), n_threads, [&](size_t j) {
        const auto col = static_cast<Index>(j);
        const Vec estimated = reference * proportions.col(col);
        out[j] = metrics::compute(col_cview(mixture, col), cview(estimated));
    });
    return out;
}

inline std::vector<metrics::FitMetrics> evaluate_fit(const ReferenceMatrix& reference,
                                                     const MixtureMatrix& mixture,
                                                     const ProportionsMatrix& proportions,
                                                     size_t n_threads = 1) {
    return evaluate_fit(reference.values(), mixture.values(), proportions.values(), n_threads);
}

struct TruthComparison {
    bool available = false;
    std::string reason;                          // set when unavailable
    std::vector<matching::Match> cell_types;     // estimated row -> truth row
    std::vector<matching::Match> samples;        // estimated column -> truth column
    std::vector<metrics::FitMetrics> per_sample; // parallel to samples
    std::optional<Real> mean_r2;
};

/// @brief Compare estimated proportions with known ones after reconciling
/// cell-type labels and sample identifiers. Within each sample both sides are
/// rescaled to sum 1 over the matched cell types; samples whose truth sums to
/// zero get empty metrics. Never throws for unmatched data; returns
/// available == false instead.
inline TruthComparison compare_to_truth(const ProportionsMatrix& estimated, const GroundTruthMatrix& truth) {
    TruthComparison out;
    out.cell_types = matching::match_labels(estimated.row_names(), truth.row_names());
    out.samples = matching::match_samples(estimated.col_names(), truth.col_names());

    if (out.cell_types.empty() || out.samples.empty()) {
        out.reason = out.cell_types.empty() ? "no cell type matches the ground truth"
                                            : "no sample matches the ground truth";
        DCV_LOG_WARN("evaluate: comparison unavailable, " << out.reason);
        return out;
    }

    const auto n_types = static_cast<Index>(out.cell_types.size());
    Vec actual(n_types);
    Vec predicted(n_types);
    out.per_sample.reserve(out.samples.size());

    // Truth rows may be counts or percentages: both sides are compared as
    // fractions of the matched cell types
    for (const auto& s : out.samples) {
        for (Index i = 0; i < n_types; ++i) {
            const auto& ct = out.cell_types[static_cast<Size>(i)];
            actual(i) = truth.values()(ct.target, s.target);
            predicted(i) = estimated.values()(ct.source, s.source);
        }

        const Real truth_total = actual.sum();
        if (!(truth_total > Real(0))) {
            DCV_LOG_WARN("evaluate: truth for sample '" << truth.col_names()[static_cast<Size>(s.target)]
                         << "' sums to zero over the matched cell types, not scored");
            out.per_sample.emplace_back();
            continue;
        }
        actual /= truth_total;
        const Real predicted_total = predicted.sum();
        if (predicted_total > Real(0)) {
            predicted /= predicted_total;
        }
        out.per_sample.push_back(metrics::compute(cview(actual), cview(predicted)));
    }

    out.available = true;
    out.mean_r2 = metrics::mean_r2(out.per_sample);
    return out;
}

} // namespace dcv::kernel::evaluate
