#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/error.hpp"

#include <Eigen/Dense>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// =============================================================================
// FILE: dcv/core/matrix.hpp
// BRIEF: Dense labeled matrices in the canonical features x entities layout
// =============================================================================
//
// Every matrix handled by the solvers keeps observations along rows and
// entities (cell types or samples) along columns, so that one column is one
// independent problem:
//
//   ReferenceMatrix   features   x cell types
//   MixtureMatrix     features   x samples
//   ProportionsMatrix cell types x samples
//   GroundTruthMatrix cell types x samples
//
// Callers that hold samples along rows convert once at the boundary with
// from_entity_rows() / entity_rows().

namespace dcv {

using Mat = Eigen::Matrix<Real, Eigen::Dynamic, Eigen::Dynamic, Eigen::ColMajor>;
using Vec = Eigen::Matrix<Real, Eigen::Dynamic, 1>;
using Labels = std::vector<std::string>;

// =============================================================================
// Eigen <-> Array bridges
// =============================================================================

inline auto view(Vec& v) noexcept -> Array<Real> {
    return Array<Real>(v.data(), static_cast<Size>(v.size()));
}

inline auto cview(const Vec& v) noexcept -> Array<const Real> {
    return Array<const Real>(v.data(), static_cast<Size>(v.size()));
}

inline auto col_view(Mat& m, Index j) noexcept -> Array<Real> {
    return Array<Real>(m.col(j).data(), static_cast<Size>(m.rows()));
}

inline auto col_cview(const Mat& m, Index j) noexcept -> Array<const Real> {
    return Array<const Real>(m.col(j).data(), static_cast<Size>(m.rows()));
}

namespace detail {

inline auto default_labels(const char* prefix, Index n) -> Labels {
    Labels out;
    out.reserve(static_cast<Size>(n));
    for (Index i = 0; i < n; ++i) {
        out.push_back(std::string(prefix) + std::to_string(i));
    }
    return out;
}

inline void check_labels(const Labels& labels, Index expected, const char* axis) {
    DCV_CHECK_DIM(static_cast<Index>(labels.size()) == expected,
                  std::string(axis) + " labels: expected " + std::to_string(expected) +
                  ", got " + std::to_string(labels.size()));

    std::unordered_map<std::string, Index> seen;
    seen.reserve(labels.size());
    for (Index i = 0; i < static_cast<Index>(labels.size()); ++i) {
        if (!seen.emplace(labels[static_cast<Size>(i)], i).second) {
            throw ValueError(std::string(axis) + " labels: duplicate '" +
                             labels[static_cast<Size>(i)] + "'");
        }
    }
}

} // namespace detail

// =============================================================================
// LabeledMatrix
// =============================================================================

/// @brief Immutable dense matrix with unique row and column names.
///
/// The tag only distinguishes roles at compile time, so a mixture cannot be
/// passed where a reference is expected.
template <typename Tag>
class LabeledMatrix {
public:
    LabeledMatrix() = default;

    /// @brief Wrap values; empty label vectors are replaced by row_<i> / col_<j>.
    /// @throws DimensionError if a label vector does not match the matrix shape
    /// @throws ValueError if labels are not unique
    explicit LabeledMatrix(Mat values, Labels row_names = {}, Labels col_names = {})
        : values_(std::move(values)),
          row_names_(std::move(row_names)),
          col_names_(std::move(col_names)) {
        if (row_names_.empty()) row_names_ = detail::default_labels("row_", values_.rows());
        if (col_names_.empty()) col_names_ = detail::default_labels("col_", values_.cols());
        detail::check_labels(row_names_, values_.rows(), "row");
        detail::check_labels(col_names_, values_.cols(), "column");
    }

    /// @brief Build from a layout that holds entities along rows
    /// (e.g. samples x cell types), transposing into the canonical layout.
    static auto from_entity_rows(const Mat& entities_by_rows,
                                 Labels entity_names = {},
                                 Labels row_names = {}) -> LabeledMatrix {
        return LabeledMatrix(entities_by_rows.transpose(),
                             std::move(row_names), std::move(entity_names));
    }

    /// @brief Values with entities along rows (e.g. samples x cell types).
    [[nodiscard]] auto entity_rows() const -> Mat { return values_.transpose(); }

    [[nodiscard]] auto rows() const noexcept -> Index { return values_.rows(); }
    [[nodiscard]] auto cols() const noexcept -> Index { return values_.cols(); }
    [[nodiscard]] auto values() const noexcept -> const Mat& { return values_; }
    [[nodiscard]] auto row_names() const noexcept -> const Labels& { return row_names_; }
    [[nodiscard]] auto col_names() const noexcept -> const Labels& { return col_names_; }

    [[nodiscard]] auto col(Index j) const -> Vec { return values_.col(j); }

private:
    Mat values_;
    Labels row_names_;
    Labels col_names_;
};

struct ReferenceTag {};
struct MixtureTag {};
struct ProportionsTag {};
struct GroundTruthTag {};

using ReferenceMatrix = LabeledMatrix<ReferenceTag>;
using MixtureMatrix = LabeledMatrix<MixtureTag>;
using ProportionsMatrix = LabeledMatrix<ProportionsTag>;
using GroundTruthMatrix = LabeledMatrix<GroundTruthTag>;

} // namespace dcv
