#pragma once

#include "dcv/core/type.hpp"
#include "dcv/core/macros.hpp"
#include "dcv/core/matrix.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// =============================================================================
// FILE: dcv/kernel/matching.hpp
// BRIEF: Reconciling estimated labels with ground-truth labels
//
// Cell-type labels:   exact, then greedy nearest by normalized edit distance
// Sample identifiers: exact, then unique substring containment
// Factor identities:  greedy one-to-one pairing by profile correlation
//
// Every non-exact match is logged at warning level.
// =============================================================================

namespace dcv::kernel::matching {

namespace config {
    // 1 - levenshtein / max_length on case-folded alphanumeric keys
    constexpr Real MIN_LABEL_SIMILARITY = Real(0.5);
}

enum class MatchKind : std::uint8_t {
    Exact,
    EditDistance,
    Substring
};

DCV_EXPORT auto match_kind_name(MatchKind k) noexcept -> const char*;

struct Match {
    Index source = -1;
    Index target = -1;
    MatchKind kind = MatchKind::Exact;
    Real score = Real(1);
};

/// @brief Levenshtein distance (unit insert, delete, substitute).
DCV_EXPORT Index edit_distance(std::string_view a, std::string_view b);

/// @brief Lower-cased key with every non-alphanumeric character removed.
DCV_EXPORT std::string normalize_key(std::string_view label);

/// @brief 1 - edit_distance / max_length on normalized keys, in [0, 1].
DCV_EXPORT Real label_similarity(std::string_view a, std::string_view b);

/// @brief One-to-one matching of cell-type labels, ordered by source index.
DCV_EXPORT std::vector<Match> match_labels(const Labels& source, const Labels& target,
                                           Real min_similarity = config::MIN_LABEL_SIMILARITY);

/// @brief One-to-one matching of sample identifiers, ordered by source index.
DCV_EXPORT std::vector<Match> match_samples(const Labels& source, const Labels& target);

struct IdentityAssignment {
    // mapping[e] is the reference column paired with estimated column e, or -1
    std::vector<Index> mapping;
    std::vector<std::optional<Real>> correlation;

    [[nodiscard]] bool is_identity() const noexcept {
        for (Size e = 0; e < mapping.size(); ++e) {
            if (mapping[e] != static_cast<Index>(e)) return false;
        }
        return true;
    }
};

/// @brief Pair estimated profiles with reference profiles by maximum Pearson
/// correlation, highest pair first, each column used at most once.
/// @throws DimensionError if the feature counts differ
DCV_EXPORT IdentityAssignment assign_identities(const Mat& estimated, const Mat& reference);

} // namespace dcv::kernel::matching
