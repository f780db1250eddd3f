#include "dcv/kernel/matching.hpp"

#include "dcv/core/error.hpp"
#include "dcv/core/log.hpp"
#include "dcv/kernel/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <tuple>
#include <unordered_map>

namespace dcv::kernel::matching {

namespace {

// (score, source, target) candidates, best first, deterministic on ties
struct Candidate {
    Real score;
    Index source;
    Index target;
};

void sort_candidates(std::vector<Candidate>& c) {
    std::sort(c.begin(), c.end(), [](const Candidate& a, const Candidate& b) {
        return std::tie(b.score, a.source, a.target) < std::tie(a.score, b.source, b.target);
    });
}

auto exact_pass(const Labels& source, const Labels& target,
                std::vector<Index>& source_to_target, std::vector<char>& target_used) -> std::vector<Match> {
    std::unordered_map<std::string, Index> lookup;
    lookup.reserve(target.size());
    for (Index t = 0; t < static_cast<Index>(target.size()); ++t) {
        lookup.emplace(target[static_cast<Size>(t)], t);
    }

    std::vector<Match> out;
    for (Index s = 0; s < static_cast<Index>(source.size()); ++s) {
        auto it = lookup.find(source[static_cast<Size>(s)]);
        if (it != lookup.end() && !target_used[static_cast<Size>(it->second)]) {
            source_to_target[static_cast<Size>(s)] = it->second;
            target_used[static_cast<Size>(it->second)] = 1;
            out.push_back(Match{s, it->second, MatchKind::Exact, Real(1)});
        }
    }
    return out;
}

void sort_by_source(std::vector<Match>& matches) {
    std::sort(matches.begin(), matches.end(),
              [](const Match& a, const Match& b) { return a.source < b.source; });
}

} // namespace

auto match_kind_name(MatchKind k) noexcept -> const char* {
    switch (k) {
        case MatchKind::Exact:        return "exact";
        case MatchKind::EditDistance: return "edit_distance";
        case MatchKind::Substring:    return "substring";
    }
    return "unknown";
}

Index edit_distance(std::string_view a, std::string_view b) {
    const Size n = a.size();
    const Size m = b.size();
    std::vector<Index> prev(m + 1);
    std::vector<Index> curr(m + 1);
    for (Size j = 0; j <= m; ++j) prev[j] = static_cast<Index>(j);

    for (Size i = 1; i <= n; ++i) {
        curr[0] = static_cast<Index>(i);
        for (Size j = 1; j <= m; ++j) {
            const Index substitute = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, substitute});
        }
        std::swap(prev, curr);
    }
    return prev[m];
}

std::string normalize_key(std::string_view label) {
    std::string key;
    key.reserve(label.size());
    for (const char ch : label) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            key.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return key;
}

Real label_similarity(std::string_view a, std::string_view b) {
    const std::string ka = normalize_key(a);
    const std::string kb = normalize_key(b);
    const Size longest = std::max(ka.size(), kb.size());
    if (longest == 0) {
        return Real(0);
    }
    return Real(1) - static_cast<Real>(edit_distance(ka, kb)) / static_cast<Real>(longest);
}

std::vector<Match> match_labels(const Labels& source, const Labels& target, Real min_similarity) {
    std::vector<Index> source_to_target(source.size(), -1);
    std::vector<char> target_used(target.size(), 0);
    std::vector<Match> out = exact_pass(source, target, source_to_target, target_used);

    std::vector<Candidate> candidates;
    for (Index s = 0; s < static_cast<Index>(source.size()); ++s) {
        if (source_to_target[static_cast<Size>(s)] >= 0) continue;
        for (Index t = 0; t < static_cast<Index>(target.size()); ++t) {
            if (target_used[static_cast<Size>(t)]) continue;
            const Real sim = label_similarity(source[static_cast<Size>(s)], target[static_cast<Size>(t)]);
            if (sim >= min_similarity) {
                candidates.push_back(Candidate{sim, s, t});
            }
        }
    }
    sort_candidates(candidates);

    for (const auto& c : candidates) {
        if (source_to_target[static_cast<Size>(c.source)] >= 0 || target_used[static_cast<Size>(c.target)]) {
            continue;
        }
        source_to_target[static_cast<Size>(c.source)] = c.target;
        target_used[static_cast<Size>(c.target)] = 1;
        out.push_back(Match{c.source, c.target, MatchKind::EditDistance, c.score});
        DCV_LOG_WARN("matching: cell type '" << source[static_cast<Size>(c.source)]
                     << "' matched to '" << target[static_cast<Size>(c.target)]
                     << "' by edit distance (similarity " << c.score << ")");
    }

    for (Size s = 0; s < source.size(); ++s) {
        if (source_to_target[s] < 0) {
            DCV_LOG_WARN("matching: cell type '" << source[s] << "' has no ground-truth counterpart");
        }
    }

    sort_by_source(out);
    return out;
}

std::vector<Match> match_samples(const Labels& source, const Labels& target) {
    std::vector<Index> source_to_target(source.size(), -1);
    std::vector<char> target_used(target.size(), 0);
    std::vector<Match> out = exact_pass(source, target, source_to_target, target_used);

    for (Index s = 0; s < static_cast<Index>(source.size()); ++s) {
        if (source_to_target[static_cast<Size>(s)] >= 0) continue;
        const std::string& name = source[static_cast<Size>(s)];
        if (name.empty()) continue;

        Index found = -1;
        Index n_found = 0;
        for (Index t = 0; t < static_cast<Index>(target.size()); ++t) {
            if (target_used[static_cast<Size>(t)]) continue;
            const std::string& other = target[static_cast<Size>(t)];
            if (other.empty()) continue;
            if (other.find(name) != std::string::npos || name.find(other) != std::string::npos) {
                found = t;
                ++n_found;
            }
        }

        if (n_found == 1) {
            source_to_target[static_cast<Size>(s)] = found;
            target_used[static_cast<Size>(found)] = 1;
            out.push_back(Match{s, found, MatchKind::Substring, Real(1)});
            DCV_LOG_WARN("matching: sample '" << name << "' matched to '"
                         << target[static_cast<Size>(found)] << "' by substring containment");
        } else if (n_found > 1) {
            DCV_LOG_WARN("matching: sample '" << name << "' is contained in " << n_found
                         << " ground-truth identifiers, left unmatched");
        } else {
            DCV_LOG_WARN("matching: sample '" << name << "' has no ground-truth counterpart");
        }
    }

    sort_by_source(out);
    return out;
}

IdentityAssignment assign_identities(const Mat& estimated, const Mat& reference) {
    DCV_CHECK_DIM(estimated.rows() == reference.rows(),
                  "assign_identities: estimated and reference profiles differ in feature count");

    const Index n_est = estimated.cols();
    const Index n_ref = reference.cols();

    IdentityAssignment out;
    out.mapping.assign(static_cast<Size>(n_est), -1);
    out.correlation.assign(static_cast<Size>(n_est), std::nullopt);

    std::vector<Candidate> candidates;
    candidates.reserve(static_cast<Size>(n_est * n_ref));
    std::vector<std::optional<Real>> corr(static_cast<Size>(n_est * n_ref));
    for (Index e = 0; e < n_est; ++e) {
        for (Index r = 0; r < n_ref; ++r) {
            const auto c = metrics::pearson(col_cview(estimated, e), col_cview(reference, r));
            corr[static_cast<Size>(e * n_ref + r)] = c;
            // Undefined correlations rank below every defined one
            const Real score = c ? *c : -std::numeric_limits<Real>::infinity();
            candidates.push_back(Candidate{score, e, r});
        }
    }
    sort_candidates(candidates);

    std::vector<char> ref_used(static_cast<Size>(n_ref), 0);
    for (const auto& c : candidates) {
        if (out.mapping[static_cast<Size>(c.source)] >= 0 || ref_used[static_cast<Size>(c.target)]) {
            continue;
        }
        out.mapping[static_cast<Size>(c.source)] = c.target;
        out.correlation[static_cast<Size>(c.source)] = corr[static_cast<Size>(c.source * n_ref + c.target)];
        ref_used[static_cast<Size>(c.target)] = 1;
    }
    return out;
}

} // namespace dcv::kernel::matching
