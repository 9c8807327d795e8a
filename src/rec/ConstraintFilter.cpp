#include "rec/ConstraintFilter.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace rec {

bool is_entry_level_name(const std::string& name) {
    std::string lc = name;
    for (char& c : lc) c = (char)std::tolower((unsigned char)c);
    return lc.find("entry") != std::string::npos ||
           lc.find("graduate") != std::string::npos ||
           lc.find("junior") != std::string::npos;
}

static std::vector<ScoredCandidate> within_minutes(const catalog::AssessmentCatalog& catalog,
                                                   const std::vector<float>& scores,
                                                   long long limit) {
    std::vector<ScoredCandidate> out;
    const auto& items = catalog.assessments();
    for (size_t i = 0; i < items.size(); ++i) {
        if ((long long)items[i].duration_mins > limit) continue;
        out.push_back(ScoredCandidate{&items[i], i, scores[i], 0.0f});
    }
    return out;
}

FilterOutcome apply_constraints(const catalog::AssessmentCatalog& catalog,
                                const std::vector<float>& scores,
                                const QueryRequirements& reqs,
                                const RankingConfig& cfg) {
    if (scores.size() != catalog.size()) {
        throw std::invalid_argument("apply_constraints: " + std::to_string(scores.size()) +
                                    " scores for " + std::to_string(catalog.size()) + " assessments");
    }

    FilterOutcome out;

    if (reqs.max_duration) {
        const long long cap = *reqs.max_duration;
        out.candidates = within_minutes(catalog, scores, cap);
        if (out.candidates.size() < cfg.min_results) {
            // exactly one widening; whatever it yields is final
            out.candidates = within_minutes(catalog, scores, cap + cfg.duration_relax_mins);
            out.duration_relaxed = true;
        }
    } else {
        out.candidates = within_minutes(catalog, scores, std::numeric_limits<long long>::max());
    }

    if (reqs.is_entry_level) {
        for (auto& c : out.candidates) {
            if (is_entry_level_name(c.record->name)) c.boost = cfg.entry_level_boost;
        }
    }

    std::stable_sort(out.candidates.begin(), out.candidates.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) {
                         return a.score() > b.score();
                     });
    return out;
}

}  // namespace rec
