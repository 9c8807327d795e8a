#pragma once
#include "catalog/AssessmentCatalog.hpp"
#include "rec/QueryAnalyzer.hpp"
#include "rec/RankingConfig.hpp"
#include <string>
#include <vector>

namespace rec {

struct ScoredCandidate {
    const catalog::Assessment* record = nullptr;  // points into the catalog
    size_t position = 0;                          // corpus order
    float similarity = 0.0f;                      // raw cosine, [-1,1]
    float boost = 0.0f;                           // additive, ranking only

    float score() const { return similarity + boost; }
};

struct FilterOutcome {
    std::vector<ScoredCandidate> candidates;  // sorted by score, descending
    bool duration_relaxed = false;
};

// true for names that read like entry/graduate/junior level tests
bool is_entry_level_name(const std::string& name);

// scores[i] belongs to catalog.assessments()[i]
FilterOutcome apply_constraints(const catalog::AssessmentCatalog& catalog,
                                const std::vector<float>& scores,
                                const QueryRequirements& reqs,
                                const RankingConfig& cfg);

}  // namespace rec
