#pragma once
#include "rec/ConstraintFilter.hpp"
#include "rec/QueryAnalyzer.hpp"
#include "rec/RankingConfig.hpp"
#include <vector>

namespace rec {

// Mixed-intent queries get per-category quotas (K, P and optionally A) from
// the sorted list; everything is then deduplicated by url and clamped to
// cfg.max_results. Fewer than cfg.min_results survive only when fewer exist.
std::vector<ScoredCandidate> balance_and_rank(const std::vector<ScoredCandidate>& sorted,
                                              const QueryRequirements& reqs,
                                              const RankingConfig& cfg);

}  // namespace rec
