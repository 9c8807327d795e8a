#include "rec/Balancer.hpp"

#include <algorithm>
#include <unordered_set>

namespace rec {

static void take_top(const std::vector<ScoredCandidate>& sorted, catalog::TestType type,
                     size_t quota, std::vector<ScoredCandidate>& out) {
    size_t taken = 0;
    for (const auto& c : sorted) {
        if (taken >= quota) break;
        if (c.record->test_type != type) continue;
        out.push_back(c);
        ++taken;
    }
}

static std::vector<ScoredCandidate> unique_by_url(const std::vector<ScoredCandidate>& in) {
    std::vector<ScoredCandidate> out;
    out.reserve(in.size());
    std::unordered_set<std::string> seen;
    seen.reserve(in.size() * 2 + 8);
    for (const auto& c : in) {
        if (seen.insert(c.record->url).second) out.push_back(c);
    }
    return out;
}

std::vector<ScoredCandidate> balance_and_rank(const std::vector<ScoredCandidate>& sorted,
                                              const QueryRequirements& reqs,
                                              const RankingConfig& cfg) {
    std::vector<ScoredCandidate> ranked;

    if (reqs.needs_balanced) {
        std::vector<ScoredCandidate> pool;
        pool.reserve(cfg.knowledge_quota + cfg.personality_quota + cfg.ability_quota);
        take_top(sorted, catalog::TestType::Knowledge, cfg.knowledge_quota, pool);
        take_top(sorted, catalog::TestType::Personality, cfg.personality_quota, pool);
        if (reqs.needs_cognitive) {
            take_top(sorted, catalog::TestType::Ability, cfg.ability_quota, pool);
        }

        ranked = unique_by_url(pool);
        // equal scores fall back to corpus order, same as the filter's ordering
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const ScoredCandidate& a, const ScoredCandidate& b) {
                             if (a.score() != b.score()) return a.score() > b.score();
                             return a.position < b.position;
                         });
    } else {
        // the catalog guarantees unique urls; this only matters for hand-built inputs
        ranked = unique_by_url(sorted);
    }

    // 5..10 nominally; a shorter list is returned whole
    if (ranked.size() > cfg.max_results) ranked.resize(cfg.max_results);
    return ranked;
}

}  // namespace rec
