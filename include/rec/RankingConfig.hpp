#pragma once
#include <cstddef>

namespace rec {

struct RankingConfig {
    size_t min_results = 5;          // relax the duration cap below this many matches
    size_t max_results = 10;         // final clamp
    int duration_relax_mins = 10;    // single relaxation step
    float entry_level_boost = 0.1f;  // additive, ranking only
    size_t knowledge_quota = 5;      // K slice when balancing
    size_t personality_quota = 5;    // P slice when balancing
    size_t ability_quota = 3;        // A slice, only if cognitive intent
};

}  // namespace rec
