#pragma once
#include "rec/Recommender.hpp"
#include <string>
#include <vector>

namespace rec {

struct BatchOutcome {
    std::string query;
    bool ok = false;
    std::string error;            // set when !ok
    RecommendationResult result;  // set when ok
};

// Runs every query through recommend() on `workers` threads sharing ctx.
// A failing query only fails its own outcome. Outcomes come back in input order.
std::vector<BatchOutcome> run_batch(const RecommenderContext& ctx,
                                    const std::vector<std::string>& queries,
                                    size_t workers,
                                    const RankingConfig& cfg = RankingConfig{});

}  // namespace rec
