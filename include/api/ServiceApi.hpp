#pragma once
#include "catalog/Assessment.hpp"
#include "rec/RankingConfig.hpp"
#include "rec/Recommender.hpp"

#include <string>

#include "nlohmann/json.hpp"

namespace api {

struct ServiceInfo {
    std::string service = "Assessment Recommender";
    std::string version = "1.0.0";
};

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// one entry of "recommended_assessments"
nlohmann::json assessment_json(const catalog::Assessment& a);

nlohmann::json recommendation_payload(const rec::RecommendationResult& res);

// POST /recommend: 422 malformed body, 400 blank query, 500 any engine failure
ApiResponse handle_recommend(const rec::RecommenderContext& ctx,
                             const std::string& body,
                             const rec::RankingConfig& cfg = rec::RankingConfig{});

// GET /health
ApiResponse handle_health(const rec::RecommenderContext& ctx, const ServiceInfo& info);

// GET /
ApiResponse handle_root(const ServiceInfo& info);

// Route table for the three endpoints; 404 unknown path, 405 wrong method.
ApiResponse handle(const rec::RecommenderContext& ctx,
                   const std::string& method,
                   const std::string& path,
                   const std::string& body,
                   const ServiceInfo& info = ServiceInfo{},
                   const rec::RankingConfig& cfg = rec::RankingConfig{});

}  // namespace api
