#include "api/ServiceApi.hpp"
#include "rec/Errors.hpp"

#include <cctype>

using json = nlohmann::json;

namespace api {

static ApiResponse error_response(int status, const std::string& detail) {
    ApiResponse r;
    r.status = status;
    r.body = json{{"detail", detail}};
    return r;
}

static std::string yes_no(bool b) { return b ? "Yes" : "No"; }

json assessment_json(const catalog::Assessment& a) {
    json j;
    j["url"] = a.url;
    j["name"] = a.name;
    j["adaptive_support"] = yes_no(a.adaptive_support);
    j["description"] = a.description;
    j["duration"] = a.duration_mins;
    j["remote_support"] = yes_no(a.remote_support);
    j["test_type"] = json::array({catalog::test_type_label(a.test_type)});
    return j;
}

json recommendation_payload(const rec::RecommendationResult& res) {
    json items = json::array();
    for (const auto& it : res.items) items.push_back(assessment_json(*it.record));
    return json{{"recommended_assessments", std::move(items)}};
}

ApiResponse handle_recommend(const rec::RecommenderContext& ctx,
                             const std::string& body,
                             const rec::RankingConfig& cfg) {
    json req = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (req.is_discarded() || !req.is_object()) {
        return error_response(422, "request body must be a JSON object");
    }
    if (!req.contains("query") || !req.at("query").is_string()) {
        return error_response(422, "field 'query' must be a string");
    }

    const std::string query = req.at("query").get<std::string>();
    if (rec::is_blank(query)) return error_response(400, "Query cannot be empty");

    try {
        ApiResponse r;
        r.body = recommendation_payload(rec::recommend(ctx, query, cfg));
        return r;
    } catch (const rec::ValidationError& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        return error_response(500, std::string("Error: ") + e.what());
    }
}

ApiResponse handle_health(const rec::RecommenderContext& ctx, const ServiceInfo& info) {
    ApiResponse r;
    r.body = json{
        {"status", "healthy"},
        {"service", info.service},
        {"assessments_loaded", ctx.catalog().size()},
        {"model", ctx.embedder().model_name()},
        {"embedding_dimension", ctx.index().dim()},
    };
    return r;
}

ApiResponse handle_root(const ServiceInfo& info) {
    ApiResponse r;
    r.body = json{
        {"message", info.service + " API"},
        {"status", "active"},
        {"version", info.version},
        {"endpoints", {
            {"health", "/health"},
            {"recommend", "/recommend (POST)"},
        }},
    };
    return r;
}

static std::string upper_ascii(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

ApiResponse handle(const rec::RecommenderContext& ctx,
                   const std::string& method,
                   const std::string& path,
                   const std::string& body,
                   const ServiceInfo& info,
                   const rec::RankingConfig& cfg) {
    const std::string m = upper_ascii(method);

    std::string p = path;
    const size_t q = p.find('?');
    if (q != std::string::npos) p.resize(q);
    if (p.size() > 1 && p.back() == '/') p.pop_back();

    if (p == "/recommend") {
        if (m != "POST") return error_response(405, "Method Not Allowed");
        return handle_recommend(ctx, body, cfg);
    }
    if (p == "/health") {
        if (m != "GET") return error_response(405, "Method Not Allowed");
        return handle_health(ctx, info);
    }
    if (p == "/" || p.empty()) {
        if (m != "GET") return error_response(405, "Method Not Allowed");
        return handle_root(info);
    }
    return error_response(404, "Not Found");
}

}  // namespace api
