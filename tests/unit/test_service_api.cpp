#include <gtest/gtest.h>
#include "api/ServiceApi.hpp"
#include "test_fixtures.hpp"

using fixtures::make_assessment;
using fixtures::Row;
using json = nlohmann::json;

class ServiceApiTest : public ::testing::Test {
protected:
    std::shared_ptr<const rec::RecommenderContext> ctx;

    void SetUp() override {
        std::vector<Row> rows;
        for (int i = 0; i < 6; ++i) rows.push_back({make_assessment("Api Knowledge " + std::to_string(i), "K", 20 + i), 0.8f - 0.01f * i});
        for (int i = 0; i < 6; ++i) rows.push_back({make_assessment("Api Personality " + std::to_string(i), "P", 25), 0.5f - 0.01f * i});
        rows[0].a.adaptive_support = true;
        rows[0].a.remote_support = true;
        rows.push_back({make_assessment("Api Biodata", "B", 10), 0.1f});
        rows.push_back({make_assessment("Api Simulation", "S", 10), 0.05f});
        ctx = fixtures::make_context(rows);
    }
};

// ==========================================
// POST /recommend
// ==========================================

TEST_F(ServiceApiTest, RecommendPayloadShape) {
    auto r = api::handle(*ctx, "POST", "/recommend", R"({"query": "Java developer with communication skills"})");
    ASSERT_EQ(r.status, 200) << r.body.dump();
    ASSERT_TRUE(r.body.contains("recommended_assessments"));

    const json& items = r.body["recommended_assessments"];
    ASSERT_TRUE(items.is_array());
    ASSERT_EQ(items.size(), 10u);

    const json& first = items[0];
    EXPECT_EQ(first["name"], "Api Knowledge 0");
    EXPECT_EQ(first["url"], "https://www.example.com/products/product-catalog/view/api-knowledge-0/");
    EXPECT_EQ(first["adaptive_support"], "Yes");
    EXPECT_EQ(first["remote_support"], "Yes");
    EXPECT_EQ(first["duration"], 20);
    EXPECT_TRUE(first["description"].is_string());
    EXPECT_EQ(first["test_type"], json::array({"Knowledge & Skills"}));

    bool saw_personality = false;
    for (const auto& it : items) {
        EXPECT_EQ(it.size(), 7u);
        if (it["test_type"][0] == "Personality & Behaviour") {
            saw_personality = true;
            EXPECT_EQ(it["adaptive_support"], "No");
        }
    }
    EXPECT_TRUE(saw_personality);
}

TEST_F(ServiceApiTest, LabelsForBiodataAndUnknownCodes) {
    EXPECT_EQ(api::assessment_json(make_assessment("x", "B", 1))["test_type"][0], "Biodata & SJT");
    EXPECT_EQ(api::assessment_json(make_assessment("y", "A", 1))["test_type"][0], "Ability & Aptitude");
    EXPECT_EQ(api::assessment_json(make_assessment("z", "S", 1))["test_type"][0], "Other");
}

TEST_F(ServiceApiTest, BlankQueryIs400) {
    for (const char* body : {R"({"query": ""})", R"({"query": "   "})"}) {
        auto r = api::handle_recommend(*ctx, body);
        EXPECT_EQ(r.status, 400);
        EXPECT_EQ(r.body["detail"], "Query cannot be empty");
    }
}

TEST_F(ServiceApiTest, MalformedBodyIs422) {
    EXPECT_EQ(api::handle_recommend(*ctx, "not json").status, 422);
    EXPECT_EQ(api::handle_recommend(*ctx, "[]").status, 422);
    EXPECT_EQ(api::handle_recommend(*ctx, R"({"q": "java"})").status, 422);
    EXPECT_EQ(api::handle_recommend(*ctx, R"({"query": 42})").status, 422);
    EXPECT_EQ(api::handle_recommend(*ctx, "").status, 422);
}

TEST(ServiceApi, EngineFailureIs500WithMessage) {
    auto ctx = fixtures::make_context({{make_assessment("Only", "K", 10), 0.5f}},
                                      std::make_shared<const fixtures::FailingEmbedder>(2));
    auto r = api::handle_recommend(*ctx, R"({"query": "java"})");
    EXPECT_EQ(r.status, 500);
    const std::string detail = r.body["detail"];
    EXPECT_EQ(detail.rfind("Error: ", 0), 0u);
    EXPECT_NE(detail.find("model crashed"), std::string::npos);
}

// ==========================================
// GET /health and GET /
// ==========================================

TEST_F(ServiceApiTest, Health) {
    auto r = api::handle(*ctx, "GET", "/health", "");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["status"], "healthy");
    EXPECT_EQ(r.body["assessments_loaded"], 14);
    EXPECT_EQ(r.body["model"], "constant");
    EXPECT_EQ(r.body["embedding_dimension"], 2);
}

TEST_F(ServiceApiTest, Root) {
    api::ServiceInfo info;
    info.version = "2.3.4";
    auto r = api::handle(*ctx, "get", "/", "", info);
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body["status"], "active");
    EXPECT_EQ(r.body["version"], "2.3.4");
    EXPECT_EQ(r.body["endpoints"]["recommend"], "/recommend (POST)");
}

// ==========================================
// Routing
// ==========================================

TEST_F(ServiceApiTest, UnknownPathAndWrongMethod) {
    EXPECT_EQ(api::handle(*ctx, "GET", "/nope", "").status, 404);
    EXPECT_EQ(api::handle(*ctx, "GET", "/recommend", "").status, 405);
    EXPECT_EQ(api::handle(*ctx, "POST", "/health", "").status, 405);
    EXPECT_EQ(api::handle(*ctx, "DELETE", "/", "").status, 405);
}

TEST_F(ServiceApiTest, TrailingSlashAndQueryStringAreIgnored) {
    EXPECT_EQ(api::handle(*ctx, "GET", "/health/", "").status, 200);
    EXPECT_EQ(api::handle(*ctx, "GET", "/health?verbose=1", "").status, 200);
    EXPECT_EQ(api::handle(*ctx, "POST", "/recommend/", R"({"query": "java"})").status, 200);
}
