#include <gtest/gtest.h>
#include "rec/ConstraintFilter.hpp"
#include "test_fixtures.hpp"

using namespace rec;
using fixtures::make_assessment;

namespace {

std::vector<std::string> names(const std::vector<ScoredCandidate>& v) {
    std::vector<std::string> out;
    for (const auto& c : v) out.push_back(c.record->name);
    return out;
}

}  // namespace

class ConstraintFilterTest : public ::testing::Test {
protected:
    catalog::AssessmentCatalog cat;
    std::vector<float> scores;
    RankingConfig cfg;

    void add(const std::string& name, const std::string& code, int duration, float score) {
        records.push_back(make_assessment(name, code, duration));
        scores.push_back(score);
    }
    void build() { cat = catalog::AssessmentCatalog::from_records(records); }

    std::vector<catalog::Assessment> records;
};

// ==========================================
// Ordering
// ==========================================

TEST_F(ConstraintFilterTest, NoConstraintSortsDescending) {
    add("a", "K", 10, 0.2f);
    add("b", "K", 10, 0.9f);
    add("c", "P", 10, 0.5f);
    build();

    auto out = apply_constraints(cat, scores, QueryRequirements{}, cfg);
    EXPECT_EQ(names(out.candidates), (std::vector<std::string>{"b", "c", "a"}));
    EXPECT_FALSE(out.duration_relaxed);
}

TEST_F(ConstraintFilterTest, TiesKeepCorpusOrder) {
    add("first", "K", 10, 0.5f);
    add("second", "P", 10, 0.7f);
    add("third", "A", 10, 0.5f);
    add("fourth", "K", 10, 0.5f);
    build();

    auto out = apply_constraints(cat, scores, QueryRequirements{}, cfg);
    EXPECT_EQ(names(out.candidates), (std::vector<std::string>{"second", "first", "third", "fourth"}));
    EXPECT_EQ(out.candidates[1].position, 0u);
    EXPECT_EQ(out.candidates[2].position, 2u);
}

// ==========================================
// Duration constraint and relaxation
// ==========================================

TEST_F(ConstraintFilterTest, StrictCapWhenEnoughMatches) {
    for (int i = 0; i < 5; ++i) add("short" + std::to_string(i), "K", 20 + i, 0.1f * i);
    add("slightly_long", "K", 45, 0.99f);
    add("long", "K", 90, 0.95f);
    build();

    QueryRequirements r;
    r.max_duration = 40;
    auto out = apply_constraints(cat, scores, r, cfg);

    EXPECT_FALSE(out.duration_relaxed);
    ASSERT_EQ(out.candidates.size(), 5u);
    for (const auto& c : out.candidates) EXPECT_LE(c.record->duration_mins, 40);
}

TEST_F(ConstraintFilterTest, ExactlyFiveAtCapDoesNotRelax) {
    for (int i = 0; i < 5; ++i) add("at_cap" + std::to_string(i), "P", 30, 0.5f);
    add("within_relax", "P", 35, 0.9f);
    build();

    QueryRequirements r;
    r.max_duration = 30;
    auto out = apply_constraints(cat, scores, r, cfg);
    EXPECT_FALSE(out.duration_relaxed);
    EXPECT_EQ(out.candidates.size(), 5u);
}

TEST_F(ConstraintFilterTest, RelaxesOnceByTenMinutes) {
    add("in", "K", 30, 0.1f);
    add("in2", "K", 40, 0.2f);
    add("edge", "K", 50, 0.3f);
    add("near", "K", 45, 0.4f);
    add("out", "K", 51, 0.9f);
    build();

    QueryRequirements r;
    r.max_duration = 40;
    auto out = apply_constraints(cat, scores, r, cfg);

    EXPECT_TRUE(out.duration_relaxed);
    // still fewer than five after relaxing: accepted as-is
    EXPECT_EQ(names(out.candidates), (std::vector<std::string>{"near", "edge", "in2", "in"}));
}

TEST_F(ConstraintFilterTest, ZeroMinuteCapIsStillACap) {
    add("untimed", "B", 0, 0.5f);
    add("ten", "B", 10, 0.6f);
    add("eleven", "B", 11, 0.7f);
    build();

    QueryRequirements r;
    r.max_duration = 0;
    auto out = apply_constraints(cat, scores, r, cfg);
    EXPECT_TRUE(out.duration_relaxed);
    EXPECT_EQ(names(out.candidates), (std::vector<std::string>{"ten", "untimed"}));
}

TEST_F(ConstraintFilterTest, RelaxationFollowsConfig) {
    add("a", "K", 20, 0.5f);
    add("b", "K", 25, 0.6f);
    build();

    QueryRequirements r;
    r.max_duration = 20;
    cfg.min_results = 1;
    auto strict = apply_constraints(cat, scores, r, cfg);
    EXPECT_FALSE(strict.duration_relaxed);
    EXPECT_EQ(strict.candidates.size(), 1u);

    cfg.min_results = 5;
    cfg.duration_relax_mins = 4;
    auto narrow = apply_constraints(cat, scores, r, cfg);
    EXPECT_TRUE(narrow.duration_relaxed);
    EXPECT_EQ(narrow.candidates.size(), 1u);
}

// ==========================================
// Entry-level boost
// ==========================================

TEST(EntryLevelName, MatchesPatterns) {
    EXPECT_TRUE(is_entry_level_name("Entry Level Sales Solution"));
    EXPECT_TRUE(is_entry_level_name("Graduate Scenarios"));
    EXPECT_TRUE(is_entry_level_name("Junior Developer Test"));
    EXPECT_TRUE(is_entry_level_name("Data Entry (New)"));
    EXPECT_FALSE(is_entry_level_name("Sales Representative Solution"));
    EXPECT_FALSE(is_entry_level_name(""));
}

TEST_F(ConstraintFilterTest, EntryBoostReordersOnlyWhenRequested) {
    add("Sales Representative Solution", "K", 30, 0.50f);
    add("Entry Level Sales Solution", "K", 30, 0.45f);
    add("Graduate Scenarios", "B", 30, 0.20f);
    build();

    auto plain = apply_constraints(cat, scores, QueryRequirements{}, cfg);
    EXPECT_EQ(plain.candidates.front().record->name, "Sales Representative Solution");
    for (const auto& c : plain.candidates) EXPECT_EQ(c.boost, 0.0f);

    QueryRequirements r;
    r.is_entry_level = true;
    auto boosted = apply_constraints(cat, scores, r, cfg);
    ASSERT_EQ(boosted.candidates.size(), 3u);
    EXPECT_EQ(boosted.candidates[0].record->name, "Entry Level Sales Solution");
    EXPECT_NEAR(boosted.candidates[0].score(), 0.55f, 1e-6);
    EXPECT_NEAR(boosted.candidates[0].similarity, 0.45f, 1e-6);
    EXPECT_EQ(boosted.candidates[1].boost, 0.0f);
    EXPECT_NEAR(boosted.candidates[2].boost, 0.1f, 1e-6);
}

TEST_F(ConstraintFilterTest, BoostDoesNotFilter) {
    add("Graduate Scenarios", "B", 30, 0.1f);
    add("Verify - Numerical Ability", "A", 30, 0.2f);
    build();

    QueryRequirements r;
    r.is_entry_level = true;
    EXPECT_EQ(apply_constraints(cat, scores, r, cfg).candidates.size(), 2u);
}

TEST_F(ConstraintFilterTest, BoostedScoreMayExceedOne) {
    add("Junior Java Test", "K", 10, 0.98f);
    build();

    QueryRequirements r;
    r.is_entry_level = true;
    auto out = apply_constraints(cat, scores, r, cfg);
    EXPECT_GT(out.candidates[0].score(), 1.0f);
}

TEST_F(ConstraintFilterTest, ScoreCountMustMatchCatalog) {
    add("a", "K", 10, 0.1f);
    build();
    scores.push_back(0.3f);
    EXPECT_THROW(apply_constraints(cat, scores, QueryRequirements{}, cfg), std::invalid_argument);
}
