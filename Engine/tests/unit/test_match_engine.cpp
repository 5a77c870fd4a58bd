/**
 * @file test_match_engine.cpp
 * @brief Strategy scoring and proposal ordering
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <matching/match_engine.hpp>
#include "../statement_fixtures.hpp"
#include <limits>

using namespace Meisai;

namespace {

StatementRecord record() {
    StatementRecord r;
    r.date = "2024-04-01";
    r.time = "09:00";
    r.entry_point = "Tokyo";
    r.exit_point = "Yokohama-Aoba";
    r.toll_amount = 1200;
    r.vehicle_number = "Shinagawa 300 A 12-34";
    r.card_number = "1234";
    return r;
}

ExternalEntity candidate(const std::string& id, const StatementRecord& r) {
    ExternalEntity e;
    e.id = id;
    e.entity_type = "trip";
    e.date = r.date;
    e.time = r.time;
    e.entry_point = r.entry_point;
    e.exit_point = r.exit_point;
    e.toll_amount = r.toll_amount;
    e.vehicle_number = r.vehicle_number;
    return e;
}

} // namespace

TEST(MatchEngineTest, ExactMatchScoresOne) {
    MatchEngine engine;
    auto r = record();
    auto m = engine.score(r, candidate("c1", r));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->match_type, MatchType::Exact);
    EXPECT_DOUBLE_EQ(m->confidence, 1.0);
}

TEST(MatchEngineTest, AmountWithinToleranceIsAmountMatch) {
    MatchConfig config;
    config.amount_tolerance = 100;
    MatchEngine engine(config);

    auto r = record();
    auto c = candidate("c1", r);
    c.toll_amount = 1250;

    auto proposals = engine.propose(r, {c});
    ASSERT_EQ(proposals.size(), 1);
    EXPECT_EQ(proposals[0].match_type, MatchType::Amount);
    EXPECT_GT(proposals[0].confidence, 0.0);
    EXPECT_LT(proposals[0].confidence, 1.0);
    EXPECT_NEAR(proposals[0].confidence, 0.725, 1e-9);
}

TEST(MatchEngineTest, AmountBeyondToleranceDoesNotMatch) {
    MatchEngine engine;
    auto r = record();
    auto c = candidate("c1", r);
    c.toll_amount = 1400;
    EXPECT_FALSE(engine.score(r, c).has_value());
}

TEST(MatchEngineTest, PercentToleranceWidensLimit) {
    MatchConfig config;
    config.amount_tolerance = 10;
    config.amount_tolerance_percent = 20.0;
    MatchEngine engine(config);

    auto r = record();
    auto c = candidate("c1", r);
    c.toll_amount = 1400;       // 20% of 1400 = 280
    auto m = engine.score(r, c);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->match_type, MatchType::Amount);
}

TEST(MatchEngineTest, ExtremeCandidateAmountsDoNotMatch) {
    MatchConfig config;
    config.amount_tolerance_percent = 50.0;
    MatchEngine engine(config);

    auto r = record();
    for (int64_t amount : {std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max(), int64_t{-1200}}) {
        auto c = candidate("c1", r);
        c.toll_amount = amount;
        EXPECT_FALSE(engine.score(r, c).has_value()) << amount;
        EXPECT_TRUE(engine.propose(r, {c}).empty()) << amount;
    }
}

TEST(MatchEngineTest, TimeWindowDecaysWithDistance) {
    MatchEngine engine;
    auto r = record();

    auto near = candidate("near", r);
    near.time = "09:05";
    auto far = candidate("far", r);
    far.time = "09:30";
    auto outside = candidate("outside", r);
    outside.time = "09:31";

    auto m1 = engine.score(r, near);
    auto m2 = engine.score(r, far);
    ASSERT_TRUE(m1 && m2);
    EXPECT_EQ(m1->match_type, MatchType::Time);
    EXPECT_GT(m1->confidence, m2->confidence);
    EXPECT_NEAR(m2->confidence, 0.90, 1e-9);
    EXPECT_FALSE(engine.score(r, outside).has_value());
}

TEST(MatchEngineTest, TimeWindowCrossesMidnight) {
    MatchEngine engine;
    auto r = record();
    r.date = "2024-03-31";
    r.time = "23:50";
    auto c = candidate("c1", r);
    c.date = "2024-04-01";
    c.time = "00:10";

    auto m = engine.score(r, c);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->match_type, MatchType::Time);
}

TEST(MatchEngineTest, FuzzyTextOnSpellingVariant) {
    MatchEngine engine;
    auto r = record();
    auto c = candidate("c1", r);
    c.exit_point = "Yokohama Aoba";

    auto m = engine.score(r, c);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->match_type, MatchType::Fuzzy);
    double expected = ((1.0 + (1.0 - 1.0 / 13.0) + 1.0) / 3.0) * 0.9;
    EXPECT_NEAR(m->confidence, expected, 1e-9);
}

TEST(MatchEngineTest, UnrelatedCandidateIsDropped) {
    MatchEngine engine;
    auto r = record();
    ExternalEntity c;
    c.id = "x";
    c.entity_type = "trip";
    c.date = "2023-01-01";
    c.time = "12:00";
    c.entry_point = "Osaka";
    c.exit_point = "Kyoto";
    c.toll_amount = 5000;
    EXPECT_TRUE(engine.propose(r, {c}).empty());
}

TEST(MatchEngineTest, ProposalsSortedBestFirstThenById) {
    MatchEngine engine;
    auto r = record();

    auto exact_b = candidate("b", r);
    auto exact_a = candidate("a", r);
    auto amount = candidate("c", r);
    amount.toll_amount = 1250;

    auto proposals = engine.propose(r, {amount, exact_b, exact_a});
    ASSERT_EQ(proposals.size(), 3);
    EXPECT_EQ(proposals[0].candidate_id, "a");
    EXPECT_EQ(proposals[1].candidate_id, "b");
    EXPECT_EQ(proposals[2].candidate_id, "c");
}

TEST(MatchEngineTest, ThresholdFiltersWeakMatches) {
    MatchConfig config;
    config.acceptance_threshold = 0.8;
    MatchEngine engine(config);

    auto r = record();
    auto c = candidate("c1", r);
    c.toll_amount = 1280;       // amount confidence 0.59
    EXPECT_TRUE(engine.propose(r, {c}).empty());
}

TEST(MatchEngineTest, CustomStrategyParticipates) {
    class VehicleOnly : public MatchStrategy {
    public:
        MatchType type() const override { return MatchType::Manual; }
        std::optional<double> score(const StatementRecord& r, const ExternalEntity& c) const override {
            if (r.vehicle_number == c.vehicle_number) return 0.6;
            return std::nullopt;
        }
    };

    MatchEngine engine;
    engine.add_strategy(std::make_unique<VehicleOnly>());

    auto r = record();
    auto c = candidate("c1", r);
    c.date = "2020-01-01";
    auto m = engine.score(r, c);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->match_type, MatchType::Manual);
    EXPECT_THROW(engine.add_strategy(nullptr), MeisaiError);
}

TEST(MatchEngineTest, InvalidConfigRejected) {
    MatchConfig config;
    config.time_confidence_min = 0.99;
    EXPECT_THROW(MatchEngine{config}, MeisaiError);

    config = {};
    config.acceptance_threshold = 1.5;
    EXPECT_THROW(config.validate(), MeisaiError);
}

TEST(TextSimilarityTest, Basics) {
    EXPECT_DOUBLE_EQ(text_similarity("東京", "東京"), 1.0);
    EXPECT_DOUBLE_EQ(text_similarity("", ""), 1.0);
    EXPECT_DOUBLE_EQ(text_similarity("abc", ""), 0.0);
    EXPECT_DOUBLE_EQ(text_similarity("東京", "東北"), 0.5);
    EXPECT_DOUBLE_EQ(text_similarity("  東京　", "東京"), 1.0);
}
