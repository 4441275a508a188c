// pattern_analysis_test.cpp - learning-rule induction from settled wagers

#include <gtest/gtest.h>

#include "ledger/pattern_analysis.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

// ===========================================================================
// Fixture
// ===========================================================================
class PatternAnalysisTest : public ::testing::Test {
protected:
    WagerStore store{":memory:"};

    // Settled wager with neutral facts unless overridden.
    static Wager settled(Outcome o, double edge = 0.02, double confidence = 0.55,
                         DebateWinner winner = DebateWinner::NEUTRAL,
                         Pick pick = Pick::OVER) {
        Wager w = test_helpers::wager(pick, 220.5, confidence, edge);
        w.debate_winner = winner;
        w.outcome = o;
        w.profit = profit_for(o, w.decimal_odds);
        return w;
    }

    static std::vector<Wager> batch(int wins, int losses, double edge, double confidence,
                                    DebateWinner winner = DebateWinner::NEUTRAL,
                                    Pick pick = Pick::OVER) {
        std::vector<Wager> out;
        for (int i = 0; i < wins; ++i) out.push_back(settled(Outcome::WIN, edge, confidence, winner, pick));
        for (int i = 0; i < losses; ++i) out.push_back(settled(Outcome::LOSS, edge, confidence, winner, pick));
        return out;
    }

    void persist(const std::vector<Wager>& ws) {
        for (const auto& w : ws) {
            int64_t id = store.insert_wager(w);
            store.settle(id, w.outcome == Outcome::WIN
                                 ? grade_over_under(Pick::OVER, 225.0, 220.5, w.decimal_odds)
                                 : grade_over_under(Pick::OVER, 210.0, 220.5, w.decimal_odds));
        }
    }

    static const LearningRule* find(const std::vector<LearningRule>& rules, RuleCondition c) {
        for (const auto& r : rules)
            if (r.condition == c) return &r;
        return nullptr;
    }
};

// ===========================================================================
// 1. Candidate conditions
// ===========================================================================

TEST_F(PatternAnalysisTest, HighEdgeLosingRuleProposed) {
    auto rules = PatternAnalyzer(store).candidates(batch(4, 6, 0.08, 0.55));
    const LearningRule* r = find(rules, RuleCondition::HIGH_EDGE);
    ASSERT_NE(r, nullptr);
    EXPECT_DOUBLE_EQ(r->threshold, 0.05);
    EXPECT_DOUBLE_EQ(r->adjustment, -0.02);
    EXPECT_EQ(r->sample_size, 10);
    EXPECT_NEAR(r->loss_rate, 0.6, 1e-12);
    EXPECT_NE(r->evidence.find("6/10"), std::string::npos);
}

TEST_F(PatternAnalysisTest, TooFewLossesProposeNothing) {
    // 4 of 5 lost, but under the minimum loss count.
    auto rules = PatternAnalyzer(store).candidates(batch(1, 4, 0.08, 0.75, DebateWinner::SUPPORTING));
    EXPECT_TRUE(rules.empty());
}

TEST_F(PatternAnalysisTest, LossRateAtThresholdIsNotEnough) {
    // 11 of 20 is exactly 0.55.
    auto rules = PatternAnalyzer(store).candidates(batch(9, 11, 0.08, 0.55));
    EXPECT_EQ(find(rules, RuleCondition::HIGH_EDGE), nullptr);
}

TEST_F(PatternAnalysisTest, SupportingDebateAndHighConfidence) {
    auto rules = PatternAnalyzer(store).candidates(
        batch(4, 5, 0.02, 0.72, DebateWinner::SUPPORTING));
    const LearningRule* debate = find(rules, RuleCondition::SUPPORTING_DEBATE);
    const LearningRule* conf = find(rules, RuleCondition::HIGH_CONFIDENCE);
    ASSERT_NE(debate, nullptr);
    ASSERT_NE(conf, nullptr);
    EXPECT_DOUBLE_EQ(debate->adjustment, -0.03);
    EXPECT_DOUBLE_EQ(conf->threshold, 0.70);
}

TEST_F(PatternAnalysisTest, DirectionNeedsTenSamples) {
    auto rules = PatternAnalyzer(store).candidates(batch(2, 7, 0.02, 0.55, DebateWinner::NEUTRAL, Pick::UNDER));
    EXPECT_EQ(find(rules, RuleCondition::BET_DIRECTION), nullptr);

    rules = PatternAnalyzer(store).candidates(batch(3, 7, 0.02, 0.55, DebateWinner::NEUTRAL, Pick::UNDER));
    const LearningRule* r = find(rules, RuleCondition::BET_DIRECTION);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(*r->bet_type, BetType::TOTAL);
    EXPECT_EQ(*r->pick, Pick::UNDER);
    EXPECT_EQ(r->description, "direction = TOTAL UNDER");
}

TEST_F(PatternAnalysisTest, UnsettledWagersIgnored) {
    std::vector<Wager> ws = batch(0, 6, 0.08, 0.55);
    for (auto& w : ws) w.outcome.reset();
    EXPECT_TRUE(PatternAnalyzer(store).candidates(ws).empty());
}

// ===========================================================================
// 2. Run against the store
// ===========================================================================

TEST_F(PatternAnalysisTest, RunCreatesRulesOnce) {
    persist(batch(3, 7, 0.08, 0.55));
    auto first = PatternAnalyzer(store).run();
    EXPECT_EQ(first.settled_examined, 10);
    EXPECT_EQ(first.thresholds_version, 1);
    ASSERT_FALSE(first.created.empty());
    for (const auto& r : first.created) EXPECT_GT(r.id, 0);

    auto second = PatternAnalyzer(store).run();
    EXPECT_TRUE(second.created.empty());
    EXPECT_EQ(second.skipped.size(), first.created.size());
    EXPECT_EQ(store.active_rules().size(), first.created.size());
}

TEST_F(PatternAnalysisTest, RulesCarryThresholdVersion) {
    persist(batch(3, 7, 0.08, 0.55));
    PatternThresholds t;
    t.version = 4;
    PatternAnalyzer(store, t).run();
    for (const auto& r : store.active_rules()) EXPECT_EQ(r.thresholds_version, 4);
}

TEST_F(PatternAnalysisTest, HighConfidenceLossesMostConfidentFirst) {
    persist(batch(0, 1, 0.02, 0.72));
    persist(batch(0, 1, 0.02, 0.80));
    persist(batch(1, 0, 0.02, 0.85));
    persist(batch(0, 1, 0.02, 0.60));
    auto report = PatternAnalyzer(store).run();
    ASSERT_EQ(report.high_confidence_losses.size(), 2u);
    EXPECT_DOUBLE_EQ(report.high_confidence_losses[0].confidence, 0.80);
    EXPECT_DOUBLE_EQ(report.high_confidence_losses[1].confidence, 0.72);
}
