// wager_store_test.cpp - SQLite ledger: wagers, settlement, calibration, rules

#include <gtest/gtest.h>

#include "ledger/wager_store.hpp"
#include "test_helpers.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

using test_helpers::wager;

// ===========================================================================
// Fixture
// ===========================================================================
class WagerStoreTest : public ::testing::Test {
protected:
    WagerStore store{":memory:"};

    static SettlementOutcome win() { return grade_over_under(Pick::OVER, 225.0, 220.5, 1.91); }
    static SettlementOutcome loss() { return grade_over_under(Pick::OVER, 210.0, 220.5, 1.91); }

    const CalibrationBucket& bucket(const std::vector<CalibrationBucket>& all, int b) {
        for (const auto& c : all)
            if (c.bucket == b) return c;
        throw std::out_of_range("no bucket " + std::to_string(b));
    }

    static LearningRule rule(RuleCondition c, double threshold = 0.0) {
        LearningRule r;
        r.condition = c;
        r.threshold = threshold;
        r.description = rule_condition_str(c);
        r.adjustment = -0.02;
        r.sample_size = 12;
        r.loss_rate = 0.6;
        r.thresholds_version = 1;
        return r;
    }
};

// ===========================================================================
// 1. Wagers
// ===========================================================================

TEST_F(WagerStoreTest, InsertAndReadBack) {
    Wager w = wager(Pick::UNDER, 221.5, 0.62, 0.035);
    w.reasoning_trace = R"({"k":1})";
    w.depth = "deep";
    int64_t id = store.insert_wager(w);
    ASSERT_GT(id, 0);

    auto got = store.get_wager(id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->pick, Pick::UNDER);
    EXPECT_DOUBLE_EQ(got->line, 221.5);
    EXPECT_DOUBLE_EQ(got->confidence, 0.62);
    EXPECT_EQ(got->depth, "deep");
    EXPECT_EQ(got->reasoning_trace, R"({"k":1})");
    EXPECT_FALSE(got->settled());
    EXPECT_FALSE(got->created_at.empty());
}

TEST_F(WagerStoreTest, MissingWagerIsEmpty) {
    EXPECT_FALSE(store.get_wager(42).has_value());
}

TEST_F(WagerStoreTest, SchemaRejectsInvalidRows) {
    Wager w = wager();
    w.decimal_odds = 1.0;
    EXPECT_THROW(store.insert_wager(w), std::runtime_error);
    w = wager();
    w.confidence = 1.5;
    EXPECT_THROW(store.insert_wager(w), std::runtime_error);
    w = wager();
    w.depth = "exhaustive";
    EXPECT_THROW(store.insert_wager(w), std::runtime_error);
}

TEST_F(WagerStoreTest, FileBackedLedgerPersists) {
    std::string path = test_helpers::temp_path("wager_store_persist.db");
    std::remove(path.c_str());
    int64_t id = 0;
    {
        WagerStore s(path);
        id = s.insert_wager(wager());
    }
    WagerStore reopened(path);
    EXPECT_TRUE(reopened.get_wager(id).has_value());
    std::remove(path.c_str());
}

// ===========================================================================
// 2. Queries
// ===========================================================================

TEST_F(WagerStoreTest, FindFiltersCombine) {
    store.insert_wager(wager(Pick::OVER, 220.5, 0.55));
    store.insert_wager(wager(Pick::UNDER, 220.5, 0.70));
    Wager other = wager(Pick::OVER, 210.5, 0.65);
    other.event_id = "E2";
    store.insert_wager(other);

    WagerQuery q;
    q.event_id = "E1";
    EXPECT_EQ(store.find(q).size(), 2u);
    q.min_confidence = 0.6;
    auto rows = store.find(q);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].pick, Pick::UNDER);

    WagerQuery like;
    like.selection_like = "OVER%";
    EXPECT_EQ(store.find(like).size(), 2u);
}

TEST_F(WagerStoreTest, RecentIsNewestFirst) {
    int64_t a = store.insert_wager(wager());
    int64_t b = store.insert_wager(wager());
    auto rows = store.recent(1);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].id, b);
    EXPECT_GT(b, a);
}

TEST_F(WagerStoreTest, SettledAndUnsettledInIdOrder) {
    int64_t a = store.insert_wager(wager());
    int64_t b = store.insert_wager(wager());
    int64_t c = store.insert_wager(wager());
    ASSERT_TRUE(store.settle(b, win()));

    auto open = store.unsettled();
    ASSERT_EQ(open.size(), 2u);
    EXPECT_EQ(open[0].id, a);
    EXPECT_EQ(open[1].id, c);
    auto done = store.settled();
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0].id, b);
}

// ===========================================================================
// 3. Settlement and calibration
// ===========================================================================

TEST_F(WagerStoreTest, SettleRecordsOutcome) {
    int64_t id = store.insert_wager(wager());
    ASSERT_TRUE(store.settle(id, win()));
    auto w = store.get_wager(id);
    ASSERT_TRUE(w->settled());
    EXPECT_EQ(*w->outcome, Outcome::WIN);
    EXPECT_NEAR(*w->profit, 0.91, 1e-9);
    EXPECT_DOUBLE_EQ(*w->realized_value, 225.0);
    EXPECT_DOUBLE_EQ(*w->realized_margin, 4.5);
    EXPECT_FALSE(w->settled_at.empty());
}

TEST_F(WagerStoreTest, SettleTwiceIsRejectedAndCountedOnce) {
    int64_t id = store.insert_wager(wager(Pick::OVER, 220.5, 0.62));
    ASSERT_TRUE(store.settle(id, win()));
    EXPECT_FALSE(store.settle(id, loss()));

    auto w = store.get_wager(id);
    EXPECT_EQ(*w->outcome, Outcome::WIN);
    auto cal = store.calibration();
    EXPECT_EQ(bucket(cal, 60).total, 1);
    EXPECT_EQ(bucket(cal, 60).losses, 0);
}

TEST_F(WagerStoreTest, SettleMissingWagerFails) {
    EXPECT_FALSE(store.settle(99, win()));
}

TEST_F(WagerStoreTest, CalibrationBucketsStartEmpty) {
    auto cal = store.calibration();
    ASSERT_EQ(cal.size(), 5u);
    EXPECT_EQ(cal.front().bucket, 40);
    EXPECT_EQ(cal.back().bucket, 80);
    for (const auto& b : cal) {
        EXPECT_EQ(b.total, 0);
        EXPECT_FALSE(b.realized_win_rate.has_value());
    }
}

TEST_F(WagerStoreTest, CalibrationTracksWinRateAndError) {
    for (int i = 0; i < 3; ++i) store.settle(store.insert_wager(wager(Pick::OVER, 220.5, 0.71)), win());
    store.settle(store.insert_wager(wager(Pick::OVER, 220.5, 0.69)), loss());
    store.settle(store.insert_wager(wager(Pick::OVER, 220.5, 0.70)),
                 grade_over_under(Pick::OVER, 220.5, 220.5, 1.91));

    const auto& b = bucket(store.calibration(), 70);
    EXPECT_EQ(b.total, 5);
    EXPECT_EQ(b.wins, 3);
    EXPECT_EQ(b.losses, 1);
    EXPECT_EQ(b.pushes, 1);
    ASSERT_TRUE(b.realized_win_rate.has_value());
    EXPECT_NEAR(*b.realized_win_rate, 0.75, 1e-12);
    EXPECT_NEAR(*b.calibration_error, 0.05, 1e-9);
}

TEST_F(WagerStoreTest, BucketForConfidenceClamps) {
    EXPECT_EQ(calibration_bucket_for(0.20), 40);
    EXPECT_EQ(calibration_bucket_for(0.54), 50);
    EXPECT_EQ(calibration_bucket_for(0.56), 60);
    EXPECT_EQ(calibration_bucket_for(0.85), 80);
}

TEST_F(WagerStoreTest, HistoricalPerformanceNeedsMinimumSamples) {
    store.settle(store.insert_wager(wager(Pick::OVER)), win());
    store.settle(store.insert_wager(wager(Pick::OVER)), loss());
    store.insert_wager(wager(Pick::OVER));  // open, not counted

    auto h = store.historical_performance("OVER%");
    EXPECT_FALSE(h.found);
    EXPECT_EQ(h.samples, 2);

    store.settle(store.insert_wager(wager(Pick::OVER)), win());
    h = store.historical_performance("OVER%");
    EXPECT_TRUE(h.found);
    EXPECT_EQ(h.wins, 2);
    EXPECT_NEAR(h.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(h.total_profit, 0.91 * 2 - 1.0, 1e-9);
    EXPECT_EQ(store.historical_performance("UNDER%").samples, 0);
}

// ===========================================================================
// 4. Learning rules
// ===========================================================================

TEST_F(WagerStoreTest, InsertRuleSkipsActiveDuplicate) {
    int64_t id = store.insert_rule(rule(RuleCondition::HIGH_EDGE, 0.05));
    EXPECT_GT(id, 0);
    EXPECT_EQ(store.insert_rule(rule(RuleCondition::HIGH_EDGE, 0.05)), 0);
    EXPECT_GT(store.insert_rule(rule(RuleCondition::HIGH_EDGE, 0.08)), 0);
    EXPECT_EQ(store.active_rules().size(), 2u);
}

TEST_F(WagerStoreTest, DirectionRulesKeyedByMarketAndPick) {
    LearningRule over = rule(RuleCondition::BET_DIRECTION);
    over.bet_type = BetType::TOTAL;
    over.pick = Pick::OVER;
    LearningRule under = over;
    under.pick = Pick::UNDER;
    EXPECT_GT(store.insert_rule(over), 0);
    EXPECT_GT(store.insert_rule(under), 0);
    EXPECT_EQ(store.insert_rule(over), 0);

    auto rules = store.active_rules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(*rules[0].bet_type, BetType::TOTAL);
}

TEST_F(WagerStoreTest, DeactivatedRuleIsKeptAndCanBeReplaced) {
    int64_t id = store.insert_rule(rule(RuleCondition::SUPPORTING_DEBATE));
    EXPECT_TRUE(store.deactivate_rule(id));
    EXPECT_FALSE(store.deactivate_rule(id));
    EXPECT_TRUE(store.active_rules().empty());
    ASSERT_EQ(store.all_rules().size(), 1u);
    EXPECT_FALSE(store.all_rules()[0].active);

    EXPECT_GT(store.insert_rule(rule(RuleCondition::SUPPORTING_DEBATE)), 0);
    EXPECT_EQ(store.all_rules().size(), 2u);
}

TEST_F(WagerStoreTest, TriggerCountIncrements) {
    int64_t id = store.insert_rule(rule(RuleCondition::HIGH_CONFIDENCE, 0.7));
    store.record_rule_trigger(id);
    store.record_rule_trigger(id);
    auto rules = store.active_rules();
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].trigger_count, 2);
    EXPECT_DOUBLE_EQ(rules[0].adjustment, -0.02);
    EXPECT_EQ(rules[0].thresholds_version, 1);
}

TEST_F(WagerStoreTest, RuleMatching) {
    LearningRule r = rule(RuleCondition::HIGH_EDGE, 0.05);
    WagerFacts f{BetType::TOTAL, Pick::OVER, 0.06, 0.6, DebateWinner::NEUTRAL};
    EXPECT_TRUE(rule_matches(r, f));
    f.predicted_edge = 0.05;
    EXPECT_FALSE(rule_matches(r, f));

    r = rule(RuleCondition::BET_DIRECTION);
    r.bet_type = BetType::SPREAD;
    r.pick = Pick::OVER;
    EXPECT_FALSE(rule_matches(r, f));  // wrong market
}
