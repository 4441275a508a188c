// debate_engine_test.cpp - rule catalogs, top-K trimming, structural floor,
// winner thresholds

#include <gtest/gtest.h>

#include "debate/debate_engine.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <string>

using test_helpers::build_projection;

// ===========================================================================
// Fixture
// ===========================================================================
class DebateEngineTest : public ::testing::Test {
protected:
    Context ctx = test_helpers::total_context();
    Projection proj;
    SimulationResult sim;
    EdgeResult edge;

    void SetUp() override {
        proj = build_projection(ctx);
        set_probabilities(0.60, 0.40);
    }

    void set_probabilities(double p_over, double p_under) {
        sim = SimulationResult{};
        sim.bet_type = ctx.bet_type;
        sim.n_sims = 10000;
        sim.line = ctx.line.value_or(0.0);
        sim.p_over = p_over;
        sim.p_under = p_under;
        sim.p_push = 1.0 - p_over - p_under;
        sim.std_dev = 18.0;
        edge = EdgeCalculator().evaluate(sim, ctx.price_a, ctx.price_b);
    }

    DebateInput input(Pick pick, int errors = 0) const {
        return DebateInput{ctx, proj, sim, edge, pick, errors, nullptr};
    }

    static bool has_rule(const std::vector<Argument>& args, const std::string& rule) {
        return std::any_of(args.begin(), args.end(),
                           [&](const Argument& a) { return a.rule == rule; });
    }
};

// ===========================================================================
// 1. Opposing floor
// ===========================================================================

TEST_F(DebateEngineTest, OpposingNeverEmptyUnderMaximalSupport) {
    set_probabilities(0.99, 0.01);
    auto r = DebateEngine().run(input(Pick::OVER));
    EXPECT_FALSE(r.supporting.empty());
    ASSERT_FALSE(r.opposing.empty());
    EXPECT_TRUE(std::any_of(r.opposing.begin(), r.opposing.end(),
                            [](const Argument& a) { return a.structural; }));
}

TEST_F(DebateEngineTest, StructuralReplacesWeakestWhenTrimmedOut) {
    DebateConfig cfg;
    cfg.top_k = 1;
    // Data quality (0.9) outranks every structural argument.
    auto args = DebateEngine(cfg).opposing_arguments(input(Pick::OVER, 3), {});
    ASSERT_EQ(args.size(), 1u);
    EXPECT_TRUE(args[0].structural);
}

TEST_F(DebateEngineTest, StructuralRulesFireForAnyMatchup) {
    DebateInput in = input(Pick::UNDER);
    EXPECT_TRUE(evaluate(OpposeRule::SAMPLE_SIZE, in).has_value());
    EXPECT_TRUE(evaluate(OpposeRule::REGRESSION_TO_MEAN, in).has_value());
    EXPECT_TRUE(evaluate(OpposeRule::SAMPLE_SIZE, in)->structural);
}

// ===========================================================================
// 2. Trimming and scoring
// ===========================================================================

TEST_F(DebateEngineTest, SidesTrimmedToTopKStrongestFirst) {
    set_probabilities(0.80, 0.20);
    auto r = DebateEngine().run(input(Pick::OVER));
    EXPECT_LE(r.supporting.size(), 5u);
    EXPECT_LE(r.opposing.size(), 5u);
    for (size_t i = 1; i < r.supporting.size(); ++i)
        EXPECT_GE(r.supporting[i - 1].strength, r.supporting[i].strength);
    for (const auto& a : r.supporting) {
        EXPECT_GE(a.strength, 0.0);
        EXPECT_LE(a.strength, 1.0);
    }
}

TEST_F(DebateEngineTest, NetSignalIsDifferenceOfMeans) {
    auto r = DebateEngine().run(input(Pick::OVER));
    EXPECT_NEAR(r.net_signal, r.supporting_strength - r.opposing_strength, 1e-12);
    EXPECT_NEAR(r.opposing_strength, debate_util::mean_strength(r.opposing), 1e-12);
}

TEST_F(DebateEngineTest, WinnerThresholds) {
    DebateEngine engine;
    EXPECT_EQ(engine.winner_for(0.11), DebateWinner::SUPPORTING);
    EXPECT_EQ(engine.winner_for(0.10), DebateWinner::NEUTRAL);
    EXPECT_EQ(engine.winner_for(-0.10), DebateWinner::NEUTRAL);
    EXPECT_EQ(engine.winner_for(-0.11), DebateWinner::OPPOSING);
}

TEST_F(DebateEngineTest, WeakPickLosesDebate) {
    set_probabilities(0.40, 0.60);
    auto r = DebateEngine().run(input(Pick::OVER, 2));
    EXPECT_EQ(r.winner, DebateWinner::OPPOSING);
    EXPECT_EQ(r.summary.verdict, "Case against the wager prevails");
}

TEST_F(DebateEngineTest, DeterministicForSameInput) {
    auto a = DebateEngine().run(input(Pick::OVER));
    auto b = DebateEngine().run(input(Pick::OVER));
    EXPECT_EQ(a.transcript, b.transcript);
}

// ===========================================================================
// 3. Individual rules
// ===========================================================================

TEST_F(DebateEngineTest, PositiveEdgeOnlyWhenEdgeAboveZero) {
    EXPECT_TRUE(evaluate(SupportRule::POSITIVE_EDGE, input(Pick::OVER)).has_value());
    EXPECT_FALSE(evaluate(SupportRule::POSITIVE_EDGE, input(Pick::UNDER)).has_value());
}

TEST_F(DebateEngineTest, CounterStrongestAnswersPositiveEdge) {
    set_probabilities(0.99, 0.01);
    DebateEngine engine;
    auto support = engine.supporting_arguments(input(Pick::OVER));
    ASSERT_FALSE(support.empty());
    ASSERT_EQ(support.front().rule, "positive_edge");
    auto oppose = engine.opposing_arguments(input(Pick::OVER), support);
    EXPECT_TRUE(has_rule(oppose, "counter_strongest"));
}

TEST_F(DebateEngineTest, DataQualityRaisedForErrorsOrPartialInputs) {
    EXPECT_FALSE(evaluate(OpposeRule::DATA_QUALITY, input(Pick::OVER)).has_value());
    EXPECT_TRUE(evaluate(OpposeRule::DATA_QUALITY, input(Pick::OVER, 1)).has_value());
    ctx.partial_inputs.push_back("a:rest");
    EXPECT_TRUE(evaluate(OpposeRule::DATA_QUALITY, input(Pick::OVER)).has_value());
}

TEST_F(DebateEngineTest, TotalsOnlyRules) {
    EXPECT_TRUE(evaluate(OpposeRule::TOTALS_VOLATILITY, input(Pick::OVER)).has_value());
    ctx = test_helpers::spread_context();
    proj = build_projection(ctx);
    set_probabilities(0.55, 0.45);
    EXPECT_FALSE(evaluate(OpposeRule::TOTALS_VOLATILITY, input(Pick::SIDE)).has_value());
    EXPECT_FALSE(evaluate(SupportRule::SCORING_ENVIRONMENT, input(Pick::SIDE)).has_value());
}

TEST_F(DebateEngineTest, HomeVenueBacksHomeSideOnly) {
    ctx = test_helpers::spread_context();
    proj = build_projection(ctx);
    set_probabilities(0.55, 0.45);
    EXPECT_TRUE(evaluate(SupportRule::HOME_VENUE, input(Pick::SIDE)).has_value());
    EXPECT_FALSE(evaluate(SupportRule::HOME_VENUE, input(Pick::OPPONENT)).has_value());
}

TEST_F(DebateEngineTest, RecentFormAndOpponentFormAreMirrored) {
    ctx = test_helpers::spread_context();
    proj = build_projection(ctx);
    set_probabilities(0.55, 0.45);
    // BOS margin +5 over recent windows; MIA level.
    EXPECT_TRUE(evaluate(SupportRule::RECENT_FORM, input(Pick::SIDE)).has_value());
    EXPECT_TRUE(evaluate(OpposeRule::OPPONENT_FORM, input(Pick::OPPONENT)).has_value());
    EXPECT_FALSE(evaluate(OpposeRule::OPPONENT_FORM, input(Pick::SIDE)).has_value());
}

TEST_F(DebateEngineTest, ThinMarginUsesProjectionCushion) {
    // Projection about 232.5 against 230: cushion under five points.
    ctx.line = 230.0;
    EXPECT_TRUE(evaluate(OpposeRule::THIN_MARGIN, input(Pick::OVER)).has_value());
    ctx.line = 220.5;
    EXPECT_FALSE(evaluate(OpposeRule::THIN_MARGIN, input(Pick::OVER)).has_value());
}

TEST_F(DebateEngineTest, PropRules) {
    ctx = test_helpers::prop_context();
    ctx.defensive_factor = 1.10;
    proj = build_projection(ctx);
    set_probabilities(0.62, 0.38);
    DebateInput in = input(Pick::OVER);
    EXPECT_TRUE(evaluate(SupportRule::FAVORABLE_MATCHUP, in).has_value());
    EXPECT_TRUE(evaluate(SupportRule::MINUTES_SECURE, in).has_value());
    EXPECT_TRUE(evaluate(OpposeRule::MINUTES_VARIANCE, in).has_value());
    EXPECT_FALSE(evaluate(OpposeRule::UNFAVORABLE_MATCHUP, in).has_value());
    EXPECT_TRUE(evaluate(OpposeRule::UNFAVORABLE_MATCHUP, input(Pick::UNDER)).has_value());
}

// ===========================================================================
// 4. Transcript
// ===========================================================================

TEST_F(DebateEngineTest, TranscriptListsBothSidesAndNet) {
    auto r = DebateEngine().run(input(Pick::OVER));
    EXPECT_NE(r.transcript.find("SUPPORTING ("), std::string::npos);
    EXPECT_NE(r.transcript.find("OPPOSING ("), std::string::npos);
    EXPECT_NE(r.transcript.find("NET "), std::string::npos);
    EXPECT_STREQ(category_str(ArgumentCategory::MARKET_EFFICIENCY), "market_efficiency");
}
