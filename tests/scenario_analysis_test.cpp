// scenario_analysis_test.cpp - scenario grid robustness and sensitivities

#include <gtest/gtest.h>

#include "simulation/scenario_analysis.hpp"
#include "test_helpers.hpp"

#include <string>

using test_helpers::build_projection;
using test_helpers::total_context;

// ===========================================================================
// Fixture
// ===========================================================================
class ScenarioAnalysisTest : public ::testing::Test {
protected:
    SimulationConfig base;
    ScenarioConfig sc;
    Projection proj;

    void SetUp() override {
        sc.n_sims = 4000;
        sc.seed = 42;
        proj = build_projection(total_context());
    }
};

// ===========================================================================
// 1. Scenario grid
// ===========================================================================

TEST_F(ScenarioAnalysisTest, RunsEveryDefaultScenario) {
    auto report = ScenarioAnalyzer(base, sc).run(proj, 220.5);
    ASSERT_EQ(report.outcomes.size(), default_scenarios().size());
    EXPECT_EQ(report.outcomes.front().name, "base");
    for (const auto& o : report.outcomes)
        EXPECT_NEAR(o.p_over + o.p_under + o.p_push, 1.0, 1e-6) << o.name;
}

TEST_F(ScenarioAnalysisTest, PaceScenariosMoveTheMean) {
    auto report = ScenarioAnalyzer(base, sc).run(proj, 220.5);
    double high = 0.0;
    double low = 0.0;
    for (const auto& o : report.outcomes) {
        if (o.name == "high_pace") high = o.mean;
        if (o.name == "low_pace") low = o.mean;
    }
    EXPECT_NEAR(high - low, 12.0, 1.0);
}

TEST_F(ScenarioAnalysisTest, SpreadIsMaxMinusMin) {
    auto report = ScenarioAnalyzer(base, sc).run(proj, 220.5);
    EXPECT_NEAR(report.p_under_spread, report.p_under_max - report.p_under_min, 1e-12);
    EXPECT_LE(report.p_under_min, report.p_under_max);
}

TEST_F(ScenarioAnalysisTest, StabilityUsesConfiguredSpread) {
    sc.stable_spread = 1.0;
    EXPECT_TRUE(ScenarioAnalyzer(base, sc).run(proj, 220.5).stable);
    sc.stable_spread = 0.0;
    EXPECT_FALSE(ScenarioAnalyzer(base, sc).run(proj, 220.5).stable);
}

TEST_F(ScenarioAnalysisTest, DeterministicForFixedSeed) {
    auto a = ScenarioAnalyzer(base, sc).run(proj, 220.5);
    auto b = ScenarioAnalyzer(base, sc).run(proj, 220.5);
    ASSERT_EQ(a.outcomes.size(), b.outcomes.size());
    for (size_t i = 0; i < a.outcomes.size(); ++i)
        EXPECT_EQ(a.outcomes[i].p_under, b.outcomes[i].p_under);
}

TEST_F(ScenarioAnalysisTest, CustomScenarioList) {
    std::vector<Scenario> only = {{"wide", 0.0, 2.0, std::nullopt, std::nullopt, false}};
    auto report = ScenarioAnalyzer(base, sc).run(proj, 220.5, only);
    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].name, "wide");
    EXPECT_DOUBLE_EQ(report.p_under_spread, 0.0);
}

// ===========================================================================
// 2. Sensitivity
// ===========================================================================

TEST_F(ScenarioAnalysisTest, RaisingMeansLowersUnderProbability) {
    base.n_sims = 20000;
    auto s = sensitivity_analysis(proj, 220.5, base);
    EXPECT_LT(s.d_p_under_d_mean_a, 0.0);
    EXPECT_LT(s.d_p_under_d_mean_b, 0.0);
}

TEST_F(ScenarioAnalysisTest, PropSensitivityIgnoresSideB) {
    base.n_sims = 5000;
    Projection prop = build_projection(test_helpers::prop_context());
    auto s = sensitivity_analysis(prop, 26.5, base);
    EXPECT_DOUBLE_EQ(s.d_p_under_d_mean_b, 0.0);
    EXPECT_DOUBLE_EQ(s.d_p_under_d_std_b, 0.0);
    EXPECT_LT(s.d_p_under_d_mean_a, 0.0);
}
