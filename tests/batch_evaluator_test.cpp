// batch_evaluator_test.cpp - parallel evaluation over a shared DataAccess and ledger

#include <gtest/gtest.h>

#include "pipeline/batch_evaluator.hpp"
#include "test_helpers.hpp"

#include <cstdint>
#include <vector>

using test_helpers::FakeDataAccess;
using test_helpers::request;

// ===========================================================================
// Fixture
// ===========================================================================
class BatchEvaluatorTest : public ::testing::Test {
protected:
    FakeDataAccess data;
    OrchestratorConfig cfg;

    void SetUp() override {
        test_helpers::populate_standard(data);
        cfg.standard_sims = 2000;
        cfg.scenarios.n_sims = 500;
    }

    static std::vector<EvaluationRequest> mixed_requests() {
        std::vector<EvaluationRequest> reqs;
        for (uint64_t seed = 1; seed <= 3; ++seed) {
            for (BetType t : {BetType::TOTAL, BetType::SPREAD, BetType::MONEYLINE,
                              BetType::PLAYER_PROP}) {
                EvaluationRequest r = request(t);
                r.seed = seed;
                reqs.push_back(r);
            }
        }
        return reqs;
    }
};

// ===========================================================================
// 1. Ordering and equivalence
// ===========================================================================

TEST_F(BatchEvaluatorTest, EmptyBatch) {
    BatchEvaluator batch(data, nullptr, cfg);
    EXPECT_TRUE(batch.run({}).empty());
}

TEST_F(BatchEvaluatorTest, ResultsInRequestOrder) {
    auto reqs = mixed_requests();
    auto results = BatchEvaluator(data, nullptr, cfg, {4}).run(reqs);
    ASSERT_EQ(results.size(), reqs.size());
    for (size_t i = 0; i < reqs.size(); ++i) {
        EXPECT_EQ(results[i].request.bet_type, reqs[i].bet_type) << i;
        EXPECT_EQ(*results[i].request.seed, *reqs[i].seed) << i;
        EXPECT_EQ(results[i].state, PipelineState::DONE) << i;
    }
}

TEST_F(BatchEvaluatorTest, ParallelMatchesSequential) {
    auto reqs = mixed_requests();
    auto parallel = BatchEvaluator(data, nullptr, cfg, {4}).run(reqs);
    Orchestrator orch(data, nullptr, cfg);
    for (size_t i = 0; i < reqs.size(); ++i) {
        auto seq = orch.evaluate(reqs[i]);
        EXPECT_EQ(parallel[i].simulation->p_over, seq.simulation->p_over) << i;
        EXPECT_EQ(parallel[i].recommendation, seq.recommendation) << i;
        EXPECT_EQ(parallel[i].confidence, seq.confidence) << i;
    }
}

TEST_F(BatchEvaluatorTest, MoreWorkersThanRequests) {
    std::vector<EvaluationRequest> reqs = {request(BetType::TOTAL)};
    auto results = BatchEvaluator(data, nullptr, cfg, {16}).run(reqs);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].state, PipelineState::DONE);
}

// ===========================================================================
// 2. Shared ledger
// ===========================================================================

TEST_F(BatchEvaluatorTest, ConcurrentWritesToOneLedger) {
    WagerStore store(":memory:");
    auto reqs = mixed_requests();
    auto results = BatchEvaluator(data, &store, cfg, {4}).run(reqs);

    size_t persisted = 0;
    for (const auto& r : results)
        if (r.wager_id) ++persisted;
    EXPECT_GT(persisted, 0u);
    EXPECT_EQ(store.recent(100).size(), persisted);
}

TEST_F(BatchEvaluatorTest, FailuresStayPerRequest) {
    auto reqs = mixed_requests();
    reqs[1].side_b = "Lakers";
    auto results = BatchEvaluator(data, nullptr, cfg, {3}).run(reqs);
    EXPECT_EQ(results[1].state, PipelineState::UNAVAILABLE);
    EXPECT_EQ(results[0].state, PipelineState::DONE);
    EXPECT_EQ(results[2].state, PipelineState::DONE);
}

TEST_F(BatchEvaluatorTest, InvalidPriceDoesNotStopTheBatch) {
    auto reqs = mixed_requests();
    reqs[0].price_a = 1.0;
    std::vector<EvaluationResult> results;
    ASSERT_NO_THROW(results = BatchEvaluator(data, nullptr, cfg, {3}).run(reqs));
    EXPECT_EQ(results[0].recommendation, Recommendation::NEED_LINE);
    EXPECT_TRUE(results[0].has_issue(IssueCode::INVALID_PRICE));
    for (size_t i = 1; i < results.size(); ++i) EXPECT_EQ(results[i].state, PipelineState::DONE) << i;
}

TEST_F(BatchEvaluatorTest, InternalErrorsReportedPerRequest) {
    cfg.standard_sims = 0;
    auto reqs = mixed_requests();
    std::vector<EvaluationResult> results;
    ASSERT_NO_THROW(results = BatchEvaluator(data, nullptr, cfg, {4}).run(reqs));
    ASSERT_EQ(results.size(), reqs.size());
    for (const auto& r : results) EXPECT_TRUE(r.has_issue(IssueCode::EVALUATION_FAILED));
}
