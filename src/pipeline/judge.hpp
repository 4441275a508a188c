#pragma once

#include "debate/debate_engine.hpp"
#include "edge/edge_calculator.hpp"
#include "ledger/wager.hpp"
#include "pipeline/evaluation.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// JudgeConfig
// ---------------------------------------------------------------------------
struct JudgeConfig {
    double base_confidence = 0.5;
    double fresh_bonus = 0.15;
    double partial_bonus = 0.05;

    double strong_edge = 0.05;
    double strong_edge_bonus = 0.15;
    double edge = 0.02;
    double edge_bonus = 0.10;
    double negative_edge = -0.02;
    double negative_edge_penalty = -0.10;

    double high_probability = 0.65;
    double high_probability_bonus = 0.05;
    double low_probability = 0.40;
    double low_probability_penalty = -0.05;

    double supporting_debate_bonus = 0.05;
    double opposing_debate_penalty = -0.10;

    double per_partial_input = -0.03;
    double per_error = -0.02;
    double insufficient_sample_penalty = -0.05;

    double min_confidence = 0.10;
    double max_confidence = 0.85;

    // Recommendation gates
    double pass_against_debate_edge = 0.05;  // opposing winner below this edge -> PASS
    double bet_edge = 0.03;
    double bet_confidence = 0.60;
    double lean_edge = 0.01;
    double lean_stake_fraction = 0.5;
};

// Everything the judge reads from one run.
struct JudgeInput {
    DataQuality quality = DataQuality::FRESH;
    int partial_inputs = 0;
    int errors = 0;
    bool insufficient_sample = false;
    BetType bet_type = BetType::TOTAL;
    Pick pick = Pick::OVER;
    SideEdge side;
    DebateWinner debate_winner = DebateWinner::NEUTRAL;
};

struct Verdict {
    Recommendation recommendation = Recommendation::PASS;
    double confidence = 0.0;
    double stake = 0.0;
    std::vector<std::string> factors;  // "label:+0.15"
    std::vector<int64_t> triggered_rules;
};

// ---------------------------------------------------------------------------
// Judge - turns edge, debate and data quality into confidence and a
// recommendation. Pure; rule trigger counts are recorded by the caller.
// ---------------------------------------------------------------------------
class Judge {
public:
    explicit Judge(const JudgeConfig& cfg = {}) : cfg_(cfg) {}

    const JudgeConfig& config() const { return cfg_; }

    double confidence(const JudgeInput& in, const std::vector<LearningRule>& rules,
                      Verdict* v = nullptr) const {
        std::vector<std::string> factors;
        double c = cfg_.base_confidence;
        auto apply = [&](const std::string& label, double delta) {
            if (delta == 0.0) return;
            c += delta;
            std::ostringstream ss;
            ss << label << ":" << (delta > 0.0 ? "+" : "") << delta;
            factors.push_back(ss.str());
        };

        if (in.quality == DataQuality::FRESH) apply("fresh_data", cfg_.fresh_bonus);
        else if (in.quality == DataQuality::PARTIAL) apply("partial_data", cfg_.partial_bonus);

        double e = in.side.edge;
        if (e >= cfg_.strong_edge) apply("strong_edge", cfg_.strong_edge_bonus);
        else if (e >= cfg_.edge) apply("edge", cfg_.edge_bonus);
        else if (e <= cfg_.negative_edge) apply("negative_edge", cfg_.negative_edge_penalty);

        double p = in.side.model_probability;
        if (p >= cfg_.high_probability) apply("high_probability", cfg_.high_probability_bonus);
        else if (p <= cfg_.low_probability) apply("low_probability", cfg_.low_probability_penalty);

        if (in.debate_winner == DebateWinner::SUPPORTING)
            apply("debate_supporting", cfg_.supporting_debate_bonus);
        else if (in.debate_winner == DebateWinner::OPPOSING)
            apply("debate_opposing", cfg_.opposing_debate_penalty);

        apply("partial_inputs", cfg_.per_partial_input * in.partial_inputs);
        apply("errors", cfg_.per_error * in.errors);
        if (in.insufficient_sample) apply("insufficient_sample", cfg_.insufficient_sample_penalty);

        // Rules see the confidence before any rule adjusts it.
        WagerFacts facts{in.bet_type, in.pick, e, c, in.debate_winner};
        std::vector<int64_t> triggered;
        double rule_total = 0.0;
        for (const auto& r : rules) {
            if (!r.active || !rule_matches(r, facts)) continue;
            rule_total += r.adjustment;
            triggered.push_back(r.id);
        }
        apply("learning_rules", rule_total);

        c = std::clamp(c, cfg_.min_confidence, cfg_.max_confidence);
        if (v) {
            v->factors = std::move(factors);
            v->triggered_rules = std::move(triggered);
        }
        return c;
    }

    Verdict decide(const JudgeInput& in, Tier tier,
                   const std::vector<LearningRule>& rules = {}) const {
        Verdict v;
        v.confidence = confidence(in, rules, &v);
        v.recommendation = recommendation(in, tier, v.confidence);
        if (v.recommendation == Recommendation::BET)
            v.stake = in.side.kelly_fraction;
        else if (v.recommendation == Recommendation::LEAN)
            v.stake = in.side.kelly_fraction * cfg_.lean_stake_fraction;
        return v;
    }

    Recommendation recommendation(const JudgeInput& in, Tier tier, double confidence) const {
        double e = in.side.edge;
        if (in.debate_winner == DebateWinner::OPPOSING && e < cfg_.pass_against_debate_edge)
            return Recommendation::PASS;
        if ((tier == Tier::BET || tier == Tier::STRONG_BET) && e >= cfg_.bet_edge
            && confidence >= cfg_.bet_confidence) {
            return in.debate_winner == DebateWinner::SUPPORTING ? Recommendation::BET
                                                                : Recommendation::LEAN;
        }
        if (tier != Tier::NO_BET && e >= cfg_.lean_edge) return Recommendation::LEAN;
        return Recommendation::PASS;
    }

private:
    JudgeConfig cfg_;
};
