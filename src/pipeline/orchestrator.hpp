#pragma once

#include "data/data_access.hpp"
#include "debate/debate_engine.hpp"
#include "edge/edge_calculator.hpp"
#include "ledger/wager.hpp"
#include "ledger/wager_store.hpp"
#include "pipeline/context_assembler.hpp"
#include "pipeline/evaluation.hpp"
#include "pipeline/judge.hpp"
#include "pipeline/trace_io.hpp"
#include "projection/projection_builder.hpp"
#include "simulation/scenario_analysis.hpp"
#include "simulation/simulation_kernel.hpp"

#include <exception>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// OrchestratorConfig
// ---------------------------------------------------------------------------
struct OrchestratorConfig {
    int max_retries = 2;

    int quick_sims = 2000;
    int standard_sims = 10000;
    int deep_sims = 20000;
    int deep_scenario_sims = 5000;
    double sensitivity_perturbation = 0.05;  // relative step for each parameter

    AssemblerConfig assembler;
    ProjectionConfig projection;
    SimulationConfig simulation;
    ScenarioConfig scenarios;
    EdgeConfig edge;
    DebateConfig debate;
    JudgeConfig judge;
};

namespace pipeline_util {

inline std::string signed_line(double v) {
    return (v > 0.0 ? "+" : "") + debate_util::num(v, 1);
}

// Human label for the backed selection, e.g. "OVER 220.5", "BOS -4.5".
inline std::string selection_label(const Context& ctx, Pick pick) {
    double line = ctx.line.value_or(0.0);
    const Entity& backed = pick == Pick::OPPONENT ? ctx.side_b.entity : ctx.side_a.entity;
    std::string team = backed.abbreviation.empty() ? backed.id : backed.abbreviation;
    switch (ctx.bet_type) {
        case BetType::TOTAL:
            return std::string(pick_str(pick)) + " " + debate_util::num(line, 1);
        case BetType::PLAYER_PROP:
            return ctx.side_a.entity.name + " " + pick_str(pick) + " "
                 + debate_util::num(line, 1) + " " + ctx.stat_type;
        case BetType::SPREAD:
            return team + " " + signed_line(pick == Pick::OPPONENT ? -line : line);
        case BetType::MONEYLINE:
            return team + " ML";
    }
    return pick_str(pick);
}

// Line the kernel compares against when no market line exists: the
// projection itself, so the bands are still reported.
inline double neutral_line(const Projection& p) {
    switch (p.bet_type) {
        case BetType::SPREAD:    return -p.point_estimate;
        case BetType::MONEYLINE: return 0.0;
        default:                 return p.point_estimate;
    }
}

}  // namespace pipeline_util

// ---------------------------------------------------------------------------
// Orchestrator - drives one request through
//   awaiting_context -> context_fetched -> projected -> simulated -> debated -> done
// with a bounded retry loop back to awaiting_context. Always returns a
// result; DataAccess failures become issues, never exceptions.
// ---------------------------------------------------------------------------
class Orchestrator {
public:
    Orchestrator(DataAccess& data, WagerStore* store = nullptr, const OrchestratorConfig& cfg = {})
        : data_(data), store_(store), cfg_(cfg) {}

    const OrchestratorConfig& config() const { return cfg_; }

    EvaluationResult evaluate(const EvaluationRequest& req) {
        try {
            return run(req);
        } catch (const std::exception& e) {
            EvaluationResult r;
            r.request = req;
            r.path.push_back(PipelineState::UNAVAILABLE);
            r.state = PipelineState::UNAVAILABLE;
            r.issues.push_back({IssueCode::EVALUATION_FAILED, e.what()});
            return r;
        }
    }

private:
    DataAccess& data_;
    WagerStore* store_;
    OrchestratorConfig cfg_;

    EvaluationResult run(const EvaluationRequest& req) {
        EvaluationResult r;
        r.request = req;

        ContextAssembler assembler(data_, cfg_.assembler);
        Artifacts have;
        std::optional<Context> prior;
        std::set<std::string> stale;
        std::vector<std::string> invalid_prices;
        std::string unavailable_reason = "no context";

        while (true) {
            PipelineState state = route(have);
            r.path.push_back(state);

            switch (state) {
                case PipelineState::AWAITING_CONTEXT: {
                    if (r.attempts > cfg_.max_retries) {
                        finish_unavailable(r, unavailable_reason);
                        return r;
                    }
                    if (r.attempts > 0) ++r.retries;
                    ++r.attempts;
                    auto a = assembler.assemble(req, prior, stale);
                    r.errors = a.errors;
                    invalid_prices = a.invalid_prices;
                    if (!a.context) {
                        unavailable_reason = a.missing_reason;
                        prior.reset();
                        stale.clear();
                        break;
                    }
                    r.context = std::move(a.context);
                    stale = std::move(a.stale);
                    have.context = true;
                    break;
                }
                case PipelineState::CONTEXT_FETCHED: {
                    Projection p = ProjectionBuilder(cfg_.projection).build(*r.context);
                    if (p.skipped) {
                        r.projection = std::move(p);
                        finish_unavailable(r, r.projection->skip_reason);
                        return r;
                    }
                    r.projection = std::move(p);
                    have.projection = true;
                    break;
                }
                case PipelineState::PROJECTED:
                    simulate(r);
                    have.simulation = true;
                    break;
                case PipelineState::SIMULATED:
                    if (r.context->line) debate(r);
                    have.debate = true;
                    break;
                case PipelineState::DEBATED:
                    if (wants_retry(r, stale)) {
                        prior = r.context;
                        r.projection.reset();
                        r.simulation.reset();
                        r.scenarios.reset();
                        r.sensitivity.reset();
                        r.edge.reset();
                        r.debate.reset();
                        r.pick.reset();
                        have = Artifacts{};
                    } else {
                        have.reviewed = true;
                    }
                    break;
                case PipelineState::DONE:
                    for (const auto& p : invalid_prices)
                        r.issues.push_back({IssueCode::INVALID_PRICE, p + " rejected, odds must be > 1.0"});
                    finish(r);
                    return r;
                case PipelineState::UNAVAILABLE:
                    return r;
            }
        }
    }

    void simulate(EvaluationResult& r) const {
        const Context& ctx = *r.context;
        const Projection& proj = *r.projection;

        SimulationConfig sim = cfg_.simulation;
        if (r.request.seed) sim.seed = r.request.seed;
        switch (r.request.depth) {
            case Depth::QUICK:    sim.n_sims = cfg_.quick_sims; break;
            case Depth::STANDARD: sim.n_sims = cfg_.standard_sims; break;
            case Depth::DEEP:     sim.n_sims = cfg_.deep_sims; break;
        }

        double line = ctx.line ? *ctx.line : pipeline_util::neutral_line(proj);
        r.simulation = SimulationKernel(sim).run(proj, line);

        if (r.request.depth != Depth::QUICK && ctx.line) {
            ScenarioConfig sc = cfg_.scenarios;
            if (r.request.seed) sc.seed = *r.request.seed;
            if (r.request.depth == Depth::DEEP) sc.n_sims = cfg_.deep_scenario_sims;
            r.scenarios = ScenarioAnalyzer(sim, sc).run(proj, *ctx.line);

            SimulationConfig sens = sim;
            sens.n_sims = sc.n_sims;
            r.sensitivity = sensitivity_analysis(proj, *ctx.line, sens,
                                                 cfg_.sensitivity_perturbation, sc.seed);
        }
    }

    void debate(EvaluationResult& r) const {
        const Context& ctx = *r.context;
        EdgeCalculator calc(cfg_.edge);
        r.edge = calc.evaluate(*r.simulation, ctx.price_a, ctx.price_b);
        r.pick = ctx.pick ? *ctx.pick : r.edge->best_pick;

        DebateInput in{ctx, *r.projection, *r.simulation, *r.edge, *r.pick,
                       static_cast<int>(r.errors.size()), nullptr};
        r.debate = DebateEngine(cfg_.debate).run(in);
    }

    // Critique: go back for failed inputs while attempts remain.
    bool wants_retry(const EvaluationResult& r, const std::set<std::string>& stale) const {
        return r.context->quality == DataQuality::PARTIAL && !stale.empty()
            && r.attempts <= cfg_.max_retries;
    }

    void finish_unavailable(EvaluationResult& r, const std::string& reason) const {
        r.state = PipelineState::UNAVAILABLE;
        if (r.path.empty() || r.path.back() != PipelineState::UNAVAILABLE)
            r.path.push_back(PipelineState::UNAVAILABLE);
        r.quality = DataQuality::UNAVAILABLE;
        r.recommendation = Recommendation::NO_RECOMMENDATION;
        r.confidence = 0.0;
        r.stake = 0.0;
        r.issues.push_back({IssueCode::DATA_UNAVAILABLE,
                            reason + " after " + std::to_string(r.attempts) + " attempt(s)"});
    }

    void finish(EvaluationResult& r) {
        const Context& ctx = *r.context;
        r.state = PipelineState::DONE;
        r.quality = ctx.quality;

        if (ctx.quality == DataQuality::PARTIAL) {
            std::string detail;
            for (const auto& k : ctx.partial_inputs) detail += (detail.empty() ? "" : ", ") + k;
            r.issues.push_back({IssueCode::PARTIAL_CONTEXT, "missing inputs: " + detail});
        }
        if (r.projection->insufficient_sample) {
            r.issues.push_back({IssueCode::INSUFFICIENT_SAMPLE,
                                std::to_string(r.projection->sample_games) + " games, need "
                                + std::to_string(cfg_.projection.min_sample_games)});
        }
        if (!ctx.line) {
            r.issues.push_back({IssueCode::NO_LINE_PROVIDED, "no line in request or market"});
            r.recommendation = Recommendation::NEED_LINE;
            return;
        }

        std::vector<LearningRule> rules;
        if (store_) {
            try {
                rules = store_->active_rules();
            } catch (const std::exception& e) {
                r.issues.push_back({IssueCode::LEDGER_WRITE_FAILED,
                                    std::string("reading rules: ") + e.what()});
            }
        }

        JudgeInput in;
        in.quality = ctx.quality;
        in.partial_inputs = static_cast<int>(ctx.partial_inputs.size());
        in.errors = static_cast<int>(r.errors.size());
        in.insufficient_sample = r.projection->insufficient_sample;
        in.bet_type = ctx.bet_type;
        in.pick = *r.pick;
        in.side = r.edge->side(*r.pick);
        in.debate_winner = r.debate->winner;

        Verdict v = Judge(cfg_.judge).decide(in, in.side.tier, rules);
        r.recommendation = v.recommendation;
        r.confidence = v.confidence;
        r.stake = v.stake;
        r.confidence_factors = std::move(v.factors);
        r.triggered_rules = std::move(v.triggered_rules);

        if (!store_) return;
        try {
            for (int64_t id : r.triggered_rules) store_->record_rule_trigger(id);
            if (r.recommendation == Recommendation::BET || r.recommendation == Recommendation::LEAN)
                r.wager_id = store_->insert_wager(to_wager(r));
        } catch (const std::exception& e) {
            r.issues.push_back({IssueCode::LEDGER_WRITE_FAILED, e.what()});
        }
    }

    static Wager to_wager(const EvaluationResult& r) {
        const Context& ctx = *r.context;
        Pick pick = *r.pick;
        const SideEdge& side = r.edge->side(pick);
        double line = *ctx.line;

        Wager w;
        w.event_id = ctx.event.event_id;
        w.event_date = ctx.event.date;
        w.bet_type = ctx.bet_type;
        w.pick = pick;
        w.selection = pipeline_util::selection_label(ctx, pick);
        w.stat_type = ctx.stat_type;
        switch (ctx.bet_type) {
            case BetType::TOTAL:
                w.line = line;
                break;
            case BetType::PLAYER_PROP:
                w.subject_id = ctx.side_a.entity.id;
                w.line = line;
                break;
            case BetType::SPREAD:
            case BetType::MONEYLINE:
                w.subject_id = pick == Pick::OPPONENT ? ctx.side_b.entity.id : ctx.side_a.entity.id;
                w.line = ctx.bet_type == BetType::MONEYLINE ? 0.0
                       : (pick == Pick::OPPONENT ? -line : line);
                break;
        }
        w.decimal_odds = side.decimal_odds;
        w.confidence = r.confidence;
        w.predicted_edge = side.edge;
        w.stake = r.stake;
        w.debate_winner = r.debate->winner;
        w.depth = depth_str(r.request.depth);
        w.reasoning_trace = trace_io::to_json(r);
        return w;
    }
};
