#pragma once

#include "context/context.hpp"
#include "debate/debate_engine.hpp"
#include "edge/edge_calculator.hpp"
#include "projection/projection_builder.hpp"
#include "simulation/scenario_analysis.hpp"
#include "simulation/simulation_kernel.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Depth - how much simulation work one request gets
// ---------------------------------------------------------------------------
enum class Depth { QUICK, STANDARD, DEEP };

inline const char* depth_str(Depth d) {
    switch (d) {
        case Depth::QUICK:    return "quick";
        case Depth::STANDARD: return "standard";
        case Depth::DEEP:     return "deep";
    }
    return "unknown";
}

inline Depth parse_depth(const std::string& s) {
    if (s == "quick") return Depth::QUICK;
    if (s == "standard") return Depth::STANDARD;
    if (s == "deep") return Depth::DEEP;
    throw std::invalid_argument("unknown depth: " + s);
}

// ---------------------------------------------------------------------------
// EvaluationRequest
//
// side_a / side_b name two teams, or a player and the opposing team for
// props. Spread lines are quoted for side_a. price_a / price_b override the
// market's decimal prices (first outcome, second outcome).
// ---------------------------------------------------------------------------
struct EvaluationRequest {
    std::string side_a;
    std::string side_b;
    BetType bet_type = BetType::TOTAL;
    std::optional<Pick> pick;
    std::optional<double> line;
    std::string stat_type;
    std::string event_id;
    std::string date;
    Depth depth = Depth::STANDARD;
    std::optional<double> price_a;
    std::optional<double> price_b;
    std::optional<uint64_t> seed;
};

// ---------------------------------------------------------------------------
// Issue taxonomy
// ---------------------------------------------------------------------------
enum class IssueCode {
    DATA_UNAVAILABLE,
    INSUFFICIENT_SAMPLE,
    NO_LINE_PROVIDED,
    SETTLEMENT_UNRESOLVABLE,
    PARTIAL_CONTEXT,
    LEDGER_WRITE_FAILED,
    INVALID_PRICE,
    EVALUATION_FAILED,
};

inline const char* issue_code_str(IssueCode c) {
    switch (c) {
        case IssueCode::DATA_UNAVAILABLE:        return "data_unavailable";
        case IssueCode::INSUFFICIENT_SAMPLE:     return "insufficient_sample";
        case IssueCode::NO_LINE_PROVIDED:        return "no_line_provided";
        case IssueCode::SETTLEMENT_UNRESOLVABLE: return "settlement_unresolvable";
        case IssueCode::PARTIAL_CONTEXT:         return "partial_context";
        case IssueCode::LEDGER_WRITE_FAILED:     return "ledger_write_failed";
        case IssueCode::INVALID_PRICE:           return "invalid_price";
        case IssueCode::EVALUATION_FAILED:       return "evaluation_failed";
    }
    return "unknown";
}

struct Issue {
    IssueCode code = IssueCode::DATA_UNAVAILABLE;
    std::string detail;
};

// ---------------------------------------------------------------------------
// Recommendation
// ---------------------------------------------------------------------------
enum class Recommendation { NO_RECOMMENDATION, NEED_LINE, PASS, LEAN, BET };

inline const char* recommendation_str(Recommendation r) {
    switch (r) {
        case Recommendation::NO_RECOMMENDATION: return "NO_RECOMMENDATION";
        case Recommendation::NEED_LINE:         return "NEED_LINE";
        case Recommendation::PASS:              return "PASS";
        case Recommendation::LEAN:              return "LEAN";
        case Recommendation::BET:               return "BET";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Pipeline states. Each names the last artifact obtained; the orchestrator
// runs the stage that produces the next one.
// ---------------------------------------------------------------------------
enum class PipelineState {
    AWAITING_CONTEXT,
    CONTEXT_FETCHED,
    PROJECTED,
    SIMULATED,
    DEBATED,
    DONE,
    UNAVAILABLE,
};

inline const char* pipeline_state_str(PipelineState s) {
    switch (s) {
        case PipelineState::AWAITING_CONTEXT: return "awaiting_context";
        case PipelineState::CONTEXT_FETCHED:  return "context_fetched";
        case PipelineState::PROJECTED:        return "projected";
        case PipelineState::SIMULATED:        return "simulated";
        case PipelineState::DEBATED:          return "debated";
        case PipelineState::DONE:             return "done";
        case PipelineState::UNAVAILABLE:      return "unavailable";
    }
    return "unknown";
}

struct Artifacts {
    bool context = false;
    bool projection = false;
    bool simulation = false;
    bool debate = false;    // also set when the debate does not apply (no line)
    bool reviewed = false;  // critique step finished without asking for a retry
};

// Earliest missing artifact decides the state.
inline PipelineState route(const Artifacts& a) {
    if (!a.context) return PipelineState::AWAITING_CONTEXT;
    if (!a.projection) return PipelineState::CONTEXT_FETCHED;
    if (!a.simulation) return PipelineState::PROJECTED;
    if (!a.debate) return PipelineState::SIMULATED;
    if (!a.reviewed) return PipelineState::DEBATED;
    return PipelineState::DONE;
}

// ---------------------------------------------------------------------------
// EvaluationResult - always produced, whatever the terminal state
// ---------------------------------------------------------------------------
struct EvaluationResult {
    EvaluationRequest request;
    PipelineState state = PipelineState::AWAITING_CONTEXT;
    std::vector<PipelineState> path;
    int attempts = 0;  // context fetch attempts
    int retries = 0;   // critique-loop retries taken
    DataQuality quality = DataQuality::UNAVAILABLE;

    std::optional<Context> context;
    std::optional<Projection> projection;
    std::optional<SimulationResult> simulation;
    std::optional<ScenarioReport> scenarios;
    std::optional<SensitivityReport> sensitivity;
    std::optional<EdgeResult> edge;
    std::optional<DebateResult> debate;

    std::optional<Pick> pick;
    Recommendation recommendation = Recommendation::NO_RECOMMENDATION;
    double confidence = 0.0;
    double stake = 0.0;  // fraction of bankroll
    std::vector<std::string> confidence_factors;
    std::vector<int64_t> triggered_rules;

    std::vector<Issue> issues;
    std::vector<std::string> errors;  // raw DataAccess failures, last attempt
    std::optional<int64_t> wager_id;

    bool has_issue(IssueCode c) const {
        for (const auto& i : issues)
            if (i.code == c) return true;
        return false;
    }
};
