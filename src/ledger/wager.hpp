#pragma once

#include "context/context.hpp"
#include "debate/debate_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Outcome
// ---------------------------------------------------------------------------
enum class Outcome { WIN, LOSS, PUSH };

inline const char* outcome_str(Outcome o) {
    switch (o) {
        case Outcome::WIN:  return "WIN";
        case Outcome::LOSS: return "LOSS";
        case Outcome::PUSH: return "PUSH";
    }
    return "UNKNOWN";
}

inline Outcome parse_outcome(const std::string& s) {
    if (s == "WIN") return Outcome::WIN;
    if (s == "LOSS") return Outcome::LOSS;
    if (s == "PUSH") return Outcome::PUSH;
    throw std::invalid_argument("unknown outcome: " + s);
}

// ---------------------------------------------------------------------------
// Wager - persisted decision. outcome stays empty until settlement sets it
// once; rows are never deleted.
//
// line is quoted for the backed selection: for spreads it is the handicap
// of subject_id (the backed team); for totals and props it is the total.
// ---------------------------------------------------------------------------
struct Wager {
    int64_t id = 0;
    std::string event_id;
    std::string event_date;
    BetType bet_type = BetType::TOTAL;
    Pick pick = Pick::OVER;
    std::string selection;   // display label, e.g. "OVER 220.5"
    std::string subject_id;  // backed team, or the player for props
    std::string stat_type;
    double line = 0.0;
    double decimal_odds = 1.91;
    double confidence = 0.5;
    double predicted_edge = 0.0;
    double stake = 0.0;
    DebateWinner debate_winner = DebateWinner::NEUTRAL;
    std::string depth = "standard";
    std::string reasoning_trace;  // JSON

    std::optional<Outcome> outcome;
    std::optional<double> realized_value;
    std::optional<double> realized_margin;
    std::optional<double> profit;
    std::string created_at;
    std::string settled_at;

    bool settled() const { return outcome.has_value(); }
};

// ---------------------------------------------------------------------------
// CalibrationBucket - running record for one confidence band
// ---------------------------------------------------------------------------
struct CalibrationBucket {
    int bucket = 0;  // percent: 40, 50, 60, 70, 80
    int total = 0;
    int wins = 0;
    int losses = 0;
    int pushes = 0;
    std::optional<double> realized_win_rate;  // wins / (wins + losses)
    std::optional<double> calibration_error;  // |bucket - realized win rate|
};

constexpr int MIN_CALIBRATION_BUCKET = 40;
constexpr int MAX_CALIBRATION_BUCKET = 80;

// Nearest multiple of ten percent, clamped to the tracked range.
inline int calibration_bucket_for(double confidence) {
    int b = static_cast<int>(std::lround(confidence * 10.0)) * 10;
    return std::clamp(b, MIN_CALIBRATION_BUCKET, MAX_CALIBRATION_BUCKET);
}

// ---------------------------------------------------------------------------
// SettlementOutcome and grading
// ---------------------------------------------------------------------------
struct SettlementOutcome {
    Outcome outcome = Outcome::PUSH;
    double realized_value = 0.0;   // total, backed-side margin, or stat
    double realized_margin = 0.0;  // distance past the line in the pick's favour
    double profit = 0.0;           // per unit stake
};

inline double profit_for(Outcome o, double decimal_odds) {
    switch (o) {
        case Outcome::WIN:  return decimal_odds - 1.0;
        case Outcome::LOSS: return -1.0;
        case Outcome::PUSH: return 0.0;
    }
    return 0.0;
}

inline Outcome outcome_from_margin(double margin) {
    if (margin > 0.0) return Outcome::WIN;
    if (margin < 0.0) return Outcome::LOSS;
    return Outcome::PUSH;
}

// OVER/UNDER against a total or prop line.
inline SettlementOutcome grade_over_under(Pick pick, double realized, double line, double odds) {
    SettlementOutcome s;
    s.realized_value = realized;
    s.realized_margin = pick == Pick::UNDER ? line - realized : realized - line;
    s.outcome = outcome_from_margin(s.realized_margin);
    s.profit = profit_for(s.outcome, odds);
    return s;
}

// Backed side's margin plus its handicap. Moneylines use a zero handicap.
inline SettlementOutcome grade_cover(double backed_margin, double line, double odds) {
    SettlementOutcome s;
    s.realized_value = backed_margin;
    s.realized_margin = backed_margin + line;
    s.outcome = outcome_from_margin(s.realized_margin);
    s.profit = profit_for(s.outcome, odds);
    return s;
}

// ---------------------------------------------------------------------------
// LearningRule - induced confidence adjustment. Deactivated, never removed.
// ---------------------------------------------------------------------------
enum class RuleCondition { HIGH_EDGE, SUPPORTING_DEBATE, HIGH_CONFIDENCE, BET_DIRECTION };

inline const char* rule_condition_str(RuleCondition c) {
    switch (c) {
        case RuleCondition::HIGH_EDGE:         return "HIGH_EDGE";
        case RuleCondition::SUPPORTING_DEBATE: return "SUPPORTING_DEBATE";
        case RuleCondition::HIGH_CONFIDENCE:   return "HIGH_CONFIDENCE";
        case RuleCondition::BET_DIRECTION:     return "BET_DIRECTION";
    }
    return "UNKNOWN";
}

inline RuleCondition parse_rule_condition(const std::string& s) {
    if (s == "HIGH_EDGE") return RuleCondition::HIGH_EDGE;
    if (s == "SUPPORTING_DEBATE") return RuleCondition::SUPPORTING_DEBATE;
    if (s == "HIGH_CONFIDENCE") return RuleCondition::HIGH_CONFIDENCE;
    if (s == "BET_DIRECTION") return RuleCondition::BET_DIRECTION;
    throw std::invalid_argument("unknown rule condition: " + s);
}

struct LearningRule {
    int64_t id = 0;
    RuleCondition condition = RuleCondition::HIGH_EDGE;
    std::optional<BetType> bet_type;
    std::optional<Pick> pick;
    double threshold = 0.0;
    std::string description;
    double adjustment = 0.0;  // added to confidence
    std::string evidence;
    int trigger_count = 0;
    int sample_size = 0;
    double loss_rate = 0.0;
    int thresholds_version = 0;
    bool active = true;
    std::string created_at;
};

// Fields of a decision that rule conditions read.
struct WagerFacts {
    BetType bet_type = BetType::TOTAL;
    Pick pick = Pick::OVER;
    double predicted_edge = 0.0;
    double confidence = 0.0;
    DebateWinner debate_winner = DebateWinner::NEUTRAL;

    static WagerFacts of(const Wager& w) {
        return {w.bet_type, w.pick, w.predicted_edge, w.confidence, w.debate_winner};
    }
};

inline bool rule_matches(const LearningRule& rule, const WagerFacts& f) {
    if (rule.bet_type && *rule.bet_type != f.bet_type) return false;
    switch (rule.condition) {
        case RuleCondition::HIGH_EDGE:         return f.predicted_edge > rule.threshold;
        case RuleCondition::SUPPORTING_DEBATE: return f.debate_winner == DebateWinner::SUPPORTING;
        case RuleCondition::HIGH_CONFIDENCE:   return f.confidence >= rule.threshold;
        case RuleCondition::BET_DIRECTION:     return rule.pick && *rule.pick == f.pick;
    }
    return false;
}
