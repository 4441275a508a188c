#pragma once

#include "context/context.hpp"
#include "edge/edge_calculator.hpp"
#include "projection/projection_builder.hpp"
#include "simulation/simulation_kernel.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Argument - one typed claim for or against the wager
// ---------------------------------------------------------------------------
enum class Stance { SUPPORTING, OPPOSING };

enum class ArgumentCategory { STATISTICAL, SITUATIONAL, MARKET_EFFICIENCY, METHODOLOGY };

inline const char* stance_str(Stance s) {
    return s == Stance::SUPPORTING ? "SUPPORTING" : "OPPOSING";
}

inline const char* category_str(ArgumentCategory c) {
    switch (c) {
        case ArgumentCategory::STATISTICAL:       return "statistical";
        case ArgumentCategory::SITUATIONAL:       return "situational";
        case ArgumentCategory::MARKET_EFFICIENCY: return "market_efficiency";
        case ArgumentCategory::METHODOLOGY:       return "methodology";
    }
    return "unknown";
}

struct Argument {
    Stance stance = Stance::SUPPORTING;
    std::string rule;
    ArgumentCategory category = ArgumentCategory::STATISTICAL;
    double strength = 0.0;  // [0, 1]
    bool structural = false;
    std::string rationale;
    std::string evidence;
};

// ---------------------------------------------------------------------------
// Rule catalogs. Every rule is a pure function of DebateInput and emits at
// most one Argument.
// ---------------------------------------------------------------------------
enum class SupportRule {
    POSITIVE_EDGE,
    WIN_PROBABILITY,
    HOME_VENUE,
    RECENT_FORM,
    KELLY_SIZING,
    PROJECTION_MARGIN,
    EFFICIENCY_GAP,
    REST_ADVANTAGE,
    OPPONENT_FATIGUE,
    SCORING_ENVIRONMENT,
    PACE_ENVIRONMENT,
    DEFENSIVE_MATCHUP,
    FAVORABLE_MATCHUP,
    MINUTES_SECURE,
};

enum class OpposeRule {
    SAMPLE_SIZE,
    REGRESSION_TO_MEAN,
    MARKET_EFFICIENCY,
    OPPONENT_FORM,
    DATA_QUALITY,
    THIN_PROBABILITY,
    SCHEDULE_FATIGUE,
    TOTALS_VOLATILITY,
    THIN_MARGIN,
    SCORING_COUNTER,
    GAME_SCRIPT,
    MINUTES_VARIANCE,
    UNFAVORABLE_MATCHUP,
    COUNTER_STRONGEST,
};

constexpr std::array<SupportRule, 14> ALL_SUPPORT_RULES = {
    SupportRule::POSITIVE_EDGE, SupportRule::WIN_PROBABILITY, SupportRule::HOME_VENUE,
    SupportRule::RECENT_FORM, SupportRule::KELLY_SIZING, SupportRule::PROJECTION_MARGIN,
    SupportRule::EFFICIENCY_GAP, SupportRule::REST_ADVANTAGE, SupportRule::OPPONENT_FATIGUE,
    SupportRule::SCORING_ENVIRONMENT, SupportRule::PACE_ENVIRONMENT,
    SupportRule::DEFENSIVE_MATCHUP, SupportRule::FAVORABLE_MATCHUP, SupportRule::MINUTES_SECURE};

constexpr std::array<OpposeRule, 14> ALL_OPPOSE_RULES = {
    OpposeRule::SAMPLE_SIZE, OpposeRule::REGRESSION_TO_MEAN, OpposeRule::MARKET_EFFICIENCY,
    OpposeRule::OPPONENT_FORM, OpposeRule::DATA_QUALITY, OpposeRule::THIN_PROBABILITY,
    OpposeRule::SCHEDULE_FATIGUE, OpposeRule::TOTALS_VOLATILITY, OpposeRule::THIN_MARGIN,
    OpposeRule::SCORING_COUNTER, OpposeRule::GAME_SCRIPT, OpposeRule::MINUTES_VARIANCE,
    OpposeRule::UNFAVORABLE_MATCHUP, OpposeRule::COUNTER_STRONGEST};

inline const char* support_rule_str(SupportRule r) {
    switch (r) {
        case SupportRule::POSITIVE_EDGE:       return "positive_edge";
        case SupportRule::WIN_PROBABILITY:     return "win_probability";
        case SupportRule::HOME_VENUE:          return "home_venue";
        case SupportRule::RECENT_FORM:         return "recent_form";
        case SupportRule::KELLY_SIZING:        return "kelly_sizing";
        case SupportRule::PROJECTION_MARGIN:   return "projection_margin";
        case SupportRule::EFFICIENCY_GAP:      return "efficiency_gap";
        case SupportRule::REST_ADVANTAGE:      return "rest_advantage";
        case SupportRule::OPPONENT_FATIGUE:    return "opponent_fatigue";
        case SupportRule::SCORING_ENVIRONMENT: return "scoring_environment";
        case SupportRule::PACE_ENVIRONMENT:    return "pace_environment";
        case SupportRule::DEFENSIVE_MATCHUP:   return "defensive_matchup";
        case SupportRule::FAVORABLE_MATCHUP:   return "favorable_matchup";
        case SupportRule::MINUTES_SECURE:      return "minutes_secure";
    }
    return "unknown";
}

inline const char* oppose_rule_str(OpposeRule r) {
    switch (r) {
        case OpposeRule::SAMPLE_SIZE:         return "sample_size";
        case OpposeRule::REGRESSION_TO_MEAN:  return "regression_to_mean";
        case OpposeRule::MARKET_EFFICIENCY:   return "market_efficiency";
        case OpposeRule::OPPONENT_FORM:       return "opponent_form";
        case OpposeRule::DATA_QUALITY:        return "data_quality";
        case OpposeRule::THIN_PROBABILITY:    return "thin_probability";
        case OpposeRule::SCHEDULE_FATIGUE:    return "schedule_fatigue";
        case OpposeRule::TOTALS_VOLATILITY:   return "totals_volatility";
        case OpposeRule::THIN_MARGIN:         return "thin_margin";
        case OpposeRule::SCORING_COUNTER:     return "scoring_counter";
        case OpposeRule::GAME_SCRIPT:         return "game_script";
        case OpposeRule::MINUTES_VARIANCE:    return "minutes_variance";
        case OpposeRule::UNFAVORABLE_MATCHUP: return "unfavorable_matchup";
        case OpposeRule::COUNTER_STRONGEST:   return "counter_strongest";
    }
    return "unknown";
}

// Sample size, regression to the mean and market efficiency hold for any
// matchup.
inline bool is_structural(OpposeRule r) {
    return r == OpposeRule::SAMPLE_SIZE || r == OpposeRule::REGRESSION_TO_MEAN
        || r == OpposeRule::MARKET_EFFICIENCY;
}

// ---------------------------------------------------------------------------
// RuleThresholds - neutral baselines the rules measure distance from
// ---------------------------------------------------------------------------
struct RuleThresholds {
    double min_win_probability = 0.55;
    double form_margin = 3.0;
    double min_kelly = 0.01;
    double efficiency_gap = 3.0;
    double high_scoring_total = 230.0;
    double low_scoring_total = 220.0;
    double counter_scoring_total = 225.0;
    double league_pace = 99.0;
    double porous_defense = 115.0;
    double stingy_defense = 108.0;
    double streak_ratio = 0.10;
    double matchup_factor = 0.05;
    double secure_minutes = 32.0;
    double market_efficient_edge = 0.05;
    double min_cover_probability = 0.60;
    double thin_total_margin = 5.0;
    double thin_spread_margin = 3.0;
    double thin_prop_fraction = 0.10;
};

// ---------------------------------------------------------------------------
// DebateInput - everything a rule may look at, oriented to one pick
// ---------------------------------------------------------------------------
struct DebateInput {
    const Context& ctx;
    const Projection& proj;
    const SimulationResult& sim;
    const EdgeResult& edge;
    Pick pick;
    int error_count = 0;
    const std::vector<Argument>* supporting = nullptr;  // set before opposing rules run

    bool team_market() const {
        return ctx.bet_type == BetType::SPREAD || ctx.bet_type == BetType::MONEYLINE;
    }
    bool over() const { return pick == Pick::OVER; }
    const SideEdge& side_edge() const { return edge.side(pick); }

    // For team markets, the side the pick backs and its opponent.
    const SideContext& ours() const { return pick == Pick::OPPONENT ? ctx.side_b : ctx.side_a; }
    const SideContext& theirs() const { return pick == Pick::OPPONENT ? ctx.side_a : ctx.side_b; }

    // Projected cushion in favour of the pick, in points or stat units.
    double projection_margin() const {
        double line = ctx.line.value_or(0.0);
        switch (ctx.bet_type) {
            case BetType::TOTAL:
            case BetType::PLAYER_PROP:
                return over() ? proj.point_estimate - line : line - proj.point_estimate;
            case BetType::SPREAD: {
                double cover = proj.point_estimate + line;
                return pick == Pick::OPPONENT ? -cover : cover;
            }
            case BetType::MONEYLINE:
                return pick == Pick::OPPONENT ? -proj.point_estimate : proj.point_estimate;
        }
        return 0.0;
    }
};

namespace debate_util {

inline std::string num(double v, int precision = 1) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

inline std::string pct(double p) { return num(p * 100.0, 1) + "%"; }

inline double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

// Most recent non-empty window, preferring L10.
inline const WindowAggregate* recent(const SideContext& s) {
    for (Window w : {Window::LAST_10, Window::LAST_5, Window::LAST_15, Window::SEASON}) {
        const auto& agg = s.window(w);
        if (agg && agg->games > 0) return &*agg;
    }
    return nullptr;
}

inline Argument make(Stance stance, std::string rule, ArgumentCategory cat, double strength,
                     std::string rationale, std::string evidence, bool structural = false) {
    Argument a;
    a.stance = stance;
    a.rule = std::move(rule);
    a.category = cat;
    a.strength = clamp01(strength);
    a.structural = structural;
    a.rationale = std::move(rationale);
    a.evidence = std::move(evidence);
    return a;
}

}  // namespace debate_util

// ---------------------------------------------------------------------------
// Supporting catalog
// ---------------------------------------------------------------------------
inline std::optional<Argument> evaluate(SupportRule rule, const DebateInput& in,
                                        const RuleThresholds& t = {}) {
    using namespace debate_util;
    const char* name = support_rule_str(rule);
    auto arg = [&](ArgumentCategory cat, double strength, std::string why, std::string ev) {
        return std::optional<Argument>(
            make(Stance::SUPPORTING, name, cat, strength, std::move(why), std::move(ev)));
    };
    const auto& se = in.side_edge();
    const BetType bt = in.ctx.bet_type;

    switch (rule) {
        case SupportRule::POSITIVE_EDGE:
            if (se.edge <= 0.0) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, se.edge * 10.0,
                       "Model probability exceeds the market's implied probability.",
                       "edge " + pct(se.edge) + " at " + num(se.decimal_odds, 2));

        case SupportRule::WIN_PROBABILITY:
            if (se.model_probability <= t.min_win_probability) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, (se.model_probability - 0.5) * 2.0,
                       "Simulation favours the pick by a clear margin.",
                       "P(win) " + pct(se.model_probability) + " over "
                           + std::to_string(in.sim.n_sims) + " simulations");

        case SupportRule::HOME_VENUE: {
            if (bt == BetType::TOTAL) return std::nullopt;
            if (bt == BetType::PLAYER_PROP) {
                if (!in.ctx.side_a.is_home) return std::nullopt;
                return arg(ArgumentCategory::SITUATIONAL, 0.55,
                           "Player is at home.", in.ctx.side_a.entity.id + " home game");
            }
            if (!in.ours().is_home) return std::nullopt;
            return arg(ArgumentCategory::SITUATIONAL, 0.6, "Backed side has home court.",
                       in.ours().entity.id + " at home");
        }

        case SupportRule::RECENT_FORM: {
            if (bt == BetType::PLAYER_PROP) {
                const auto& l5 = in.ctx.side_a.window(Window::LAST_5);
                const auto& season = in.ctx.side_a.window(Window::SEASON);
                if (!l5 || !season || season->stat_value <= 0.0) return std::nullopt;
                double ratio = (l5->stat_value - season->stat_value) / season->stat_value;
                if (in.over() && ratio > t.streak_ratio)
                    return arg(ArgumentCategory::STATISTICAL, std::min(ratio * 2.0, 0.9),
                               "Player is running hot over the last five games.",
                               "L5 " + num(l5->stat_value) + " vs season " + num(season->stat_value));
                if (!in.over() && -ratio > t.streak_ratio)
                    return arg(ArgumentCategory::STATISTICAL, std::min(-ratio * 2.0, 0.9),
                               "Player is running cold over the last five games.",
                               "L5 " + num(l5->stat_value) + " vs season " + num(season->stat_value));
                return std::nullopt;
            }
            if (!in.team_market()) return std::nullopt;
            const auto* r = recent(in.ours());
            if (!r || r->avg_margin <= t.form_margin) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, r->avg_margin / 10.0,
                       "Backed side has been winning comfortably.",
                       in.ours().entity.id + " " + window_str(r->window) + " margin +"
                           + num(r->avg_margin));
        }

        case SupportRule::KELLY_SIZING:
            if (se.kelly_fraction <= t.min_kelly) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, se.kelly_fraction * 10.0,
                       "Kelly sizing supports a meaningful stake.",
                       "fractional Kelly " + pct(se.kelly_fraction));

        case SupportRule::PROJECTION_MARGIN: {
            if (!in.ctx.line) return std::nullopt;
            double m = in.projection_margin();
            if (m <= 0.0) return std::nullopt;
            double scale = bt == BetType::TOTAL ? 10.0 : 5.0;
            return arg(ArgumentCategory::STATISTICAL, m / scale,
                       "Projection clears the line in the pick's direction.",
                       "projection " + num(in.proj.point_estimate) + " vs line "
                           + num(*in.ctx.line) + " (cushion " + num(m) + ")");
        }

        case SupportRule::EFFICIENCY_GAP: {
            if (!in.team_market()) return std::nullopt;
            const auto* a = recent(in.ours());
            const auto* b = recent(in.theirs());
            if (!a || !b || !a->has_efficiency() || !b->has_efficiency()) return std::nullopt;
            double gap = (a->ortg - a->drtg) - (b->ortg - b->drtg);
            if (gap <= t.efficiency_gap) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, gap / 10.0,
                       "Backed side holds a net-rating advantage.",
                       "net rating gap " + num(gap));
        }

        case SupportRule::REST_ADVANTAGE: {
            if (!in.team_market()) return std::nullopt;
            const auto& ra = in.ours().rest;
            const auto& rb = in.theirs().rest;
            if (!ra || !rb || ra->rest_days <= rb->rest_days + 1) return std::nullopt;
            return arg(ArgumentCategory::SITUATIONAL, 0.7, "Backed side is better rested.",
                       std::to_string(ra->rest_days) + "d vs " + std::to_string(rb->rest_days) + "d rest");
        }

        case SupportRule::OPPONENT_FATIGUE: {
            if (!in.team_market()) return std::nullopt;
            const auto& rb = in.theirs().rest;
            if (!rb) return std::nullopt;
            double fb = rb->fatigue_score();
            double fa = in.ours().rest ? in.ours().rest->fatigue_score() : 0.0;
            if (fb < 2.0 || fb <= fa) return std::nullopt;
            return arg(ArgumentCategory::SITUATIONAL, std::min(0.5 + fb / 10.0, 0.8),
                       "Opponent is deep in a dense stretch of schedule.",
                       std::to_string(rb->games_last_7) + " games in 7 days");
        }

        case SupportRule::SCORING_ENVIRONMENT: {
            if (bt != BetType::TOTAL) return std::nullopt;
            const auto* a = recent(in.ctx.side_a);
            const auto* b = recent(in.ctx.side_b);
            if (!a || !b || a->ppg <= 0.0 || b->ppg <= 0.0) return std::nullopt;
            double combined = a->ppg + b->ppg;
            if (in.over() && combined > t.high_scoring_total)
                return arg(ArgumentCategory::STATISTICAL,
                           std::min((combined - t.low_scoring_total) / 20.0, 0.9),
                           "Both sides have been scoring freely.", "combined " + num(combined));
            if (!in.over() && combined < t.low_scoring_total)
                return arg(ArgumentCategory::STATISTICAL,
                           std::min((t.low_scoring_total - combined) / 20.0, 0.9),
                           "Both sides have been held down.", "combined " + num(combined));
            return std::nullopt;
        }

        case SupportRule::PACE_ENVIRONMENT: {
            if (bt != BetType::TOTAL) return std::nullopt;
            const auto* a = recent(in.ctx.side_a);
            const auto* b = recent(in.ctx.side_b);
            if (!a || !b || a->pace <= 0.0 || b->pace <= 0.0) return std::nullopt;
            double diff = (a->pace + b->pace) / 2.0 - t.league_pace;
            if (in.over() ? diff <= 0.0 : diff >= 0.0) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, std::min(std::abs(diff) / 3.0, 0.8),
                       in.over() ? "Matchup pace runs above league average."
                                 : "Matchup pace runs below league average.",
                       "pace " + num(t.league_pace + diff) + " vs league " + num(t.league_pace));
        }

        case SupportRule::DEFENSIVE_MATCHUP: {
            if (bt != BetType::TOTAL) return std::nullopt;
            const auto* a = recent(in.ctx.side_a);
            const auto* b = recent(in.ctx.side_b);
            if (!a || !b || a->opp_ppg <= 0.0 || b->opp_ppg <= 0.0) return std::nullopt;
            double allowed = (a->opp_ppg + b->opp_ppg) / 2.0;
            if (in.over() && allowed > t.porous_defense)
                return arg(ArgumentCategory::STATISTICAL, 0.7, "Both defenses are leaking points.",
                           "avg allowed " + num(allowed));
            if (!in.over() && allowed < t.stingy_defense)
                return arg(ArgumentCategory::STATISTICAL, 0.7, "Both defenses are stingy.",
                           "avg allowed " + num(allowed));
            return std::nullopt;
        }

        case SupportRule::FAVORABLE_MATCHUP: {
            if (bt != BetType::PLAYER_PROP || !in.ctx.defensive_factor) return std::nullopt;
            double f = *in.ctx.defensive_factor;
            if (in.over() && f > 1.0 + t.matchup_factor)
                return arg(ArgumentCategory::SITUATIONAL, std::min((f - 1.0) * 5.0, 0.85),
                           "Opponent concedes this stat above league rate.", "factor " + num(f, 2));
            if (!in.over() && f < 1.0 - t.matchup_factor)
                return arg(ArgumentCategory::SITUATIONAL, std::min((1.0 - f) * 5.0, 0.85),
                           "Opponent suppresses this stat.", "factor " + num(f, 2));
            return std::nullopt;
        }

        case SupportRule::MINUTES_SECURE:
            if (bt != BetType::PLAYER_PROP || !in.over() || in.proj.minutes_mean < t.secure_minutes)
                return std::nullopt;
            return arg(ArgumentCategory::SITUATIONAL, 0.65, "Heavy minutes load secures volume.",
                       num(in.proj.minutes_mean) + " projected minutes");
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Opposing catalog
// ---------------------------------------------------------------------------
inline std::optional<Argument> evaluate(OpposeRule rule, const DebateInput& in,
                                        const RuleThresholds& t = {}) {
    using namespace debate_util;
    const char* name = oppose_rule_str(rule);
    auto arg = [&](ArgumentCategory cat, double strength, std::string why, std::string ev) {
        return std::optional<Argument>(make(Stance::OPPOSING, name, cat, strength, std::move(why),
                                            std::move(ev), is_structural(rule)));
    };
    const auto& se = in.side_edge();
    const BetType bt = in.ctx.bet_type;

    switch (rule) {
        case OpposeRule::SAMPLE_SIZE:
            return arg(ArgumentCategory::METHODOLOGY, 0.7,
                       "Recent-window samples are small; variance dominates.",
                       std::to_string(in.proj.sample_games) + " games behind the projection");

        case OpposeRule::REGRESSION_TO_MEAN:
            return arg(ArgumentCategory::STATISTICAL, 0.6,
                       "Recent performance tends to regress toward season norms.",
                       "streaks are weak predictors of future results");

        case OpposeRule::MARKET_EFFICIENCY:
            if (se.edge >= t.market_efficient_edge) return std::nullopt;
            return arg(ArgumentCategory::MARKET_EFFICIENCY, 0.8,
                       "Edge sits inside market noise; the price is likely efficient.",
                       "edge " + pct(se.edge));

        case OpposeRule::OPPONENT_FORM: {
            if (!in.team_market()) return std::nullopt;
            const auto* r = recent(in.theirs());
            if (!r || r->avg_margin <= 0.0) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, std::min(r->avg_margin / 10.0, 0.8),
                       "Opponent has been competitive.",
                       in.theirs().entity.id + " margin +" + num(r->avg_margin));
        }

        case OpposeRule::DATA_QUALITY:
            if (in.error_count == 0 && in.ctx.partial_inputs.empty()) return std::nullopt;
            return arg(ArgumentCategory::METHODOLOGY, 0.9, "Analysis ran on incomplete data.",
                       std::to_string(in.error_count) + " errors, "
                           + std::to_string(in.ctx.partial_inputs.size()) + " missing inputs");

        case OpposeRule::THIN_PROBABILITY:
            if (se.model_probability >= t.min_cover_probability) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, 0.7, "Win probability is close to a coin flip.",
                       "P(win) " + pct(se.model_probability));

        case OpposeRule::SCHEDULE_FATIGUE: {
            if (bt == BetType::PLAYER_PROP) {
                const auto& r = in.ctx.side_a.rest;
                if (!r || !r->back_to_back()) return std::nullopt;
                return arg(ArgumentCategory::SITUATIONAL, 0.7,
                           "Back-to-back nights trim individual output.",
                           in.ctx.side_a.entity.id + " on the second night");
            }
            if (!in.team_market()) return std::nullopt;
            const auto& r = in.ours().rest;
            if (!r || (!r->back_to_back() && r->fatigue_score() < 2.0)) return std::nullopt;
            return arg(ArgumentCategory::SITUATIONAL, 0.85, "Backed side is fatigued.",
                       std::to_string(r->rest_days) + "d rest, "
                           + std::to_string(r->games_last_7) + " games in 7 days");
        }

        case OpposeRule::TOTALS_VOLATILITY:
            if (bt != BetType::TOTAL) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, 0.75,
                       "Game totals carry more variance than sides.",
                       "simulated std " + num(in.sim.std_dev));

        case OpposeRule::THIN_MARGIN: {
            if (!in.ctx.line) return std::nullopt;
            double m = std::abs(in.projection_margin());
            double limit = bt == BetType::TOTAL ? t.thin_total_margin
                         : bt == BetType::PLAYER_PROP ? std::abs(*in.ctx.line) * t.thin_prop_fraction
                         : t.thin_spread_margin;
            if (m >= limit) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, 0.8,
                       "Projection sits within normal variance of the line.",
                       "cushion " + num(m) + " below " + num(limit));
        }

        case OpposeRule::SCORING_COUNTER: {
            if (bt != BetType::TOTAL) return std::nullopt;
            const auto* a = recent(in.ctx.side_a);
            const auto* b = recent(in.ctx.side_b);
            if (!a || !b || a->ppg <= 0.0 || b->ppg <= 0.0) return std::nullopt;
            double combined = a->ppg + b->ppg;
            bool against = in.over() ? combined < t.counter_scoring_total
                                     : combined > t.counter_scoring_total;
            if (!against) return std::nullopt;
            return arg(ArgumentCategory::STATISTICAL, 0.7,
                       "Recent combined scoring points the other way.", "combined " + num(combined));
        }

        case OpposeRule::GAME_SCRIPT:
            if (bt == BetType::TOTAL)
                return arg(ArgumentCategory::SITUATIONAL, 0.55,
                           in.over() ? "Blowouts slow the fourth quarter."
                                     : "Close games invite late fouling.",
                           "late-game script can swing 5-10 points");
            if (bt == BetType::PLAYER_PROP)
                return arg(ArgumentCategory::SITUATIONAL, 0.55,
                           "Lopsided game script can cut playing time.",
                           "blowout rate " + pct(in.sim.n_sims > 0
                               ? static_cast<double>(in.sim.blowout_events) / in.sim.n_sims : 0.0));
            return std::nullopt;

        case OpposeRule::MINUTES_VARIANCE:
            if (bt != BetType::PLAYER_PROP) return std::nullopt;
            return arg(ArgumentCategory::METHODOLOGY, 0.75,
                       "Minutes are the largest single risk to a prop.",
                       "minutes " + num(in.proj.minutes_mean) + " +/- " + num(in.proj.minutes_std));

        case OpposeRule::UNFAVORABLE_MATCHUP: {
            if (bt != BetType::PLAYER_PROP || !in.ctx.defensive_factor) return std::nullopt;
            double f = *in.ctx.defensive_factor;
            if (in.over() && f < 1.0 - t.matchup_factor)
                return arg(ArgumentCategory::SITUATIONAL, std::min((1.0 - f) * 5.0, 0.8),
                           "Opponent suppresses this stat.", "factor " + num(f, 2));
            if (!in.over() && f > 1.0 + t.matchup_factor)
                return arg(ArgumentCategory::SITUATIONAL, std::min((f - 1.0) * 5.0, 0.8),
                           "Opponent concedes this stat freely.", "factor " + num(f, 2));
            return std::nullopt;
        }

        case OpposeRule::COUNTER_STRONGEST: {
            if (!in.supporting || in.supporting->empty()) return std::nullopt;
            const auto& top = in.supporting->front();
            if (top.rule == support_rule_str(SupportRule::POSITIVE_EDGE))
                return arg(ArgumentCategory::METHODOLOGY, 0.75,
                           "The headline edge rests on short-window inputs.",
                           "strongest supporting point: " + top.rule);
            if (top.rule == support_rule_str(SupportRule::RECENT_FORM))
                return arg(ArgumentCategory::STATISTICAL, 0.75,
                           "Hot runs are rarely sustained.",
                           "strongest supporting point: " + top.rule);
            return std::nullopt;
        }
    }
    return std::nullopt;
}
