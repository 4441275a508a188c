#pragma once

#include "ledger/pattern_analysis.hpp"
#include "ledger/settlement.hpp"
#include "ledger/wager.hpp"
#include "pipeline/evaluation.hpp"

#include <cmath>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace trace_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

inline std::string quote(const std::string& s) { return "\"" + json_escape(s) + "\""; }

// Non-finite values have no JSON form.
inline std::string number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

inline std::string number(const std::optional<double>& v) { return v ? number(*v) : "null"; }

inline std::string string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ",";
        out += quote(items[i]);
    }
    return out + "]";
}

inline std::string to_json(const Context& ctx) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"event_id\":" << quote(ctx.event.event_id);
    ss << ",\"date\":" << quote(ctx.event.date);
    ss << ",\"bet_type\":" << quote(bet_type_str(ctx.bet_type));
    ss << ",\"stat_type\":" << quote(ctx.stat_type);
    ss << ",\"side_a\":" << quote(ctx.side_a.entity.id);
    ss << ",\"side_b\":" << quote(ctx.side_b.entity.id);
    ss << ",\"side_a_home\":" << (ctx.side_a.is_home ? "true" : "false");
    ss << ",\"line\":" << number(ctx.line);
    ss << ",\"price_a\":" << number(ctx.price_a);
    ss << ",\"price_b\":" << number(ctx.price_b);
    ss << ",\"sample_games_a\":" << ctx.side_a.sample_games();
    ss << ",\"sample_games_b\":" << ctx.side_b.sample_games();
    ss << ",\"quality\":" << quote(data_quality_str(ctx.quality));
    ss << ",\"partial_inputs\":" << string_array(ctx.partial_inputs);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const Projection& p) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"bet_type\":" << quote(bet_type_str(p.bet_type));
    ss << ",\"base_estimate\":" << number(p.base_estimate);
    ss << ",\"point_estimate\":" << number(p.point_estimate);
    ss << ",\"side_a_mean\":" << number(p.side_a_mean);
    ss << ",\"side_b_mean\":" << number(p.side_b_mean);
    ss << ",\"side_a_std\":" << number(p.side_a_std);
    ss << ",\"side_b_std\":" << number(p.side_b_std);
    ss << ",\"efficiency_based\":" << (p.efficiency_based ? "true" : "false");
    ss << ",\"windows_used\":" << p.windows_used;
    ss << ",\"sample_games\":" << p.sample_games;
    ss << ",\"insufficient_sample\":" << (p.insufficient_sample ? "true" : "false");
    if (p.bet_type == BetType::PLAYER_PROP) {
        ss << ",\"minutes_mean\":" << number(p.minutes_mean);
        ss << ",\"minutes_std\":" << number(p.minutes_std);
    }
    ss << ",\"adjustments\":[";
    for (size_t i = 0; i < p.adjustments.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& a = p.adjustments[i];
        ss << "{\"label\":" << quote(a.label)
           << ",\"magnitude\":" << number(a.magnitude)
           << ",\"rationale\":" << quote(a.rationale) << "}";
    }
    ss << "]";
    if (p.skipped) ss << ",\"skip_reason\":" << quote(p.skip_reason);
    ss << "}";
    return ss.str();
}

inline std::string to_json(const SimulationResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"n_sims\":" << r.n_sims;
    ss << ",\"line\":" << number(r.line);
    ss << ",\"distribution\":" << quote(distribution_str(r.distribution));
    ss << ",\"p_over\":" << number(r.p_over);
    ss << ",\"p_under\":" << number(r.p_under);
    ss << ",\"p_push\":" << number(r.p_push);
    ss << ",\"se_over\":" << number(r.se_over);
    ss << ",\"se_under\":" << number(r.se_under);
    ss << ",\"mean\":" << number(r.mean);
    ss << ",\"median\":" << number(r.median);
    ss << ",\"std_dev\":" << number(r.std_dev);
    ss << ",\"percentiles\":{"
       << "\"p5\":" << number(r.percentiles.p5)
       << ",\"p10\":" << number(r.percentiles.p10)
       << ",\"p25\":" << number(r.percentiles.p25)
       << ",\"p50\":" << number(r.percentiles.p50)
       << ",\"p75\":" << number(r.percentiles.p75)
       << ",\"p90\":" << number(r.percentiles.p90)
       << ",\"p95\":" << number(r.percentiles.p95) << "}";
    ss << ",\"extreme_events\":" << r.extreme_events;
    ss << ",\"blowout_events\":" << r.blowout_events;
    ss << ",\"correlation\":" << number(r.correlation);
    ss << ",\"seed\":" << r.seed_used;
    ss << "}";
    return ss.str();
}

inline std::string to_json(const ScenarioReport& r) {
    std::ostringstream ss;
    ss << "{\"stable\":" << (r.stable ? "true" : "false");
    ss << ",\"p_under_spread\":" << number(r.p_under_spread);
    ss << ",\"scenarios\":[";
    for (size_t i = 0; i < r.outcomes.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& o = r.outcomes[i];
        ss << "{\"name\":" << quote(o.name)
           << ",\"p_over\":" << number(o.p_over)
           << ",\"p_under\":" << number(o.p_under)
           << ",\"mean\":" << number(o.mean) << "}";
    }
    ss << "]}";
    return ss.str();
}

inline std::string to_json(const SensitivityReport& s) {
    std::ostringstream ss;
    ss << "{\"d_p_under_d_mean_a\":" << number(s.d_p_under_d_mean_a)
       << ",\"d_p_under_d_mean_b\":" << number(s.d_p_under_d_mean_b)
       << ",\"d_p_under_d_std_a\":" << number(s.d_p_under_d_std_a)
       << ",\"d_p_under_d_std_b\":" << number(s.d_p_under_d_std_b) << "}";
    return ss.str();
}

inline std::string to_json(const SideEdge& s) {
    std::ostringstream ss;
    ss << "{\"decimal_odds\":" << number(s.decimal_odds)
       << ",\"implied_probability\":" << number(s.implied_probability)
       << ",\"model_probability\":" << number(s.model_probability)
       << ",\"edge\":" << number(s.edge)
       << ",\"expected_value\":" << number(s.expected_value)
       << ",\"kelly_fraction\":" << number(s.kelly_fraction)
       << ",\"tier\":" << quote(tier_str(s.tier)) << "}";
    return ss.str();
}

inline std::string to_json(const EdgeResult& e) {
    std::ostringstream ss;
    ss << "{\"first\":" << to_json(e.first)
       << ",\"second\":" << to_json(e.second)
       << ",\"best_pick\":" << quote(pick_str(e.best_pick)) << "}";
    return ss.str();
}

inline std::string to_json(const std::vector<Argument>& args) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& a = args[i];
        ss << "{\"rule\":" << quote(a.rule)
           << ",\"category\":" << quote(category_str(a.category))
           << ",\"strength\":" << number(a.strength)
           << ",\"structural\":" << (a.structural ? "true" : "false")
           << ",\"rationale\":" << quote(a.rationale)
           << ",\"evidence\":" << quote(a.evidence) << "}";
    }
    ss << "]";
    return ss.str();
}

inline std::string to_json(const DebateResult& d) {
    std::ostringstream ss;
    ss << "{\"winner\":" << quote(debate_winner_str(d.winner));
    ss << ",\"supporting_strength\":" << number(d.supporting_strength);
    ss << ",\"opposing_strength\":" << number(d.opposing_strength);
    ss << ",\"net_signal\":" << number(d.net_signal);
    ss << ",\"verdict\":" << quote(d.summary.verdict);
    ss << ",\"supporting\":" << to_json(d.supporting);
    ss << ",\"opposing\":" << to_json(d.opposing);
    ss << ",\"transcript\":" << quote(d.transcript);
    ss << "}";
    return ss.str();
}

// Serialize an EvaluationResult to JSON. This is the wager's reasoning trace.
inline std::string to_json(const EvaluationResult& r) {
    std::ostringstream ss;
    ss << "{";
    ss << "\"state\":" << quote(pipeline_state_str(r.state));
    ss << ",\"path\":[";
    for (size_t i = 0; i < r.path.size(); ++i) {
        if (i > 0) ss << ",";
        ss << quote(pipeline_state_str(r.path[i]));
    }
    ss << "]";
    ss << ",\"attempts\":" << r.attempts;
    ss << ",\"retries\":" << r.retries;
    ss << ",\"depth\":" << quote(depth_str(r.request.depth));
    ss << ",\"data_quality\":" << quote(data_quality_str(r.quality));
    ss << ",\"recommendation\":" << quote(recommendation_str(r.recommendation));
    ss << ",\"pick\":" << (r.pick ? quote(pick_str(*r.pick)) : "null");
    ss << ",\"confidence\":" << number(r.confidence);
    ss << ",\"stake\":" << number(r.stake);
    ss << ",\"confidence_factors\":" << string_array(r.confidence_factors);
    ss << ",\"triggered_rules\":[";
    for (size_t i = 0; i < r.triggered_rules.size(); ++i) {
        if (i > 0) ss << ",";
        ss << r.triggered_rules[i];
    }
    ss << "]";
    ss << ",\"issues\":[";
    for (size_t i = 0; i < r.issues.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"code\":" << quote(issue_code_str(r.issues[i].code))
           << ",\"detail\":" << quote(r.issues[i].detail) << "}";
    }
    ss << "]";
    ss << ",\"errors\":" << string_array(r.errors);
    ss << ",\"context\":" << (r.context ? to_json(*r.context) : "null");
    ss << ",\"projection\":" << (r.projection ? to_json(*r.projection) : "null");
    ss << ",\"simulation\":" << (r.simulation ? to_json(*r.simulation) : "null");
    ss << ",\"scenarios\":" << (r.scenarios ? to_json(*r.scenarios) : "null");
    ss << ",\"sensitivity\":" << (r.sensitivity ? to_json(*r.sensitivity) : "null");
    ss << ",\"edge\":" << (r.edge ? to_json(*r.edge) : "null");
    ss << ",\"debate\":" << (r.debate ? to_json(*r.debate) : "null");
    if (r.wager_id) ss << ",\"wager_id\":" << *r.wager_id;
    ss << "}";
    return ss.str();
}

inline std::string to_json(const SettlementReport& r) {
    std::ostringstream ss;
    ss << "{\"examined\":" << r.examined
       << ",\"settled\":" << r.settled
       << ",\"wins\":" << r.wins
       << ",\"losses\":" << r.losses
       << ",\"pushes\":" << r.pushes
       << ",\"already_settled\":" << r.already_settled
       << ",\"profit\":" << number(r.profit)
       << ",\"unresolved\":[";
    for (size_t i = 0; i < r.unresolved.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"wager_id\":" << r.unresolved[i].wager_id
           << ",\"reason\":" << quote(r.unresolved[i].reason) << "}";
    }
    ss << "]}";
    return ss.str();
}

inline std::string to_json(const std::vector<CalibrationBucket>& buckets) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < buckets.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& b = buckets[i];
        ss << "{\"bucket\":" << b.bucket
           << ",\"total\":" << b.total
           << ",\"wins\":" << b.wins
           << ",\"losses\":" << b.losses
           << ",\"pushes\":" << b.pushes
           << ",\"realized_win_rate\":" << number(b.realized_win_rate)
           << ",\"calibration_error\":" << number(b.calibration_error) << "}";
    }
    ss << "]";
    return ss.str();
}

inline std::string to_json(const LearningRule& r) {
    std::ostringstream ss;
    ss << "{\"id\":" << r.id
       << ",\"condition\":" << quote(rule_condition_str(r.condition))
       << ",\"bet_type\":" << (r.bet_type ? quote(bet_type_str(*r.bet_type)) : "null")
       << ",\"pick\":" << (r.pick ? quote(pick_str(*r.pick)) : "null")
       << ",\"threshold\":" << number(r.threshold)
       << ",\"adjustment\":" << number(r.adjustment)
       << ",\"description\":" << quote(r.description)
       << ",\"evidence\":" << quote(r.evidence)
       << ",\"sample_size\":" << r.sample_size
       << ",\"loss_rate\":" << number(r.loss_rate)
       << ",\"thresholds_version\":" << r.thresholds_version << "}";
    return ss.str();
}

inline std::string to_json(const PatternReport& r) {
    std::ostringstream ss;
    ss << "{\"settled_examined\":" << r.settled_examined
       << ",\"thresholds_version\":" << r.thresholds_version
       << ",\"created\":[";
    for (size_t i = 0; i < r.created.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(r.created[i]);
    }
    ss << "],\"skipped\":[";
    for (size_t i = 0; i < r.skipped.size(); ++i) {
        if (i > 0) ss << ",";
        ss << to_json(r.skipped[i]);
    }
    ss << "],\"high_confidence_losses\":[";
    for (size_t i = 0; i < r.high_confidence_losses.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& w = r.high_confidence_losses[i];
        ss << "{\"wager_id\":" << w.id
           << ",\"selection\":" << quote(w.selection)
           << ",\"confidence\":" << number(w.confidence)
           << ",\"predicted_edge\":" << number(w.predicted_edge) << "}";
    }
    ss << "]}";
    return ss.str();
}

}  // namespace trace_io
