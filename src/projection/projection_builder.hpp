#pragma once

#include "context/context.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ProjectionConfig - weights and adjustment magnitudes.
// The magnitudes come from historical backtests; treat them as tunables.
// ---------------------------------------------------------------------------
struct ProjectionConfig {
    // Indexed by Window: season, l15, l10, l5.
    std::array<double, 4> team_window_weights = {0.20, 0.25, 0.30, 0.25};
    std::array<double, 4> prop_window_weights = {0.25, 0.00, 0.35, 0.40};

    double back_to_back_penalty = 3.0;
    double one_day_rest_penalty = 1.5;
    double well_rested_bonus = 2.0;     // whole game, when both sides qualify
    int well_rested_days = 3;
    double fatigue_points_per_unit = 0.5;

    double h2h_weight = 0.15;
    int h2h_min_games = 3;

    double ou_strong_under_rate = 0.65;
    double ou_lean_under_rate = 0.55;
    double ou_strong_over_rate = 0.35;
    double ou_lean_over_rate = 0.45;
    double ou_strong_nudge = 2.0;
    double ou_lean_nudge = 1.0;

    double bias_correction = 12.0;      // totals only
    double home_court_advantage = 3.0;  // spreads and moneylines

    double default_score_std = 12.0;
    int full_sample_games = 15;
    double std_per_missing_game = 0.3;
    int min_sample_games = 10;

    double prop_std_fraction = 0.25;
    double prop_back_to_back_factor = 0.95;
    double default_minutes = 32.0;
    double default_minutes_std = 5.0;
};

// ---------------------------------------------------------------------------
// Adjustment - one named, signed component of a projection.
// magnitude is the effect on the point estimate; the per-side deltas are
// the same effect expressed on each side's mean.
// ---------------------------------------------------------------------------
struct Adjustment {
    std::string label;
    double magnitude = 0.0;
    double side_a_delta = 0.0;
    double side_b_delta = 0.0;
    std::string rationale;
};

// ---------------------------------------------------------------------------
// Projection
//
// TOTAL:       point_estimate = side_a_mean + side_b_mean
// SPREAD/ML:   point_estimate = side_a_mean - side_b_mean (side A margin)
// PLAYER_PROP: point_estimate = side_a_mean (expected stat), side B unused
// ---------------------------------------------------------------------------
struct Projection {
    BetType bet_type = BetType::TOTAL;
    std::string stat_type;

    double base_estimate = 0.0;
    double point_estimate = 0.0;
    double side_a_mean = 0.0;
    double side_b_mean = 0.0;
    double side_a_std = 0.0;
    double side_b_std = 0.0;
    std::vector<Adjustment> adjustments;

    bool efficiency_based = false;
    int windows_used = 0;
    int sample_games = 0;
    bool insufficient_sample = false;

    double minutes_mean = 0.0;
    double minutes_std = 0.0;

    bool skipped = false;
    std::string skip_reason;

    double total_adjustment() const {
        double sum = 0.0;
        for (const auto& a : adjustments) sum += a.magnitude;
        return sum;
    }

    const Adjustment* find(const std::string& label) const {
        for (const auto& a : adjustments)
            if (a.label == label) return &a;
        return nullptr;
    }
};

// ---------------------------------------------------------------------------
// BlendedForm - window-weighted averages for one side
// ---------------------------------------------------------------------------
struct BlendedForm {
    double ppg = 0.0;
    double opp_ppg = 0.0;
    double ortg = 0.0;
    double drtg = 0.0;
    double pace = 0.0;
    double stat_value = 0.0;
    int windows_used = 0;
    bool efficiency = false;
};

namespace projection_util {

// Weighted mean over present windows; missing windows drop out and the
// remaining weights are re-normalised.
template <typename Field>
inline std::optional<double> blend(const SideContext& side, const std::array<double, 4>& weights,
                                   Field field) {
    double num = 0.0;
    double den = 0.0;
    for (Window w : ALL_WINDOWS) {
        const auto& agg = side.window(w);
        double weight = weights[static_cast<size_t>(w)];
        if (!agg || agg->games <= 0 || weight <= 0.0) continue;
        num += weight * field(*agg);
        den += weight;
    }
    if (den <= 0.0) return std::nullopt;
    return num / den;
}

inline BlendedForm blend_team(const SideContext& side, const std::array<double, 4>& weights) {
    BlendedForm f;
    for (Window w : ALL_WINDOWS) {
        const auto& agg = side.window(w);
        if (agg && agg->games > 0 && weights[static_cast<size_t>(w)] > 0.0) ++f.windows_used;
    }
    f.ppg = blend(side, weights, [](const WindowAggregate& a) { return a.ppg; }).value_or(0.0);
    f.opp_ppg = blend(side, weights, [](const WindowAggregate& a) { return a.opp_ppg; }).value_or(0.0);

    // Efficiency only counts when every contributing window carries it.
    bool all_eff = f.windows_used > 0;
    for (Window w : ALL_WINDOWS) {
        const auto& agg = side.window(w);
        if (agg && agg->games > 0 && weights[static_cast<size_t>(w)] > 0.0 && !agg->has_efficiency())
            all_eff = false;
    }
    if (all_eff) {
        f.efficiency = true;
        f.ortg = *blend(side, weights, [](const WindowAggregate& a) { return a.ortg; });
        f.drtg = *blend(side, weights, [](const WindowAggregate& a) { return a.drtg; });
        f.pace = *blend(side, weights, [](const WindowAggregate& a) { return a.pace; });
    }
    return f;
}

}  // namespace projection_util

// ---------------------------------------------------------------------------
// ProjectionBuilder - Context -> Projection
// ---------------------------------------------------------------------------
class ProjectionBuilder {
public:
    explicit ProjectionBuilder(const ProjectionConfig& cfg = {}) : cfg_(cfg) {}

    const ProjectionConfig& config() const { return cfg_; }

    Projection build(const Context& ctx) const {
        if (ctx.bet_type == BetType::PLAYER_PROP) return build_prop(ctx);
        return build_team(ctx);
    }

private:
    ProjectionConfig cfg_;

    bool margin_market(BetType t) const {
        return t == BetType::SPREAD || t == BetType::MONEYLINE;
    }

    void add(Projection& p, const std::string& label, double da, double db,
             const std::string& rationale) const {
        Adjustment adj;
        adj.label = label;
        adj.side_a_delta = da;
        adj.side_b_delta = db;
        adj.magnitude = margin_market(p.bet_type) ? (da - db) : (da + db);
        adj.rationale = rationale;
        p.side_a_mean += da;
        p.side_b_mean += db;
        p.point_estimate += adj.magnitude;
        p.adjustments.push_back(std::move(adj));
    }

    static double venue_std(const SideContext& side) {
        return side.venue ? side.venue->total_std : 0.0;
    }

    // Venue total std when both sides carry it, else the score std of the
    // season (or first populated) window, else the default.
    double side_std(const SideContext& side, bool use_venue) const {
        double std_dev = cfg_.default_score_std;
        const auto& season = side.window(Window::SEASON);
        if (use_venue) {
            std_dev = venue_std(side);
        } else if (season && season->score_std > 0.0) {
            std_dev = season->score_std;
        } else {
            for (Window w : ALL_WINDOWS) {
                const auto& agg = side.window(w);
                if (agg && agg->score_std > 0.0) { std_dev = agg->score_std; break; }
            }
        }
        int games = side.sample_games();
        if (games < cfg_.full_sample_games)
            std_dev += (cfg_.full_sample_games - games) * cfg_.std_per_missing_game;
        return std_dev;
    }

    Projection build_team(const Context& ctx) const {
        Projection p;
        p.bet_type = ctx.bet_type;

        auto fa = projection_util::blend_team(ctx.side_a, cfg_.team_window_weights);
        auto fb = projection_util::blend_team(ctx.side_b, cfg_.team_window_weights);
        p.windows_used = std::min(fa.windows_used, fb.windows_used);
        if (fa.windows_used == 0 || fb.windows_used == 0) {
            p.skipped = true;
            p.skip_reason = "no performance windows for "
                + (fa.windows_used == 0 ? ctx.side_a.entity.id : ctx.side_b.entity.id);
            return p;
        }

        if (fa.efficiency && fb.efficiency) {
            double pace = (fa.pace + fb.pace) / 2.0;
            p.side_a_mean = (fa.ortg + fb.drtg) / 2.0 * pace / 100.0;
            p.side_b_mean = (fb.ortg + fa.drtg) / 2.0 * pace / 100.0;
            p.efficiency_based = true;
        } else if (fa.ppg > 0.0 && fb.ppg > 0.0) {
            p.side_a_mean = fb.opp_ppg > 0.0 ? (fa.ppg + fb.opp_ppg) / 2.0 : fa.ppg;
            p.side_b_mean = fa.opp_ppg > 0.0 ? (fb.ppg + fa.opp_ppg) / 2.0 : fb.ppg;
        } else {
            p.skipped = true;
            p.skip_reason = "neither efficiency nor scoring averages available";
            return p;
        }
        p.point_estimate = margin_market(p.bet_type) ? p.side_a_mean - p.side_b_mean
                                                     : p.side_a_mean + p.side_b_mean;
        p.base_estimate = p.point_estimate;

        apply_opponent_strength(p, ctx, fa, fb);
        apply_rest(p, ctx);
        apply_fatigue(p, ctx);
        if (margin_market(p.bet_type)) {
            apply_home_court(p, ctx);
        } else {
            apply_venue(p, ctx);
        }
        apply_head_to_head(p, ctx);
        if (p.bet_type == BetType::TOTAL) {
            apply_ou_tendency(p, ctx);
            if (cfg_.bias_correction != 0.0)
                add(p, "bias_correction", cfg_.bias_correction / 2.0, cfg_.bias_correction / 2.0,
                    "historical under-projection of combined scoring");
        }

        const bool use_venue = venue_std(ctx.side_a) > 0.0 && venue_std(ctx.side_b) > 0.0;
        p.side_a_std = side_std(ctx.side_a, use_venue);
        p.side_b_std = side_std(ctx.side_b, use_venue);
        p.sample_games = std::min(ctx.side_a.sample_games(), ctx.side_b.sample_games());
        p.insufficient_sample = p.sample_games < cfg_.min_sample_games;
        return p;
    }

    // Scale raw scoring by league defense / faced defense, and points
    // allowed by league offense / faced offense.
    void apply_opponent_strength(Projection& p, const Context& ctx,
                                 const BlendedForm& fa, const BlendedForm& fb) const {
        if (!ctx.side_a.strength || !ctx.side_b.strength) return;
        const auto& sa = *ctx.side_a.strength;
        const auto& sb = *ctx.side_b.strength;
        if (sa.faced_drtg <= 0.0 || sa.faced_ortg <= 0.0 || sb.faced_drtg <= 0.0 || sb.faced_ortg <= 0.0)
            return;
        double off_a = fa.ppg * (sa.league_drtg / sa.faced_drtg - 1.0);
        double def_a = fa.opp_ppg * (sa.league_ortg / sa.faced_ortg - 1.0);
        double off_b = fb.ppg * (sb.league_drtg / sb.faced_drtg - 1.0);
        double def_b = fb.opp_ppg * (sb.league_ortg / sb.faced_ortg - 1.0);
        double da = (off_a + def_b) / 2.0;
        double db = (off_b + def_a) / 2.0;
        add(p, "opponent_strength", da, db,
            "scoring normalised to league-average opposition");
    }

    double rest_penalty(const std::optional<RestInfo>& r) const {
        if (!r) return 0.0;
        if (r->rest_days == 0) return -cfg_.back_to_back_penalty;
        if (r->rest_days == 1) return -cfg_.one_day_rest_penalty;
        return 0.0;
    }

    void apply_rest(Projection& p, const Context& ctx) const {
        const auto& ra = ctx.side_a.rest;
        const auto& rb = ctx.side_b.rest;
        double da = rest_penalty(ra);
        double db = rest_penalty(rb);
        if (ra && rb && ra->rest_days >= cfg_.well_rested_days && rb->rest_days >= cfg_.well_rested_days) {
            da += cfg_.well_rested_bonus / 2.0;
            db += cfg_.well_rested_bonus / 2.0;
        }
        if (da == 0.0 && db == 0.0) return;
        std::string why;
        if (ra) why += ctx.side_a.entity.id + " rest " + std::to_string(ra->rest_days) + "d";
        if (rb) why += (why.empty() ? "" : ", ") + ctx.side_b.entity.id + " rest "
                     + std::to_string(rb->rest_days) + "d";
        add(p, "rest", da, db, why);
    }

    void apply_fatigue(Projection& p, const Context& ctx) const {
        double fa = ctx.side_a.rest ? ctx.side_a.rest->fatigue_score() : 0.0;
        double fb = ctx.side_b.rest ? ctx.side_b.rest->fatigue_score() : 0.0;
        if (fa == 0.0 && fb == 0.0) return;
        add(p, "schedule_fatigue", -fa * cfg_.fatigue_points_per_unit,
            -fb * cfg_.fatigue_points_per_unit,
            "dense schedule: fatigue " + std::to_string(fa) + " / " + std::to_string(fb));
    }

    void apply_home_court(Projection& p, const Context& ctx) const {
        if (!ctx.side_a.is_home && !ctx.side_b.is_home) return;
        double half = cfg_.home_court_advantage / 2.0;
        double sign = ctx.side_a.is_home ? 1.0 : -1.0;
        add(p, "home_court", sign * half, -sign * half,
            (ctx.side_a.is_home ? ctx.side_a.entity.id : ctx.side_b.entity.id) + " at home");
    }

    void apply_venue(Projection& p, const Context& ctx) const {
        auto diff = [](const SideContext& s) {
            if (!s.venue || s.venue->games <= 0 || s.venue->overall_avg_total <= 0.0) return 0.0;
            return s.venue->venue_avg_total(s.is_home) - s.venue->overall_avg_total;
        };
        double da = diff(ctx.side_a) / 2.0;
        double db = diff(ctx.side_b) / 2.0;
        if (da == 0.0 && db == 0.0) return;
        add(p, "venue_split", da, db, "venue-specific totals versus overall averages");
    }

    void apply_head_to_head(Projection& p, const Context& ctx) const {
        if (!ctx.head_to_head || ctx.head_to_head->games < cfg_.h2h_min_games) return;
        const auto& h = *ctx.head_to_head;
        if (margin_market(p.bet_type)) {
            double pull = (h.avg_margin - p.point_estimate) * cfg_.h2h_weight;
            add(p, "head_to_head", pull / 2.0, -pull / 2.0,
                std::to_string(h.games) + " meetings, avg margin " + std::to_string(h.avg_margin));
        } else {
            if (h.avg_total <= 0.0) return;
            double pull = (h.avg_total - p.point_estimate) * cfg_.h2h_weight;
            add(p, "head_to_head", pull / 2.0, pull / 2.0,
                std::to_string(h.games) + " meetings, avg total " + std::to_string(h.avg_total));
        }
    }

    void apply_ou_tendency(Projection& p, const Context& ctx) const {
        double sum = 0.0;
        int n = 0;
        for (const auto* s : {&ctx.side_a, &ctx.side_b}) {
            if (s->ou_record && s->ou_record->games > 0) {
                sum += s->ou_record->under_rate;
                ++n;
            }
        }
        if (n == 0) return;
        double under_rate = sum / n;
        double nudge = 0.0;
        if (under_rate > cfg_.ou_strong_under_rate) nudge = -cfg_.ou_strong_nudge;
        else if (under_rate > cfg_.ou_lean_under_rate) nudge = -cfg_.ou_lean_nudge;
        else if (under_rate < cfg_.ou_strong_over_rate) nudge = cfg_.ou_strong_nudge;
        else if (under_rate < cfg_.ou_lean_over_rate) nudge = cfg_.ou_lean_nudge;
        if (nudge == 0.0) return;
        add(p, "ou_tendency", nudge / 2.0, nudge / 2.0,
            "combined under rate " + std::to_string(under_rate));
    }

    Projection build_prop(const Context& ctx) const {
        Projection p;
        p.bet_type = BetType::PLAYER_PROP;
        p.stat_type = ctx.stat_type;

        const auto& player = ctx.side_a;
        auto stat = projection_util::blend(player, cfg_.prop_window_weights,
                                           [](const WindowAggregate& a) { return a.stat_value; });
        for (Window w : ALL_WINDOWS) {
            const auto& agg = player.window(w);
            if (agg && agg->games > 0 && cfg_.prop_window_weights[static_cast<size_t>(w)] > 0.0)
                ++p.windows_used;
        }
        if (!stat) {
            p.skipped = true;
            p.skip_reason = "no " + ctx.stat_type + " history for " + player.entity.id;
            return p;
        }
        p.base_estimate = *stat;
        p.point_estimate = *stat;
        p.side_a_mean = *stat;

        if (ctx.defensive_factor && *ctx.defensive_factor > 0.0 && *ctx.defensive_factor != 1.0) {
            double delta = p.point_estimate * (*ctx.defensive_factor - 1.0);
            add(p, "opponent_defense", delta, 0.0,
                ctx.side_b.entity.id + " allows x" + std::to_string(*ctx.defensive_factor)
                + " league " + ctx.stat_type);
        }
        if (player.rest && player.rest->back_to_back()) {
            double delta = p.point_estimate * (cfg_.prop_back_to_back_factor - 1.0);
            add(p, "back_to_back", delta, 0.0, "second night of a back-to-back");
        }

        // Recent variability first, then season, then a fraction of the mean.
        double std_dev = 0.0;
        for (Window w : {Window::LAST_10, Window::SEASON, Window::LAST_15, Window::LAST_5}) {
            const auto& agg = player.window(w);
            if (agg && agg->stat_std > 0.0) { std_dev = agg->stat_std; break; }
        }
        if (std_dev <= 0.0) std_dev = p.point_estimate * cfg_.prop_std_fraction;
        p.side_a_std = std_dev;

        p.minutes_mean = cfg_.default_minutes;
        p.minutes_std = cfg_.default_minutes_std;
        for (Window w : {Window::LAST_10, Window::SEASON}) {
            const auto& agg = player.window(w);
            if (agg && agg->minutes > 0.0) {
                p.minutes_mean = agg->minutes;
                if (agg->minutes_std > 0.0) p.minutes_std = agg->minutes_std;
                break;
            }
        }

        p.sample_games = player.sample_games();
        p.insufficient_sample = p.sample_games < cfg_.min_sample_games;
        return p;
    }
};
