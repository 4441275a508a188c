#pragma once

#include "context/context.hpp"
#include "odds/odds.hpp"
#include "simulation/simulation_kernel.hpp"

#include <algorithm>
#include <stdexcept>

// ---------------------------------------------------------------------------
// EdgeConfig - sizing policy and EV tier thresholds
// ---------------------------------------------------------------------------
struct EdgeConfig {
    double kelly_multiplier = 0.25;  // quarter Kelly
    double kelly_cap = 0.05;         // of bankroll
    double lean_ev = 0.0;
    double bet_ev = 0.03;
    double strong_ev = 0.06;
};

enum class Tier { NO_BET, LEAN, BET, STRONG_BET };

inline const char* tier_str(Tier t) {
    switch (t) {
        case Tier::NO_BET:     return "NO_BET";
        case Tier::LEAN:       return "LEAN";
        case Tier::BET:        return "BET";
        case Tier::STRONG_BET: return "STRONG_BET";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// SideEdge - the numbers behind one side of a market
// ---------------------------------------------------------------------------
struct SideEdge {
    double decimal_odds = 0.0;
    double implied_probability = 0.0;
    double model_probability = 0.0;
    double lose_probability = 0.0;
    double edge = 0.0;
    double expected_value = 0.0;  // per unit stake
    double kelly_full = 0.0;
    double kelly_fraction = 0.0;  // after multiplier and cap
    Tier tier = Tier::NO_BET;
};

struct EdgeResult {
    SideEdge first;   // OVER / side A
    SideEdge second;  // UNDER / side B
    Pick best_pick = Pick::OVER;

    const SideEdge& side(Pick p) const { return is_first_outcome(p) ? first : second; }
    const SideEdge& best() const { return side(best_pick); }
};

// ---------------------------------------------------------------------------
// EdgeCalculator
// ---------------------------------------------------------------------------
class EdgeCalculator {
public:
    explicit EdgeCalculator(const EdgeConfig& cfg = {}) : cfg_(cfg) {}

    const EdgeConfig& config() const { return cfg_; }

    Tier tier_for(double ev) const {
        if (ev > cfg_.strong_ev) return Tier::STRONG_BET;
        if (ev > cfg_.bet_ev) return Tier::BET;
        if (ev > cfg_.lean_ev) return Tier::LEAN;
        return Tier::NO_BET;
    }

    // p_lose is the probability the stake is lost; a push returns it, so
    // p_win + p_lose may be below one.
    SideEdge evaluate(double p_win, double p_lose, double decimal_odds) const {
        if (p_win < 0.0 || p_win > 1.0 || p_lose < 0.0 || p_lose > 1.0)
            throw std::invalid_argument("probabilities must be in [0, 1]");
        SideEdge s;
        s.decimal_odds = decimal_odds;
        s.implied_probability = odds::implied_probability(decimal_odds);
        s.model_probability = p_win;
        s.lose_probability = p_lose;
        s.edge = p_win - s.implied_probability;

        double b = odds::win_profit(decimal_odds);
        s.expected_value = p_win * b - p_lose;
        double q = 1.0 - p_win;
        s.kelly_full = std::max(0.0, (b * p_win - q) / b);
        s.kelly_fraction = std::min(s.kelly_full * cfg_.kelly_multiplier, cfg_.kelly_cap);
        s.tier = tier_for(s.expected_value);
        return s;
    }

    // Both sides of a two-way market. Ties go to the first outcome.
    EdgeResult evaluate(const SimulationResult& sim, double price_first, double price_second) const {
        EdgeResult r;
        r.first = evaluate(sim.p_over, sim.p_under, price_first);
        r.second = evaluate(sim.p_under, sim.p_over, price_second);
        bool team = sim.bet_type == BetType::SPREAD || sim.bet_type == BetType::MONEYLINE;
        bool first_better = r.first.expected_value >= r.second.expected_value;
        if (team) r.best_pick = first_better ? Pick::SIDE : Pick::OPPONENT;
        else r.best_pick = first_better ? Pick::OVER : Pick::UNDER;
        return r;
    }

private:
    EdgeConfig cfg_;
};
