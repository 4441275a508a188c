#pragma once

#include "projection/projection_builder.hpp"
#include "simulation/simulation_kernel.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Scenario - a named perturbation of the base projection / kernel settings
// ---------------------------------------------------------------------------
struct Scenario {
    std::string name;
    double mean_shift = 0.0;     // per side, points
    double std_scale = 1.0;
    std::optional<double> ot_probability;
    std::optional<double> correlation;
    bool skew_normal = false;
};

inline std::vector<Scenario> default_scenarios() {
    return {
        {"base", 0.0, 1.0, std::nullopt, std::nullopt, false},
        {"high_pace", 3.0, 1.0, std::nullopt, std::nullopt, false},
        {"low_pace", -3.0, 1.0, std::nullopt, std::nullopt, false},
        {"high_variance", 0.0, 1.3, std::nullopt, std::nullopt, false},
        {"low_variance", 0.0, 0.7, std::nullopt, std::nullopt, false},
        {"high_ot", 0.0, 1.0, 0.10, std::nullopt, false},
        {"no_correlation", 0.0, 1.0, std::nullopt, 0.0, false},
        {"high_correlation", 0.0, 1.0, std::nullopt, 0.35, false},
        {"skew_normal", 0.0, 1.0, std::nullopt, std::nullopt, true},
    };
}

struct ScenarioOutcome {
    std::string name;
    double p_over = 0.0;
    double p_under = 0.0;
    double p_push = 0.0;
    double mean = 0.0;
};

struct ScenarioReport {
    std::vector<ScenarioOutcome> outcomes;
    double p_under_min = 0.0;
    double p_under_max = 0.0;
    double p_under_spread = 0.0;
    bool stable = false;  // spread below ScenarioConfig::stable_spread
};

struct ScenarioConfig {
    int n_sims = 5000;
    uint64_t seed = 42;
    double stable_spread = 0.10;
};

// ---------------------------------------------------------------------------
// ScenarioAnalyzer - robustness of the decision to modelling assumptions
// ---------------------------------------------------------------------------
class ScenarioAnalyzer {
public:
    ScenarioAnalyzer(const SimulationConfig& base, const ScenarioConfig& cfg = {})
        : base_(base), cfg_(cfg) {}

    ScenarioReport run(const Projection& proj, double line,
                       const std::vector<Scenario>& scenarios = default_scenarios()) const {
        ScenarioReport report;
        for (const auto& sc : scenarios) {
            Projection p = proj;
            p.side_a_mean += sc.mean_shift;
            p.side_b_mean += sc.mean_shift;
            p.point_estimate += (p.bet_type == BetType::TOTAL) ? 2.0 * sc.mean_shift : 0.0;
            p.side_a_std *= sc.std_scale;
            p.side_b_std *= sc.std_scale;

            SimulationConfig sim = base_;
            sim.n_sims = cfg_.n_sims;
            sim.seed = cfg_.seed;
            if (sc.ot_probability) sim.ot_probability = *sc.ot_probability;
            if (sc.correlation) sim.correlation = *sc.correlation;
            sim.skew_normal = sc.skew_normal || base_.skew_normal;

            auto r = SimulationKernel(sim).run(p, line);
            report.outcomes.push_back({sc.name, r.p_over, r.p_under, r.p_push, r.mean});
        }
        if (report.outcomes.empty()) return report;

        auto [lo, hi] = std::minmax_element(
            report.outcomes.begin(), report.outcomes.end(),
            [](const ScenarioOutcome& a, const ScenarioOutcome& b) { return a.p_under < b.p_under; });
        report.p_under_min = lo->p_under;
        report.p_under_max = hi->p_under;
        report.p_under_spread = hi->p_under - lo->p_under;
        report.stable = report.p_under_spread < cfg_.stable_spread;
        return report;
    }

private:
    SimulationConfig base_;
    ScenarioConfig cfg_;
};

// ---------------------------------------------------------------------------
// Sensitivity - central differences of p_under with common random numbers
// ---------------------------------------------------------------------------
struct SensitivityReport {
    double d_p_under_d_mean_a = 0.0;
    double d_p_under_d_mean_b = 0.0;
    double d_p_under_d_std_a = 0.0;
    double d_p_under_d_std_b = 0.0;
};

inline SensitivityReport sensitivity_analysis(const Projection& proj, double line,
                                              SimulationConfig cfg,
                                              double perturbation = 0.05, uint64_t seed = 42) {
    cfg.seed = seed;
    SimulationKernel kernel(cfg);

    auto p_under = [&](double ma, double mb, double sa, double sb) {
        Projection p = proj;
        p.side_a_mean = ma;
        p.side_b_mean = mb;
        p.side_a_std = sa;
        p.side_b_std = sb;
        if (p.bet_type == BetType::PLAYER_PROP) p.point_estimate = ma;
        return kernel.run(p, line).p_under;
    };
    auto derivative = [](double up, double down, double h) {
        return h > 0.0 ? (up - down) / (2.0 * h) : 0.0;
    };

    const double ma = proj.side_a_mean, mb = proj.side_b_mean;
    const double sa = proj.side_a_std, sb = proj.side_b_std;
    SensitivityReport s;
    double h = ma * perturbation;
    s.d_p_under_d_mean_a = derivative(p_under(ma + h, mb, sa, sb), p_under(ma - h, mb, sa, sb), h);
    h = sa * perturbation;
    s.d_p_under_d_std_a = derivative(p_under(ma, mb, sa + h, sb), p_under(ma, mb, sa - h, sb), h);
    if (proj.bet_type != BetType::PLAYER_PROP) {
        h = mb * perturbation;
        s.d_p_under_d_mean_b = derivative(p_under(ma, mb + h, sa, sb), p_under(ma, mb - h, sa, sb), h);
        h = sb * perturbation;
        s.d_p_under_d_std_b = derivative(p_under(ma, mb, sa, sb + h), p_under(ma, mb, sa, sb - h), h);
    }
    return s;
}
