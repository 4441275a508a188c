#pragma once

#include "context/context.hpp"
#include "projection/projection_builder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SimulationConfig
// ---------------------------------------------------------------------------
struct SimulationConfig {
    int n_sims = 10000;
    double correlation = 0.19;   // observed between opposing team scores
    bool skew_normal = false;
    double skewness = 0.19;

    double ot_probability = 0.06;
    double ot_points_mean = 12.0;
    double ot_points_std = 3.0;
    double score_floor = 70.0;
    double min_std = 5.0;

    // Player props: minutes mixture.
    double dnp_probability = 0.02;
    double blowout_probability = 0.08;
    double blowout_minutes_factor = 0.70;
    double max_minutes = 48.0;

    std::optional<uint64_t> seed;
};

enum class Distribution { BIVARIATE_NORMAL, SKEW_NORMAL, MINUTES_MIXTURE };

inline const char* distribution_str(Distribution d) {
    switch (d) {
        case Distribution::BIVARIATE_NORMAL: return "bivariate_normal";
        case Distribution::SKEW_NORMAL:      return "skew_normal";
        case Distribution::MINUTES_MIXTURE:  return "minutes_mixture";
    }
    return "unknown";
}

struct Percentiles {
    double p5 = 0.0;
    double p10 = 0.0;
    double p25 = 0.0;
    double p50 = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double p95 = 0.0;
};

// ---------------------------------------------------------------------------
// SimulationResult
//
// For TOTAL and PLAYER_PROP the simulated value is compared with the line.
// For SPREAD the value is side A's margin compared with -line, so p_over is
// the probability side A covers. MONEYLINE compares the margin with zero.
// ---------------------------------------------------------------------------
struct SimulationResult {
    BetType bet_type = BetType::TOTAL;
    int n_sims = 0;
    double line = 0.0;
    double threshold = 0.0;

    double p_over = 0.0;
    double p_under = 0.0;
    double p_push = 0.0;
    double se_over = 0.0;
    double se_under = 0.0;
    double ci95_over_low = 0.0;
    double ci95_over_high = 0.0;
    double ci95_under_low = 0.0;
    double ci95_under_high = 0.0;

    double mean = 0.0;
    double median = 0.0;
    double std_dev = 0.0;
    double min = 0.0;
    double max = 0.0;
    Percentiles percentiles;

    int extreme_events = 0;   // overtime games, or DNP for props
    double extreme_rate = 0.0;
    int blowout_events = 0;   // props only

    double correlation = 0.0;
    Distribution distribution = Distribution::BIVARIATE_NORMAL;
    uint64_t seed_used = 0;

    double p_first(Pick p) const { return is_first_outcome(p) ? p_over : p_under; }
    double p_second(Pick p) const { return is_first_outcome(p) ? p_under : p_over; }
};

namespace sim_util {

// numpy-style linear interpolation on a sorted sample.
inline double percentile(const std::vector<double>& sorted, double pct) {
    if (sorted.empty()) return 0.0;
    double idx = pct / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(idx));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = idx - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

inline double binomial_se(double p, int n) {
    if (n <= 0) return 0.0;
    return std::sqrt(p * (1.0 - p) / n);
}

// Standardised skew-normal draw (mean 0, variance 1).
template <typename Rng>
inline double skew_normal_std(Rng& rng, double skewness) {
    std::normal_distribution<double> n01(0.0, 1.0);
    double delta = skewness / std::sqrt(1.0 + skewness * skewness);
    delta = std::clamp(delta, -0.99, 0.99);
    double u0 = n01(rng);
    double u1 = n01(rng);
    double x = delta * std::abs(u0) + std::sqrt(1.0 - delta * delta) * u1;
    double mean = delta * std::sqrt(2.0 / std::numbers::pi);
    double var = 1.0 - 2.0 * delta * delta / std::numbers::pi;
    return (x - mean) / std::sqrt(var);
}

inline bool is_counting_stat(const std::string& stat) {
    static const std::set<std::string> counting = {
        "3pm", "fg3m", "threes", "steals", "stl", "blocks", "blk", "turnovers", "tov"};
    return counting.count(stat) > 0;
}

inline bool is_three_point_stat(const std::string& stat) {
    return stat == "3pm" || stat == "fg3m" || stat == "threes";
}

}  // namespace sim_util

// ---------------------------------------------------------------------------
// SimulationKernel - Monte Carlo over a Projection
// ---------------------------------------------------------------------------
class SimulationKernel {
public:
    explicit SimulationKernel(const SimulationConfig& cfg = {}) : cfg_(cfg) {
        if (cfg_.n_sims <= 0)
            throw std::invalid_argument("n_sims must be positive");
        if (cfg_.correlation < -1.0 || cfg_.correlation > 1.0)
            throw std::invalid_argument("correlation must be in [-1, 1]");
        if (cfg_.ot_probability < 0.0 || cfg_.ot_probability > 1.0)
            throw std::invalid_argument("ot_probability must be in [0, 1]");
    }

    const SimulationConfig& config() const { return cfg_; }

    SimulationResult run(const Projection& proj, double line) const {
        if (proj.skipped)
            throw std::invalid_argument("cannot simulate a skipped projection: " + proj.skip_reason);

        uint64_t seed = cfg_.seed ? *cfg_.seed : static_cast<uint64_t>(std::random_device{}());
        std::mt19937_64 rng(seed);

        SimulationResult r;
        r.bet_type = proj.bet_type;
        r.n_sims = cfg_.n_sims;
        r.line = line;
        r.seed_used = seed;

        std::vector<double> values;
        values.reserve(static_cast<size_t>(cfg_.n_sims));

        if (proj.bet_type == BetType::PLAYER_PROP) {
            r.threshold = line;
            r.distribution = Distribution::MINUTES_MIXTURE;
            simulate_prop(proj, rng, values, r);
        } else {
            bool margin = proj.bet_type == BetType::SPREAD || proj.bet_type == BetType::MONEYLINE;
            r.threshold = proj.bet_type == BetType::SPREAD ? -line
                        : proj.bet_type == BetType::MONEYLINE ? 0.0 : line;
            r.distribution = cfg_.skew_normal ? Distribution::SKEW_NORMAL
                                              : Distribution::BIVARIATE_NORMAL;
            r.correlation = cfg_.correlation;
            simulate_team(proj, margin, rng, values, r);
        }

        summarize(values, r);
        return r;
    }

private:
    SimulationConfig cfg_;

    template <typename Rng>
    void simulate_team(const Projection& proj, bool margin, Rng& rng,
                       std::vector<double>& values, SimulationResult& r) const {
        std::normal_distribution<double> n01(0.0, 1.0);
        std::uniform_real_distribution<double> u01(0.0, 1.0);
        std::normal_distribution<double> ot_points(cfg_.ot_points_mean, cfg_.ot_points_std);

        const double sd_a = std::max(proj.side_a_std, cfg_.min_std);
        const double sd_b = std::max(proj.side_b_std, cfg_.min_std);
        const double rho = cfg_.correlation;
        const double shared_w = std::sqrt(std::abs(rho));
        const double own_w = std::sqrt(1.0 - std::abs(rho));
        const double sign = rho < 0.0 ? -1.0 : 1.0;
        const double chol = std::sqrt(1.0 - rho * rho);

        for (int i = 0; i < cfg_.n_sims; ++i) {
            double za;
            double zb;
            if (cfg_.skew_normal) {
                // Shared plus independent components keep each marginal skewed.
                double c = sim_util::skew_normal_std(rng, cfg_.skewness);
                double ea = sim_util::skew_normal_std(rng, cfg_.skewness);
                double eb = sim_util::skew_normal_std(rng, cfg_.skewness);
                za = shared_w * c + own_w * ea;
                zb = sign * shared_w * c + own_w * eb;
            } else {
                double z1 = n01(rng);
                double z2 = n01(rng);
                za = z1;
                zb = rho * z1 + chol * z2;
            }
            double a = std::max(cfg_.score_floor, proj.side_a_mean + sd_a * za);
            double b = std::max(cfg_.score_floor, proj.side_b_mean + sd_b * zb);

            if (margin) {
                values.push_back(a - b);
                continue;
            }
            double total = a + b;
            if (u01(rng) < cfg_.ot_probability) {
                total += std::max(0.0, ot_points(rng));
                ++r.extreme_events;
            }
            values.push_back(total);
        }
    }

    template <typename Rng>
    void simulate_prop(const Projection& proj, Rng& rng, std::vector<double>& values,
                       SimulationResult& r) const {
        std::normal_distribution<double> n01(0.0, 1.0);
        std::uniform_real_distribution<double> u01(0.0, 1.0);
        std::gamma_distribution<double> overdispersion(10.0, 0.1);

        const double mean = std::max(proj.point_estimate, 0.0);
        const double sd = std::max({proj.side_a_std, 0.15 * mean, 1.0});
        const double minutes_mean = proj.minutes_mean > 0.0 ? proj.minutes_mean : 32.0;
        const double minutes_std = proj.minutes_std > 0.0 ? proj.minutes_std : 5.0;
        const bool counting = sim_util::is_counting_stat(proj.stat_type);
        const bool threes = sim_util::is_three_point_stat(proj.stat_type);

        for (int i = 0; i < cfg_.n_sims; ++i) {
            bool dnp = u01(rng) < cfg_.dnp_probability;
            bool blowout = u01(rng) < cfg_.blowout_probability;
            double minutes = std::max(0.0, minutes_mean + minutes_std * n01(rng));
            if (blowout) minutes *= cfg_.blowout_minutes_factor;
            minutes = std::min(minutes, cfg_.max_minutes);
            if (dnp) {
                minutes = 0.0;
                ++r.extreme_events;
            } else if (blowout) {
                ++r.blowout_events;
            }

            double factor = minutes / minutes_mean;
            double value = 0.0;
            if (minutes > 0.0) {
                if (counting) {
                    double rate = mean * factor;
                    if (threes) rate *= overdispersion(rng);
                    if (rate > 0.0) {
                        std::poisson_distribution<int> pois(rate);
                        value = static_cast<double>(pois(rng));
                    }
                } else {
                    value = std::max(0.0, mean * factor + sd * std::sqrt(factor) * n01(rng));
                }
            }
            values.push_back(value);
        }
    }

    void summarize(std::vector<double>& values, SimulationResult& r) const {
        const int n = static_cast<int>(values.size());
        int over = 0;
        int under = 0;
        double sum = 0.0;
        for (double v : values) {
            if (v > r.threshold) ++over;
            else if (v < r.threshold) ++under;
            sum += v;
        }
        int push = n - over - under;
        r.p_over = static_cast<double>(over) / n;
        r.p_under = static_cast<double>(under) / n;
        r.p_push = static_cast<double>(push) / n;

        r.se_over = sim_util::binomial_se(r.p_over, n);
        r.se_under = sim_util::binomial_se(r.p_under, n);
        r.ci95_over_low = std::max(0.0, r.p_over - 1.96 * r.se_over);
        r.ci95_over_high = std::min(1.0, r.p_over + 1.96 * r.se_over);
        r.ci95_under_low = std::max(0.0, r.p_under - 1.96 * r.se_under);
        r.ci95_under_high = std::min(1.0, r.p_under + 1.96 * r.se_under);

        r.mean = sum / n;
        double ss = 0.0;
        for (double v : values) ss += (v - r.mean) * (v - r.mean);
        r.std_dev = std::sqrt(ss / n);

        std::sort(values.begin(), values.end());
        r.min = values.front();
        r.max = values.back();
        r.percentiles.p5 = sim_util::percentile(values, 5);
        r.percentiles.p10 = sim_util::percentile(values, 10);
        r.percentiles.p25 = sim_util::percentile(values, 25);
        r.percentiles.p50 = sim_util::percentile(values, 50);
        r.percentiles.p75 = sim_util::percentile(values, 75);
        r.percentiles.p90 = sim_util::percentile(values, 90);
        r.percentiles.p95 = sim_util::percentile(values, 95);
        r.median = r.percentiles.p50;
        r.extreme_rate = static_cast<double>(r.extreme_events) / n;
    }
};
