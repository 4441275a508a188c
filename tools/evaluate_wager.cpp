// evaluate_wager.cpp - evaluate one proposed wager against a CSV data directory
//
// Runs the full pipeline (context, projection, simulation, edge, debate,
// judge), prints a summary and optionally writes the JSON result and records
// BET/LEAN decisions in a ledger.
//
// Usage: ./evaluate_wager --data <dir> --type total --a BOS --b MIA --line 220.5

#include "data/csv_data_access.hpp"
#include "ledger/wager_store.hpp"
#include "odds/odds.hpp"
#include "pipeline/orchestrator.hpp"
#include "pipeline/trace_io.hpp"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --data <dir> --type <total|spread|moneyline|prop> --a <side> --b <side> [options]\n"
              << "\n"
              << "  --data        Directory of CSV tables\n"
              << "  --type        Bet type: total, spread, moneyline, prop\n"
              << "  --a           Team A, or the player for props\n"
              << "  --b           Team B, or the player's opponent for props\n"
              << "  --stat        Prop stat (points, rebounds, assists, threes, ...)\n"
              << "  --line        Line; spreads are quoted for side A\n"
              << "  --pick        over, under, side, opponent (default: best EV)\n"
              << "  --price-a     Price of OVER / side A\n"
              << "  --price-b     Price of UNDER / side B\n"
              << "  --odds-format decimal (default) or american\n"
              << "  --event       Event id\n"
              << "  --date        Event date YYYY-MM-DD\n"
              << "  --depth       quick, standard (default), deep\n"
              << "  --seed        RNG seed for reproducible simulation\n"
              << "  --retries     Maximum context retries (default 2)\n"
              << "  --skew        Use the skew-normal scoring model\n"
              << "  --ledger      SQLite ledger; BET and LEAN decisions are recorded\n"
              << "  --json        Write the full result as JSON\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string data_dir;
    std::string ledger_path;
    std::string json_path;
    std::string odds_format = "decimal";
    std::string price_a_str;
    std::string price_b_str;
    EvaluationRequest req;
    OrchestratorConfig cfg;
    bool have_type = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--data" && i + 1 < argc) {
                data_dir = argv[++i];
            } else if (arg == "--type" && i + 1 < argc) {
                req.bet_type = parse_bet_type(argv[++i]);
                have_type = true;
            } else if (arg == "--a" && i + 1 < argc) {
                req.side_a = argv[++i];
            } else if (arg == "--b" && i + 1 < argc) {
                req.side_b = argv[++i];
            } else if (arg == "--stat" && i + 1 < argc) {
                req.stat_type = argv[++i];
            } else if (arg == "--line" && i + 1 < argc) {
                req.line = std::stod(argv[++i]);
            } else if (arg == "--pick" && i + 1 < argc) {
                req.pick = parse_pick(argv[++i]);
            } else if (arg == "--price-a" && i + 1 < argc) {
                price_a_str = argv[++i];
            } else if (arg == "--price-b" && i + 1 < argc) {
                price_b_str = argv[++i];
            } else if (arg == "--odds-format" && i + 1 < argc) {
                odds_format = argv[++i];
            } else if (arg == "--event" && i + 1 < argc) {
                req.event_id = argv[++i];
            } else if (arg == "--date" && i + 1 < argc) {
                req.date = argv[++i];
            } else if (arg == "--depth" && i + 1 < argc) {
                req.depth = parse_depth(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                req.seed = std::stoull(argv[++i]);
            } else if (arg == "--retries" && i + 1 < argc) {
                cfg.max_retries = std::stoi(argv[++i]);
            } else if (arg == "--skew") {
                cfg.simulation.skew_normal = true;
            } else if (arg == "--ledger" && i + 1 < argc) {
                ledger_path = argv[++i];
            } else if (arg == "--json" && i + 1 < argc) {
                json_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        if (!price_a_str.empty()) req.price_a = odds::to_decimal(std::stod(price_a_str), odds_format);
        if (!price_b_str.empty()) req.price_b = odds::to_decimal(std::stod(price_b_str), odds_format);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (data_dir.empty() || !have_type || req.side_a.empty() || req.side_b.empty()) {
        std::cerr << "Missing required argument: --data, --type, --a and --b are required\n";
        print_usage(argv[0]);
        return 1;
    }
    if (req.bet_type == BetType::PLAYER_PROP && req.stat_type.empty()) {
        std::cerr << "Missing required argument: --stat for prop wagers\n";
        return 1;
    }

    std::unique_ptr<CsvDataAccess> data;
    std::unique_ptr<WagerStore> store;
    try {
        data = std::make_unique<CsvDataAccess>(data_dir);
        if (!ledger_path.empty()) store = std::make_unique<WagerStore>(ledger_path);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    std::cout << "=== Wager Evaluation ===\n\n";
    std::cout << bet_type_str(req.bet_type) << ": " << req.side_a << " vs " << req.side_b;
    if (!req.stat_type.empty()) std::cout << " (" << req.stat_type << ")";
    std::cout << "  depth=" << depth_str(req.depth) << "\n\n";

    Orchestrator orch(*data, store.get(), cfg);
    EvaluationResult r = orch.evaluate(req);

    std::cout << "State: " << pipeline_state_str(r.state)
              << "  attempts=" << r.attempts << "  retries=" << r.retries
              << "  quality=" << data_quality_str(r.quality) << "\n";

    if (r.projection && !r.projection->skipped) {
        const auto& p = *r.projection;
        std::printf("\nProjection: %.2f (base %.2f)\n", p.point_estimate, p.base_estimate);
        for (const auto& a : p.adjustments)
            std::printf("  %-18s %+7.2f  %s\n", a.label.c_str(), a.magnitude, a.rationale.c_str());
    }
    if (r.simulation) {
        const auto& s = *r.simulation;
        std::printf("\nSimulation (%d sims, %s): line %.1f\n", s.n_sims,
                    distribution_str(s.distribution), s.line);
        std::printf("  P(over/side)   %.4f  +/- %.4f\n", s.p_over, s.se_over);
        std::printf("  P(under/opp)   %.4f  +/- %.4f\n", s.p_under, s.se_under);
        std::printf("  P(push)        %.4f\n", s.p_push);
        std::printf("  mean %.2f  median %.2f  std %.2f  p5 %.1f  p95 %.1f\n",
                    s.mean, s.median, s.std_dev, s.percentiles.p5, s.percentiles.p95);
    }
    if (r.scenarios) {
        std::printf("\nScenarios: %s (spread %.3f)\n",
                    r.scenarios->stable ? "stable" : "unstable", r.scenarios->p_under_spread);
    }
    if (r.sensitivity) {
        const auto& s = *r.sensitivity;
        std::printf("Sensitivity dP(under)/d: mean_a %+.4f  mean_b %+.4f  std_a %+.4f  std_b %+.4f\n",
                    s.d_p_under_d_mean_a, s.d_p_under_d_mean_b, s.d_p_under_d_std_a,
                    s.d_p_under_d_std_b);
    }
    if (r.edge && r.pick) {
        const auto& e = r.edge->side(*r.pick);
        std::printf("\nEdge (%s @ %.3f): model %.4f  implied %.4f  edge %+.4f  EV %+.4f  kelly %.4f  %s\n",
                    pick_str(*r.pick), e.decimal_odds, e.model_probability, e.implied_probability,
                    e.edge, e.expected_value, e.kelly_fraction, tier_str(e.tier));
    }
    if (r.debate) {
        std::cout << "\nDebate:\n" << r.debate->transcript;
    }

    std::printf("\nRecommendation: %s  confidence %.2f  stake %.4f\n",
                recommendation_str(r.recommendation), r.confidence, r.stake);
    for (const auto& issue : r.issues)
        std::cout << "  ISSUE " << issue_code_str(issue.code) << ": " << issue.detail << "\n";
    for (const auto& err : r.errors)
        std::cerr << "  SKIP: " << err << "\n";
    if (r.wager_id) std::cout << "Recorded wager #" << *r.wager_id << " in " << ledger_path << "\n";

    if (!json_path.empty()) {
        std::ofstream out(json_path);
        if (!out.is_open()) {
            std::cerr << "ERROR: Cannot open output file: " << json_path << "\n";
            return 1;
        }
        out << trace_io::to_json(r) << "\n";
        std::cout << "Wrote " << json_path << "\n";
    }
    return 0;
}
