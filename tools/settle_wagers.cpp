// settle_wagers.cpp - settle open wagers against realized results
//
// Grades every unsettled wager in the ledger that has a final result in the
// CSV data directory, updates calibration buckets, optionally runs pattern
// analysis to append learning rules, and prints the calibration report.
//
// Usage: ./settle_wagers --data <dir> --ledger <db> [--analyze] [--json <path>]

#include "data/csv_data_access.hpp"
#include "ledger/pattern_analysis.hpp"
#include "ledger/settlement.hpp"
#include "ledger/wager_store.hpp"
#include "pipeline/trace_io.hpp"

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

// ===========================================================================
// Calibration report
// ===========================================================================
void print_calibration(const std::vector<CalibrationBucket>& buckets) {
    std::cout << "\n=== Calibration ===\n\n";
    std::printf("  %-8s %7s %6s %6s %6s %9s %8s\n",
                "Bucket", "Total", "Wins", "Losses", "Pushes", "Actual%", "Error%");
    int total = 0;
    int wins = 0;
    int losses = 0;
    for (const auto& b : buckets) {
        char actual[16] = "N/A";
        char error[16] = "N/A";
        if (b.realized_win_rate) std::snprintf(actual, sizeof(actual), "%.1f", *b.realized_win_rate * 100.0);
        if (b.calibration_error) std::snprintf(error, sizeof(error), "%.1f", *b.calibration_error * 100.0);
        std::printf("  %3d%%     %7d %6d %6d %6d %9s %8s\n",
                    b.bucket, b.total, b.wins, b.losses, b.pushes, actual, error);
        total += b.total;
        wins += b.wins;
        losses += b.losses;
    }
    if (wins + losses > 0) {
        std::printf("\n  Overall: %d/%d decisive (%.1f%%), %d settled\n",
                    wins, wins + losses, 100.0 * wins / (wins + losses), total);
    }
}

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --data <dir> --ledger <db> [options]\n"
              << "\n"
              << "  --data      Directory of CSV tables with results\n"
              << "  --ledger    SQLite wager ledger\n"
              << "  --analyze   Run pattern analysis after settling\n"
              << "  --json      Write the settlement report as JSON\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string data_dir;
    std::string ledger_path;
    std::string json_path;
    bool analyze = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--data" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "--ledger" && i + 1 < argc) {
            ledger_path = argv[++i];
        } else if (arg == "--json" && i + 1 < argc) {
            json_path = argv[++i];
        } else if (arg == "--analyze") {
            analyze = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    if (data_dir.empty() || ledger_path.empty()) {
        std::cerr << "Missing required argument: --data and --ledger are required\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        CsvDataAccess data(data_dir);
        WagerStore store(ledger_path);

        std::cout << "=== Settlement ===\n\n";
        SettlementReport report = SettlementPass(store, data).run();
        std::printf("  Examined %d, settled %d (W %d / L %d / P %d), profit %+.2f units\n",
                    report.examined, report.settled, report.wins, report.losses,
                    report.pushes, report.profit);
        if (report.already_settled > 0)
            std::printf("  %d settled concurrently by another pass\n", report.already_settled);
        for (const auto& u : report.unresolved)
            std::cerr << "  SKIP: wager #" << u.wager_id << ": " << u.reason << "\n";

        std::string json = trace_io::to_json(report);
        if (analyze) {
            PatternReport patterns = PatternAnalyzer(store).run();
            std::cout << "\n=== Pattern Analysis (thresholds v" << patterns.thresholds_version
                      << ") ===\n\n";
            std::cout << "  Settled wagers examined: " << patterns.settled_examined << "\n";
            for (const auto& rule : patterns.created)
                std::printf("  NEW RULE #%lld %s -> %+.2f  (%s)\n",
                            static_cast<long long>(rule.id), rule.description.c_str(),
                            rule.adjustment, rule.evidence.c_str());
            for (const auto& rule : patterns.skipped)
                std::cout << "  already active: " << rule.description << "\n";
            if (!patterns.high_confidence_losses.empty()) {
                std::cout << "\n  High-confidence losses:\n";
                for (const auto& w : patterns.high_confidence_losses)
                    std::printf("    #%lld %-28s conf %.2f edge %+.3f\n",
                                static_cast<long long>(w.id), w.selection.c_str(),
                                w.confidence, w.predicted_edge);
            }
            json = "{\"settlement\":" + json + ",\"patterns\":" + trace_io::to_json(patterns) + "}";
        }

        print_calibration(store.calibration());

        if (!json_path.empty()) {
            std::ofstream out(json_path);
            if (!out.is_open()) {
                std::cerr << "ERROR: Cannot open output file: " << json_path << "\n";
                return 1;
            }
            out << json << "\n";
            std::cout << "\nWrote " << json_path << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
