// ledger_export.cpp - export the wager ledger for offline analysis
//
// Writes one ledger table (wagers, calibration or rules) to .csv or
// .parquet (ZSTD), chosen by the output file extension.
//
// Usage: ./ledger_export --ledger <db> --table wagers --output wagers.parquet

#include "ledger/export_table.hpp"
#include "ledger/parquet_writer.hpp"
#include "ledger/wager_store.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --ledger <db> --output <path> [options]\n"
              << "\n"
              << "  --ledger     SQLite wager ledger\n"
              << "  --table      wagers (default), calibration, rules\n"
              << "  --settled    Export settled wagers only\n"
              << "  --trace      Include the JSON reasoning trace column\n"
              << "  --output     Output file path (.csv or .parquet)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    std::string ledger_path;
    std::string output_path;
    std::string table_name = "wagers";
    bool settled_only = false;
    bool with_trace = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--ledger" && i + 1 < argc) {
            ledger_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--table" && i + 1 < argc) {
            table_name = argv[++i];
        } else if (arg == "--settled") {
            settled_only = true;
        } else if (arg == "--trace") {
            with_trace = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (ledger_path.empty()) {
        std::cerr << "Missing required argument: --ledger\n";
        print_usage(argv[0]);
        return 1;
    }
    if (output_path.empty()) {
        std::cerr << "Missing required argument: --output\n";
        print_usage(argv[0]);
        return 1;
    }

    // Detect output format by file extension
    bool use_parquet = false;
    {
        std::string ext = std::filesystem::path(output_path).extension().string();
        if (ext == ".parquet") {
            use_parquet = true;
        } else if (ext != ".csv") {
            std::cerr << "Unsupported output format. Use .csv or .parquet extension.\n";
            return 1;
        }
    }

    try {
        WagerStore store(ledger_path);
        ExportTable table;
        if (table_name == "wagers") {
            WagerQuery q;
            if (settled_only) q.settled = true;
            auto wagers = store.find(q);
            table = ledger_export::wagers_table(wagers, with_trace);
        } else if (table_name == "calibration") {
            table = ledger_export::calibration_table(store.calibration());
        } else if (table_name == "rules") {
            table = ledger_export::rules_table(store.all_rules());
        } else {
            std::cerr << "Unknown table: '" << table_name << "'\n";
            print_usage(argv[0]);
            return 1;
        }

        if (use_parquet) {
            ledger_export::write_parquet(table, output_path);
        } else {
            ledger_export::write_csv(table, output_path);
        }
        std::cout << "Exported " << table.rows() << " " << table.name << " rows to "
                  << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
