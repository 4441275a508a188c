#pragma once

#include "data/data_access.hpp"
#include "ledger/wager.hpp"
#include "ledger/wager_store.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Grading a single wager against the realized result
// ---------------------------------------------------------------------------
struct GradeAttempt {
    std::optional<SettlementOutcome> outcome;
    std::string unresolved_reason;
};

inline GradeAttempt grade_wager(const Wager& w, DataAccess& data) {
    GradeAttempt g;
    auto result = data.fetch_realized_result(w.event_id);
    if (!result.found()) {
        g.unresolved_reason = "result unavailable: " + result.error;
        return g;
    }
    if (!result->is_final) {
        g.unresolved_reason = "event " + w.event_id + " not final";
        return g;
    }

    switch (w.bet_type) {
        case BetType::TOTAL: {
            double total = result->home_score + result->away_score;
            g.outcome = grade_over_under(w.pick, total, w.line, w.decimal_odds);
            break;
        }
        case BetType::PLAYER_PROP: {
            auto stat = data.fetch_realized_stat(w.event_id, w.subject_id, w.stat_type);
            if (!stat.found()) {
                g.unresolved_reason = "stat unavailable: " + stat.error;
                return g;
            }
            g.outcome = grade_over_under(w.pick, *stat, w.line, w.decimal_odds);
            break;
        }
        case BetType::SPREAD:
        case BetType::MONEYLINE: {
            auto backed = result->score_of(w.subject_id);
            if (!backed) {
                g.unresolved_reason = "ambiguous result: " + w.subject_id + " not in event " + w.event_id;
                return g;
            }
            double other = w.subject_id == result->home_id ? result->away_score : result->home_score;
            double line = w.bet_type == BetType::MONEYLINE ? 0.0 : w.line;
            g.outcome = grade_cover(*backed - other, line, w.decimal_odds);
            break;
        }
    }
    return g;
}

// ---------------------------------------------------------------------------
// SettlementReport
// ---------------------------------------------------------------------------
struct UnresolvedWager {
    int64_t wager_id = 0;
    std::string reason;
};

struct SettlementReport {
    int examined = 0;
    int settled = 0;
    int wins = 0;
    int losses = 0;
    int pushes = 0;
    int already_settled = 0;  // lost a race with another pass
    double profit = 0.0;
    std::vector<UnresolvedWager> unresolved;
};

// ---------------------------------------------------------------------------
// SettlementPass - settles every open wager it can. A failure on one wager
// is recorded and the pass moves on; unresolved wagers stay open for the
// next pass.
// ---------------------------------------------------------------------------
class SettlementPass {
public:
    SettlementPass(WagerStore& store, DataAccess& data) : store_(store), data_(data) {}

    SettlementReport run() {
        SettlementReport report;
        for (const auto& w : store_.unsettled()) {
            ++report.examined;
            try {
                auto g = grade_wager(w, data_);
                if (!g.outcome) {
                    report.unresolved.push_back({w.id, g.unresolved_reason});
                    continue;
                }
                if (!store_.settle(w.id, *g.outcome)) {
                    ++report.already_settled;
                    continue;
                }
                ++report.settled;
                report.profit += g.outcome->profit;
                switch (g.outcome->outcome) {
                    case Outcome::WIN:  ++report.wins; break;
                    case Outcome::LOSS: ++report.losses; break;
                    case Outcome::PUSH: ++report.pushes; break;
                }
            } catch (const std::exception& e) {
                report.unresolved.push_back({w.id, std::string("settlement error: ") + e.what()});
            }
        }
        return report;
    }

private:
    WagerStore& store_;
    DataAccess& data_;
};
