#pragma once

#include "ledger/wager.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Thin RAII layer over the sqlite3 C API
// ---------------------------------------------------------------------------
namespace ledger_sql {

struct ConnectionCloser {
    void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
};
using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int i, int64_t v) { check(sqlite3_bind_int64(stmt_, i, v)); return *this; }
    Statement& bind(int i, int v) { check(sqlite3_bind_int(stmt_, i, v)); return *this; }
    Statement& bind(int i, double v) { check(sqlite3_bind_double(stmt_, i, v)); return *this; }
    Statement& bind(int i, const std::string& v) {
        check(sqlite3_bind_text(stmt_, i, v.c_str(), -1, SQLITE_TRANSIENT));
        return *this;
    }
    Statement& bind_null(int i) { check(sqlite3_bind_null(stmt_, i)); return *this; }

    // True while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {}
    }

    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    int integer(int col) const { return sqlite3_column_int(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    std::optional<double> opt_real(int col) const {
        if (is_null(col)) return std::nullopt;
        return real(col);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK)
            throw std::runtime_error(std::string("SQLite bind failed: ") + sqlite3_errmsg(db_));
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

inline void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

// Holds the database write lock from BEGIN IMMEDIATE until commit or
// rollback. Rolls back on destruction unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE"); }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

constexpr const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS wagers (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    event_id TEXT NOT NULL,
    event_date TEXT,
    bet_type TEXT NOT NULL CHECK (bet_type IN ('SPREAD','TOTAL','PLAYER_PROP','MONEYLINE')),
    pick TEXT NOT NULL CHECK (pick IN ('OVER','UNDER','SIDE','OPPONENT')),
    selection TEXT NOT NULL,
    subject_id TEXT,
    stat_type TEXT,
    line REAL NOT NULL,
    decimal_odds REAL NOT NULL CHECK (decimal_odds > 1.0),
    confidence REAL NOT NULL CHECK (confidence >= 0.0 AND confidence <= 1.0),
    predicted_edge REAL NOT NULL,
    stake REAL NOT NULL DEFAULT 0,
    debate_winner TEXT NOT NULL DEFAULT 'NEUTRAL',
    depth TEXT NOT NULL DEFAULT 'standard' CHECK (depth IN ('quick','standard','deep')),
    reasoning_trace TEXT,
    outcome TEXT CHECK (outcome IN ('WIN','LOSS','PUSH')),
    realized_value REAL,
    realized_margin REAL,
    profit REAL,
    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ','now')),
    settled_at TEXT
);
CREATE INDEX IF NOT EXISTS idx_wagers_outcome ON wagers(outcome);
CREATE INDEX IF NOT EXISTS idx_wagers_event ON wagers(event_id);
CREATE INDEX IF NOT EXISTS idx_wagers_confidence ON wagers(confidence);

CREATE TABLE IF NOT EXISTS calibration_buckets (
    bucket INTEGER PRIMARY KEY,
    total INTEGER NOT NULL DEFAULT 0,
    wins INTEGER NOT NULL DEFAULT 0,
    losses INTEGER NOT NULL DEFAULT 0,
    pushes INTEGER NOT NULL DEFAULT 0,
    realized_win_rate REAL,
    calibration_error REAL,
    updated_at TEXT
);
INSERT OR IGNORE INTO calibration_buckets (bucket) VALUES (40), (50), (60), (70), (80);

CREATE TABLE IF NOT EXISTS learning_rules (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    condition_kind TEXT NOT NULL,
    bet_type TEXT,
    pick TEXT,
    threshold REAL NOT NULL DEFAULT 0,
    description TEXT NOT NULL,
    adjustment REAL NOT NULL,
    evidence TEXT,
    trigger_count INTEGER NOT NULL DEFAULT 0,
    sample_size INTEGER NOT NULL DEFAULT 0,
    loss_rate REAL NOT NULL DEFAULT 0,
    thresholds_version INTEGER NOT NULL DEFAULT 0,
    active INTEGER NOT NULL DEFAULT 1,
    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ','now')),
    deactivated_at TEXT
);
)SQL";

constexpr const char* WAGER_COLUMNS =
    "id, event_id, event_date, bet_type, pick, selection, subject_id, stat_type, line, "
    "decimal_odds, confidence, predicted_edge, stake, debate_winner, depth, reasoning_trace, "
    "outcome, realized_value, realized_margin, profit, created_at, settled_at";

constexpr const char* RULE_COLUMNS =
    "id, condition_kind, bet_type, pick, threshold, description, adjustment, evidence, "
    "trigger_count, sample_size, loss_rate, thresholds_version, active, created_at";

}  // namespace ledger_sql

// ---------------------------------------------------------------------------
// Query shapes
// ---------------------------------------------------------------------------
struct WagerQuery {
    std::optional<BetType> bet_type;
    std::optional<std::string> event_id;
    std::optional<std::string> selection_like;  // SQL LIKE pattern
    std::optional<double> min_confidence;
    std::optional<double> max_confidence;
    std::optional<bool> settled;
    int limit = 0;  // 0 = unlimited
};

struct HistoricalPerformance {
    bool found = false;  // at least min_samples settled wagers
    int samples = 0;
    int wins = 0;
    int losses = 0;
    int pushes = 0;
    double win_rate = 0.0;
    double total_profit = 0.0;
};

// ---------------------------------------------------------------------------
// WagerStore - the durable ledger. Owns its connection; every write that
// touches more than one row runs in a single transaction. Safe to share
// between threads.
// ---------------------------------------------------------------------------
class WagerStore {
public:
    explicit WagerStore(const std::string& path) {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        db_.reset(raw);
        if (rc != SQLITE_OK) {
            std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
            throw std::runtime_error("Failed to open wager ledger at " + path + ": " + msg);
        }
        sqlite3_busy_timeout(db_.get(), 5000);
        ledger_sql::exec(db_.get(), "PRAGMA foreign_keys = ON");
        ledger_sql::exec(db_.get(), ledger_sql::SCHEMA);
    }

    int64_t insert_wager(const Wager& w) {
        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Statement st(db_.get(), R"SQL(
            INSERT INTO wagers (event_id, event_date, bet_type, pick, selection, subject_id,
                                stat_type, line, decimal_odds, confidence, predicted_edge, stake,
                                debate_winner, depth, reasoning_trace)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )SQL");
        st.bind(1, w.event_id)
          .bind(2, w.event_date)
          .bind(3, std::string(bet_type_str(w.bet_type)))
          .bind(4, std::string(pick_str(w.pick)))
          .bind(5, w.selection)
          .bind(6, w.subject_id)
          .bind(7, w.stat_type)
          .bind(8, w.line)
          .bind(9, w.decimal_odds)
          .bind(10, w.confidence)
          .bind(11, w.predicted_edge)
          .bind(12, w.stake)
          .bind(13, std::string(debate_winner_str(w.debate_winner)))
          .bind(14, w.depth)
          .bind(15, w.reasoning_trace);
        st.run();
        return sqlite3_last_insert_rowid(db_.get());
    }

    std::optional<Wager> get_wager(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        std::string sql = std::string("SELECT ") + ledger_sql::WAGER_COLUMNS + " FROM wagers WHERE id = ?";
        ledger_sql::Statement st(db_.get(), sql.c_str());
        st.bind(1, id);
        if (!st.step()) return std::nullopt;
        return read_wager(st);
    }

    std::vector<Wager> find(const WagerQuery& q) {
        std::string sql = std::string("SELECT ") + ledger_sql::WAGER_COLUMNS + " FROM wagers WHERE 1 = 1";
        if (q.bet_type) sql += " AND bet_type = ?";
        if (q.event_id) sql += " AND event_id = ?";
        if (q.selection_like) sql += " AND selection LIKE ?";
        if (q.min_confidence) sql += " AND confidence >= ?";
        if (q.max_confidence) sql += " AND confidence <= ?";
        if (q.settled) sql += *q.settled ? " AND outcome IS NOT NULL" : " AND outcome IS NULL";
        sql += " ORDER BY id DESC";
        if (q.limit > 0) sql += " LIMIT " + std::to_string(q.limit);

        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Statement st(db_.get(), sql.c_str());
        int i = 1;
        if (q.bet_type) st.bind(i++, std::string(bet_type_str(*q.bet_type)));
        if (q.event_id) st.bind(i++, *q.event_id);
        if (q.selection_like) st.bind(i++, *q.selection_like);
        if (q.min_confidence) st.bind(i++, *q.min_confidence);
        if (q.max_confidence) st.bind(i++, *q.max_confidence);

        std::vector<Wager> out;
        while (st.step()) out.push_back(read_wager(st));
        return out;
    }

    std::vector<Wager> unsettled() {
        WagerQuery q;
        q.settled = false;
        auto rows = find(q);
        std::reverse(rows.begin(), rows.end());
        return rows;
    }

    std::vector<Wager> settled() {
        WagerQuery q;
        q.settled = true;
        auto rows = find(q);
        std::reverse(rows.begin(), rows.end());
        return rows;
    }

    std::vector<Wager> recent(int n) {
        WagerQuery q;
        q.limit = n;
        return find(q);
    }

    // Records the outcome and updates the wager's calibration bucket in one
    // transaction. Returns false when the wager is missing or already
    // settled; the bucket is then left untouched.
    bool settle(int64_t id, const SettlementOutcome& s) {
        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Transaction tx(db_.get());

        double confidence = 0.0;
        {
            ledger_sql::Statement st(db_.get(), "SELECT confidence FROM wagers WHERE id = ? AND outcome IS NULL");
            st.bind(1, id);
            if (!st.step()) return false;
            confidence = st.real(0);
        }
        {
            ledger_sql::Statement st(db_.get(), R"SQL(
                UPDATE wagers
                SET outcome = ?, realized_value = ?, realized_margin = ?, profit = ?,
                    settled_at = strftime('%Y-%m-%dT%H:%M:%fZ','now')
                WHERE id = ? AND outcome IS NULL
            )SQL");
            st.bind(1, std::string(outcome_str(s.outcome)))
              .bind(2, s.realized_value)
              .bind(3, s.realized_margin)
              .bind(4, s.profit)
              .bind(5, id);
            st.run();
            if (sqlite3_changes(db_.get()) != 1) return false;
        }
        {
            ledger_sql::Statement st(db_.get(), R"SQL(
                UPDATE calibration_buckets
                SET total = total + 1, wins = wins + ?, losses = losses + ?, pushes = pushes + ?,
                    updated_at = strftime('%Y-%m-%dT%H:%M:%fZ','now')
                WHERE bucket = ?
            )SQL");
            st.bind(1, s.outcome == Outcome::WIN ? 1 : 0)
              .bind(2, s.outcome == Outcome::LOSS ? 1 : 0)
              .bind(3, s.outcome == Outcome::PUSH ? 1 : 0)
              .bind(4, calibration_bucket_for(confidence));
            st.run();
        }
        {
            ledger_sql::Statement st(db_.get(), R"SQL(
                UPDATE calibration_buckets
                SET realized_win_rate = CASE WHEN wins + losses > 0
                        THEN CAST(wins AS REAL) / (wins + losses) END,
                    calibration_error = CASE WHEN wins + losses > 0
                        THEN ABS(bucket / 100.0 - CAST(wins AS REAL) / (wins + losses)) END
                WHERE bucket = ?
            )SQL");
            st.bind(1, calibration_bucket_for(confidence));
            st.run();
        }
        tx.commit();
        return true;
    }

    std::vector<CalibrationBucket> calibration() {
        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Statement st(db_.get(), R"SQL(
            SELECT bucket, total, wins, losses, pushes, realized_win_rate, calibration_error
            FROM calibration_buckets ORDER BY bucket
        )SQL");
        std::vector<CalibrationBucket> out;
        while (st.step()) {
            CalibrationBucket b;
            b.bucket = st.integer(0);
            b.total = st.integer(1);
            b.wins = st.integer(2);
            b.losses = st.integer(3);
            b.pushes = st.integer(4);
            b.realized_win_rate = st.opt_real(5);
            b.calibration_error = st.opt_real(6);
            out.push_back(b);
        }
        return out;
    }

    HistoricalPerformance historical_performance(const std::string& selection_like,
                                                 int min_samples = 3) {
        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Statement st(db_.get(), R"SQL(
            SELECT COUNT(*),
                   COALESCE(SUM(outcome = 'WIN'), 0),
                   COALESCE(SUM(outcome = 'LOSS'), 0),
                   COALESCE(SUM(outcome = 'PUSH'), 0),
                   COALESCE(SUM(profit), 0.0)
            FROM wagers WHERE outcome IS NOT NULL AND selection LIKE ?
        )SQL");
        st.bind(1, selection_like);
        HistoricalPerformance h;
        if (st.step()) {
            h.samples = st.integer(0);
            h.wins = st.integer(1);
            h.losses = st.integer(2);
            h.pushes = st.integer(3);
            h.total_profit = st.real(4);
        }
        if (h.wins + h.losses > 0)
            h.win_rate = static_cast<double>(h.wins) / (h.wins + h.losses);
        h.found = h.samples >= min_samples;
        return h;
    }

    // Appends a rule unless an active rule with the same condition exists.
    // Returns the new id, or 0 when skipped.
    int64_t insert_rule(const LearningRule& r) {
        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Transaction tx(db_.get());
        {
            ledger_sql::Statement st(db_.get(), R"SQL(
                SELECT id FROM learning_rules
                WHERE active = 1 AND condition_kind = ?
                  AND COALESCE(bet_type, '') = ? AND COALESCE(pick, '') = ?
                  AND ABS(threshold - ?) < 1e-9
            )SQL");
            st.bind(1, std::string(rule_condition_str(r.condition)))
              .bind(2, std::string(r.bet_type ? bet_type_str(*r.bet_type) : ""))
              .bind(3, std::string(r.pick ? pick_str(*r.pick) : ""))
              .bind(4, r.threshold);
            if (st.step()) return 0;
        }
        int64_t id = 0;
        {
            ledger_sql::Statement st(db_.get(), R"SQL(
                INSERT INTO learning_rules (condition_kind, bet_type, pick, threshold, description,
                                            adjustment, evidence, sample_size, loss_rate,
                                            thresholds_version, active)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            )SQL");
            st.bind(1, std::string(rule_condition_str(r.condition)));
            if (r.bet_type) st.bind(2, std::string(bet_type_str(*r.bet_type))); else st.bind_null(2);
            if (r.pick) st.bind(3, std::string(pick_str(*r.pick))); else st.bind_null(3);
            st.bind(4, r.threshold)
              .bind(5, r.description)
              .bind(6, r.adjustment)
              .bind(7, r.evidence)
              .bind(8, r.sample_size)
              .bind(9, r.loss_rate)
              .bind(10, r.thresholds_version)
              .bind(11, r.active ? 1 : 0);
            st.run();
            id = sqlite3_last_insert_rowid(db_.get());
        }
        tx.commit();
        return id;
    }

    std::vector<LearningRule> active_rules() { return rules(true); }
    std::vector<LearningRule> all_rules() { return rules(false); }

    bool deactivate_rule(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Statement st(db_.get(), R"SQL(
            UPDATE learning_rules
            SET active = 0, deactivated_at = strftime('%Y-%m-%dT%H:%M:%fZ','now')
            WHERE id = ? AND active = 1
        )SQL");
        st.bind(1, id);
        st.run();
        return sqlite3_changes(db_.get()) == 1;
    }

    void record_rule_trigger(int64_t id) {
        std::lock_guard<std::mutex> lock(mu_);
        ledger_sql::Statement st(db_.get(),
            "UPDATE learning_rules SET trigger_count = trigger_count + 1 WHERE id = ?");
        st.bind(1, id);
        st.run();
    }

private:
    std::vector<LearningRule> rules(bool active_only) {
        std::lock_guard<std::mutex> lock(mu_);
        std::string sql = std::string("SELECT ") + ledger_sql::RULE_COLUMNS + " FROM learning_rules";
        if (active_only) sql += " WHERE active = 1";
        sql += " ORDER BY id";
        ledger_sql::Statement st(db_.get(), sql.c_str());
        std::vector<LearningRule> out;
        while (st.step()) {
            LearningRule r;
            r.id = st.int64(0);
            r.condition = parse_rule_condition(st.text(1));
            if (!st.is_null(2)) r.bet_type = parse_bet_type(st.text(2));
            if (!st.is_null(3)) r.pick = parse_pick(st.text(3));
            r.threshold = st.real(4);
            r.description = st.text(5);
            r.adjustment = st.real(6);
            r.evidence = st.text(7);
            r.trigger_count = st.integer(8);
            r.sample_size = st.integer(9);
            r.loss_rate = st.real(10);
            r.thresholds_version = st.integer(11);
            r.active = st.integer(12) != 0;
            r.created_at = st.text(13);
            out.push_back(std::move(r));
        }
        return out;
    }

    static Wager read_wager(const ledger_sql::Statement& st) {
        Wager w;
        w.id = st.int64(0);
        w.event_id = st.text(1);
        w.event_date = st.text(2);
        w.bet_type = parse_bet_type(st.text(3));
        w.pick = parse_pick(st.text(4));
        w.selection = st.text(5);
        w.subject_id = st.text(6);
        w.stat_type = st.text(7);
        w.line = st.real(8);
        w.decimal_odds = st.real(9);
        w.confidence = st.real(10);
        w.predicted_edge = st.real(11);
        w.stake = st.real(12);
        w.debate_winner = parse_debate_winner(st.text(13));
        w.depth = st.text(14);
        w.reasoning_trace = st.text(15);
        if (!st.is_null(16)) w.outcome = parse_outcome(st.text(16));
        w.realized_value = st.opt_real(17);
        w.realized_margin = st.opt_real(18);
        w.profit = st.opt_real(19);
        w.created_at = st.text(20);
        w.settled_at = st.text(21);
        return w;
    }

    ledger_sql::Connection db_;
    std::mutex mu_;
};
