#pragma once

#include "ledger/wager.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ExportTable - column-major snapshot of a ledger table, written as CSV here
// or as Parquet by parquet_writer.hpp. Missing values are tracked per cell.
// ---------------------------------------------------------------------------
enum class ColumnType { INT64, DOUBLE, STRING };

struct Column {
    std::string name;
    ColumnType type = ColumnType::DOUBLE;
    std::vector<int64_t> ints;
    std::vector<double> reals;
    std::vector<std::string> texts;
    std::vector<bool> valid;

    size_t size() const { return valid.size(); }
};

struct ExportTable {
    std::string name;
    std::vector<Column> columns;

    size_t rows() const { return columns.empty() ? 0 : columns.front().size(); }
    const Column* find(const std::string& col) const {
        for (const auto& c : columns)
            if (c.name == col) return &c;
        return nullptr;
    }
};

namespace ledger_export {

template <typename Row, typename F>
Column int_column(const std::string& name, const std::vector<Row>& rows, F get) {
    Column c{name, ColumnType::INT64, {}, {}, {}, {}};
    for (const auto& r : rows) {
        std::optional<int64_t> v = get(r);
        c.ints.push_back(v.value_or(0));
        c.valid.push_back(v.has_value());
    }
    return c;
}

template <typename Row, typename F>
Column real_column(const std::string& name, const std::vector<Row>& rows, F get) {
    Column c{name, ColumnType::DOUBLE, {}, {}, {}, {}};
    for (const auto& r : rows) {
        std::optional<double> v = get(r);
        c.reals.push_back(v.value_or(0.0));
        c.valid.push_back(v.has_value());
    }
    return c;
}

template <typename Row, typename F>
Column text_column(const std::string& name, const std::vector<Row>& rows, F get) {
    Column c{name, ColumnType::STRING, {}, {}, {}, {}};
    for (const auto& r : rows) {
        std::optional<std::string> v = get(r);
        c.texts.push_back(v.value_or(std::string()));
        c.valid.push_back(v.has_value());
    }
    return c;
}

// Reasoning traces are left out unless asked for; they dominate file size.
inline ExportTable wagers_table(const std::vector<Wager>& wagers, bool with_trace = false) {
    using W = Wager;
    using OptText = std::optional<std::string>;
    ExportTable t;
    t.name = "wagers";
    t.columns.push_back(int_column("id", wagers, [](const W& w) { return std::optional<int64_t>(w.id); }));
    t.columns.push_back(text_column("event_id", wagers, [](const W& w) { return OptText(w.event_id); }));
    t.columns.push_back(text_column("event_date", wagers, [](const W& w) { return OptText(w.event_date); }));
    t.columns.push_back(text_column("bet_type", wagers, [](const W& w) { return OptText(bet_type_str(w.bet_type)); }));
    t.columns.push_back(text_column("pick", wagers, [](const W& w) { return OptText(pick_str(w.pick)); }));
    t.columns.push_back(text_column("selection", wagers, [](const W& w) { return OptText(w.selection); }));
    t.columns.push_back(text_column("subject_id", wagers, [](const W& w) { return OptText(w.subject_id); }));
    t.columns.push_back(text_column("stat_type", wagers, [](const W& w) { return OptText(w.stat_type); }));
    t.columns.push_back(real_column("line", wagers, [](const W& w) { return std::optional<double>(w.line); }));
    t.columns.push_back(real_column("decimal_odds", wagers, [](const W& w) { return std::optional<double>(w.decimal_odds); }));
    t.columns.push_back(real_column("confidence", wagers, [](const W& w) { return std::optional<double>(w.confidence); }));
    t.columns.push_back(real_column("predicted_edge", wagers, [](const W& w) { return std::optional<double>(w.predicted_edge); }));
    t.columns.push_back(real_column("stake", wagers, [](const W& w) { return std::optional<double>(w.stake); }));
    t.columns.push_back(text_column("debate_winner", wagers, [](const W& w) { return OptText(debate_winner_str(w.debate_winner)); }));
    t.columns.push_back(text_column("depth", wagers, [](const W& w) { return OptText(w.depth); }));
    t.columns.push_back(text_column("outcome", wagers, [](const W& w) {
        return w.outcome ? OptText(outcome_str(*w.outcome)) : std::nullopt;
    }));
    t.columns.push_back(real_column("realized_value", wagers, [](const W& w) { return w.realized_value; }));
    t.columns.push_back(real_column("realized_margin", wagers, [](const W& w) { return w.realized_margin; }));
    t.columns.push_back(real_column("profit", wagers, [](const W& w) { return w.profit; }));
    t.columns.push_back(text_column("created_at", wagers, [](const W& w) { return OptText(w.created_at); }));
    t.columns.push_back(text_column("settled_at", wagers, [](const W& w) {
        return w.settled_at.empty() ? std::nullopt : OptText(w.settled_at);
    }));
    if (with_trace)
        t.columns.push_back(text_column("reasoning_trace", wagers, [](const W& w) { return OptText(w.reasoning_trace); }));
    return t;
}

inline ExportTable calibration_table(const std::vector<CalibrationBucket>& buckets) {
    using B = CalibrationBucket;
    auto i64 = [](int v) { return std::optional<int64_t>(v); };
    ExportTable t;
    t.name = "calibration";
    t.columns.push_back(int_column("bucket", buckets, [&](const B& b) { return i64(b.bucket); }));
    t.columns.push_back(int_column("total", buckets, [&](const B& b) { return i64(b.total); }));
    t.columns.push_back(int_column("wins", buckets, [&](const B& b) { return i64(b.wins); }));
    t.columns.push_back(int_column("losses", buckets, [&](const B& b) { return i64(b.losses); }));
    t.columns.push_back(int_column("pushes", buckets, [&](const B& b) { return i64(b.pushes); }));
    t.columns.push_back(real_column("realized_win_rate", buckets, [](const B& b) { return b.realized_win_rate; }));
    t.columns.push_back(real_column("calibration_error", buckets, [](const B& b) { return b.calibration_error; }));
    return t;
}

inline ExportTable rules_table(const std::vector<LearningRule>& rules) {
    using R = LearningRule;
    using OptText = std::optional<std::string>;
    auto i64 = [](int64_t v) { return std::optional<int64_t>(v); };
    ExportTable t;
    t.name = "learning_rules";
    t.columns.push_back(int_column("id", rules, [&](const R& r) { return i64(r.id); }));
    t.columns.push_back(text_column("condition", rules, [](const R& r) { return OptText(rule_condition_str(r.condition)); }));
    t.columns.push_back(text_column("bet_type", rules, [](const R& r) {
        return r.bet_type ? OptText(bet_type_str(*r.bet_type)) : std::nullopt;
    }));
    t.columns.push_back(text_column("pick", rules, [](const R& r) {
        return r.pick ? OptText(pick_str(*r.pick)) : std::nullopt;
    }));
    t.columns.push_back(real_column("threshold", rules, [](const R& r) { return std::optional<double>(r.threshold); }));
    t.columns.push_back(real_column("adjustment", rules, [](const R& r) { return std::optional<double>(r.adjustment); }));
    t.columns.push_back(text_column("description", rules, [](const R& r) { return OptText(r.description); }));
    t.columns.push_back(text_column("evidence", rules, [](const R& r) { return OptText(r.evidence); }));
    t.columns.push_back(int_column("trigger_count", rules, [&](const R& r) { return i64(r.trigger_count); }));
    t.columns.push_back(int_column("sample_size", rules, [&](const R& r) { return i64(r.sample_size); }));
    t.columns.push_back(real_column("loss_rate", rules, [](const R& r) { return std::optional<double>(r.loss_rate); }));
    t.columns.push_back(int_column("thresholds_version", rules, [&](const R& r) { return i64(r.thresholds_version); }));
    t.columns.push_back(int_column("active", rules, [&](const R& r) { return i64(r.active ? 1 : 0); }));
    t.columns.push_back(text_column("created_at", rules, [](const R& r) { return OptText(r.created_at); }));
    return t;
}

inline std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

// Null cells are written empty.
inline void write_csv(const ExportTable& t, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot open output file: " + path);
    out << std::setprecision(17);

    for (size_t c = 0; c < t.columns.size(); ++c) {
        if (c > 0) out << ",";
        out << t.columns[c].name;
    }
    out << "\n";
    for (size_t r = 0; r < t.rows(); ++r) {
        for (size_t c = 0; c < t.columns.size(); ++c) {
            if (c > 0) out << ",";
            const Column& col = t.columns[c];
            if (!col.valid[r]) continue;
            switch (col.type) {
                case ColumnType::INT64:  out << col.ints[r]; break;
                case ColumnType::DOUBLE: out << col.reals[r]; break;
                case ColumnType::STRING: out << csv_field(col.texts[r]); break;
            }
        }
        out << "\n";
    }
    if (!out) throw std::runtime_error("Failed writing " + path);
}

}  // namespace ledger_export
