#pragma once

#include "debate/argument.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebateConfig
// ---------------------------------------------------------------------------
struct DebateConfig {
    int top_k = 5;
    double winner_threshold = 0.1;
    double notable_support = 0.6;  // summary cut-offs
    double notable_oppose = 0.7;
    RuleThresholds thresholds;
};

enum class DebateWinner { SUPPORTING, OPPOSING, NEUTRAL };

inline const char* debate_winner_str(DebateWinner w) {
    switch (w) {
        case DebateWinner::SUPPORTING: return "SUPPORTING";
        case DebateWinner::OPPOSING:   return "OPPOSING";
        case DebateWinner::NEUTRAL:    return "NEUTRAL";
    }
    return "UNKNOWN";
}

inline DebateWinner parse_debate_winner(const std::string& s) {
    if (s == "SUPPORTING") return DebateWinner::SUPPORTING;
    if (s == "OPPOSING") return DebateWinner::OPPOSING;
    return DebateWinner::NEUTRAL;
}

struct DebateSummary {
    std::string verdict;
    std::vector<std::string> supporting_points;
    std::vector<std::string> opposing_points;
};

// ---------------------------------------------------------------------------
// DebateResult - retained verbatim in the wager's reasoning trace
// ---------------------------------------------------------------------------
struct DebateResult {
    std::vector<Argument> supporting;
    std::vector<Argument> opposing;
    double supporting_strength = 0.0;
    double opposing_strength = 0.0;
    double net_signal = 0.0;
    DebateWinner winner = DebateWinner::NEUTRAL;
    DebateSummary summary;
    std::string transcript;
};

namespace debate_util {

inline double mean_strength(const std::vector<Argument>& args) {
    if (args.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& a : args) sum += a.strength;
    return sum / static_cast<double>(args.size());
}

// Strongest first; ties keep catalog order.
inline void keep_top(std::vector<Argument>& args, int k) {
    std::stable_sort(args.begin(), args.end(),
                     [](const Argument& a, const Argument& b) { return a.strength > b.strength; });
    if (k >= 0 && args.size() > static_cast<size_t>(k)) args.resize(static_cast<size_t>(k));
}

}  // namespace debate_util

// ---------------------------------------------------------------------------
// DebateEngine
// ---------------------------------------------------------------------------
class DebateEngine {
public:
    explicit DebateEngine(const DebateConfig& cfg = {}) : cfg_(cfg) {}

    const DebateConfig& config() const { return cfg_; }

    std::vector<Argument> supporting_arguments(const DebateInput& in) const {
        std::vector<Argument> args;
        for (SupportRule rule : ALL_SUPPORT_RULES)
            if (auto a = evaluate(rule, in, cfg_.thresholds)) args.push_back(std::move(*a));
        debate_util::keep_top(args, cfg_.top_k);
        return args;
    }

    // The opposing side answers the (already trimmed) supporting side.
    std::vector<Argument> opposing_arguments(const DebateInput& in,
                                             const std::vector<Argument>& supporting) const {
        DebateInput answered = in;
        answered.supporting = &supporting;

        std::vector<Argument> all;
        for (OpposeRule rule : ALL_OPPOSE_RULES)
            if (auto a = evaluate(rule, answered, cfg_.thresholds)) all.push_back(std::move(*a));

        std::vector<Argument> kept = all;
        debate_util::keep_top(kept, cfg_.top_k);

        bool has_structural = std::any_of(kept.begin(), kept.end(),
                                          [](const Argument& a) { return a.structural; });
        if (!has_structural) {
            const Argument* best = nullptr;
            for (const auto& a : all)
                if (a.structural && (!best || a.strength > best->strength)) best = &a;
            if (best) {
                if (kept.empty() || static_cast<int>(kept.size()) < cfg_.top_k) kept.push_back(*best);
                else kept.back() = *best;
                debate_util::keep_top(kept, cfg_.top_k);
            }
        }
        return kept;
    }

    DebateResult run(const DebateInput& in) const {
        DebateResult r;
        r.supporting = supporting_arguments(in);
        r.opposing = opposing_arguments(in, r.supporting);
        r.supporting_strength = debate_util::mean_strength(r.supporting);
        r.opposing_strength = debate_util::mean_strength(r.opposing);
        r.net_signal = r.supporting_strength - r.opposing_strength;
        r.winner = winner_for(r.net_signal);
        r.summary = summarize(r);
        r.transcript = format_transcript(r);
        return r;
    }

    DebateWinner winner_for(double net) const {
        if (net > cfg_.winner_threshold) return DebateWinner::SUPPORTING;
        if (net < -cfg_.winner_threshold) return DebateWinner::OPPOSING;
        return DebateWinner::NEUTRAL;
    }

private:
    DebateConfig cfg_;

    DebateSummary summarize(const DebateResult& r) const {
        DebateSummary s;
        for (const auto& a : r.supporting)
            if (a.strength >= cfg_.notable_support && s.supporting_points.size() < 3)
                s.supporting_points.push_back(a.rule);
        for (const auto& a : r.opposing)
            if (a.strength >= cfg_.notable_oppose && s.opposing_points.size() < 3)
                s.opposing_points.push_back(a.rule);

        switch (r.winner) {
            case DebateWinner::SUPPORTING:
                s.verdict = "Case for the wager prevails";
                break;
            case DebateWinner::OPPOSING:
                s.verdict = "Case against the wager prevails";
                break;
            case DebateWinner::NEUTRAL:
                s.verdict = "Arguments are balanced";
                break;
        }
        return s;
    }

    static std::string format_transcript(const DebateResult& r) {
        using debate_util::num;
        std::ostringstream ss;
        ss << "SUPPORTING (" << num(r.supporting_strength, 3) << ")\n";
        for (const auto& a : r.supporting)
            ss << "  [" << num(a.strength, 2) << "] " << a.rule << ": " << a.rationale
               << " (" << a.evidence << ")\n";
        ss << "OPPOSING (" << num(r.opposing_strength, 3) << ")\n";
        for (const auto& a : r.opposing)
            ss << "  [" << num(a.strength, 2) << "] " << a.rule << ": " << a.rationale
               << " (" << a.evidence << ")\n";
        ss << "NET " << num(r.net_signal, 3) << " -> " << debate_winner_str(r.winner) << "\n";
        return ss.str();
    }
};
