#pragma once

#include "ledger/wager.hpp"
#include "ledger/wager_store.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// PatternThresholds - versioned. Every rule created records the version of
// the thresholds that produced it.
// ---------------------------------------------------------------------------
struct PatternThresholds {
    int version = 1;
    int min_losses = 5;

    double high_edge = 0.05;
    double high_edge_loss_rate = 0.55;
    double high_edge_adjustment = -0.02;

    double supporting_debate_loss_rate = 0.50;
    double supporting_debate_adjustment = -0.03;

    double high_confidence = 0.70;
    double high_confidence_loss_rate = 0.50;
    double high_confidence_adjustment = -0.03;

    int min_direction_samples = 10;
    double direction_loss_rate = 0.58;
    double direction_adjustment = -0.02;

    int max_listed_losses = 20;
};

struct PatternTally {
    int settled = 0;
    int losses = 0;
    double edge_sum = 0.0;
    double confidence_sum = 0.0;

    void add(const Wager& w) {
        ++settled;
        if (w.outcome == Outcome::LOSS) ++losses;
        edge_sum += w.predicted_edge;
        confidence_sum += w.confidence;
    }
    double loss_rate() const { return settled > 0 ? static_cast<double>(losses) / settled : 0.0; }
    double avg_edge() const { return settled > 0 ? edge_sum / settled : 0.0; }
    double avg_confidence() const { return settled > 0 ? confidence_sum / settled : 0.0; }
};

struct PatternReport {
    int settled_examined = 0;
    int thresholds_version = 0;
    std::vector<LearningRule> created;   // ids filled in
    std::vector<LearningRule> skipped;   // an active rule already covers the condition
    std::vector<Wager> high_confidence_losses;  // most confident first
};

namespace pattern_util {

inline std::string loss_evidence(const std::string& what, const PatternTally& t) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0)
       << what << " losing " << t.loss_rate() * 100.0 << "% ("
       << t.losses << "/" << t.settled << " settled, avg edge "
       << std::setprecision(3) << t.avg_edge() << ", avg confidence "
       << t.avg_confidence() << ")";
    return ss.str();
}

}  // namespace pattern_util

// ---------------------------------------------------------------------------
// PatternAnalyzer - scans settled wagers for systematic overconfidence and
// appends learning rules. Never edits or removes an existing rule.
// ---------------------------------------------------------------------------
class PatternAnalyzer {
public:
    explicit PatternAnalyzer(WagerStore& store, const PatternThresholds& t = {})
        : store_(store), t_(t) {}

    // Candidate rules without touching the store.
    std::vector<LearningRule> candidates(const std::vector<Wager>& settled) const {
        PatternTally high_edge, supporting, confident;
        std::map<std::pair<BetType, Pick>, PatternTally> direction;

        for (const auto& w : settled) {
            if (!w.settled()) continue;
            if (w.predicted_edge > t_.high_edge) high_edge.add(w);
            if (w.debate_winner == DebateWinner::SUPPORTING) supporting.add(w);
            if (w.confidence >= t_.high_confidence) confident.add(w);
            direction[{w.bet_type, w.pick}].add(w);
        }

        std::vector<LearningRule> out;
        if (high_edge.losses >= t_.min_losses && high_edge.loss_rate() > t_.high_edge_loss_rate) {
            std::ostringstream desc;
            desc << "predicted_edge > " << t_.high_edge;
            out.push_back(make_rule(RuleCondition::HIGH_EDGE, t_.high_edge, desc.str(),
                                    t_.high_edge_adjustment,
                                    pattern_util::loss_evidence("High-edge wagers", high_edge),
                                    high_edge));
        }
        if (supporting.losses >= t_.min_losses &&
            supporting.loss_rate() > t_.supporting_debate_loss_rate) {
            out.push_back(make_rule(RuleCondition::SUPPORTING_DEBATE, 0.0,
                                    "debate_winner = SUPPORTING",
                                    t_.supporting_debate_adjustment,
                                    pattern_util::loss_evidence("Supporting-debate wins", supporting),
                                    supporting));
        }
        if (confident.losses >= t_.min_losses &&
            confident.loss_rate() > t_.high_confidence_loss_rate) {
            std::ostringstream desc;
            desc << "confidence >= " << t_.high_confidence;
            out.push_back(make_rule(RuleCondition::HIGH_CONFIDENCE, t_.high_confidence, desc.str(),
                                    t_.high_confidence_adjustment,
                                    pattern_util::loss_evidence("High-confidence wagers", confident),
                                    confident));
        }
        for (const auto& [key, tally] : direction) {
            if (tally.settled < t_.min_direction_samples) continue;
            if (tally.losses < t_.min_losses || tally.loss_rate() <= t_.direction_loss_rate) continue;
            std::string label = std::string(bet_type_str(key.first)) + " " + pick_str(key.second);
            LearningRule r = make_rule(RuleCondition::BET_DIRECTION, 0.0,
                                       "direction = " + label, t_.direction_adjustment,
                                       pattern_util::loss_evidence(label + " wagers", tally), tally);
            r.bet_type = key.first;
            r.pick = key.second;
            out.push_back(std::move(r));
        }
        return out;
    }

    PatternReport run() {
        PatternReport report;
        report.thresholds_version = t_.version;
        auto settled = store_.settled();
        report.settled_examined = static_cast<int>(settled.size());

        for (auto& rule : candidates(settled)) {
            int64_t id = store_.insert_rule(rule);
            if (id == 0) {
                report.skipped.push_back(std::move(rule));
            } else {
                rule.id = id;
                report.created.push_back(std::move(rule));
            }
        }
        report.high_confidence_losses = high_confidence_losses(settled);
        return report;
    }

    std::vector<Wager> high_confidence_losses(const std::vector<Wager>& settled) const {
        std::vector<Wager> out;
        for (const auto& w : settled)
            if (w.outcome == Outcome::LOSS && w.confidence >= t_.high_confidence) out.push_back(w);
        std::stable_sort(out.begin(), out.end(),
                         [](const Wager& a, const Wager& b) { return a.confidence > b.confidence; });
        if (out.size() > static_cast<size_t>(t_.max_listed_losses))
            out.resize(static_cast<size_t>(t_.max_listed_losses));
        return out;
    }

    const PatternThresholds& thresholds() const { return t_; }

private:
    WagerStore& store_;
    PatternThresholds t_;

    LearningRule make_rule(RuleCondition c, double threshold, const std::string& description,
                           double adjustment, const std::string& evidence,
                           const PatternTally& tally) const {
        LearningRule r;
        r.condition = c;
        r.threshold = threshold;
        r.description = description;
        r.adjustment = adjustment;
        r.evidence = evidence;
        r.sample_size = tally.settled;
        r.loss_rate = tally.loss_rate();
        r.thresholds_version = t_.version;
        return r;
    }
};
