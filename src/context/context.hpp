#pragma once

#include <array>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Enumerations shared by every stage
// ---------------------------------------------------------------------------
enum class BetType { SPREAD, TOTAL, PLAYER_PROP, MONEYLINE };

// OVER/UNDER for totals and props. SIDE/OPPONENT for spreads, where SIDE is
// side A taking the quoted line and OPPONENT is side B taking -line.
enum class Pick { OVER, UNDER, SIDE, OPPONENT };

enum class DataQuality { FRESH, PARTIAL, UNAVAILABLE };

enum class Window { SEASON, LAST_15, LAST_10, LAST_5 };
constexpr std::array<Window, 4> ALL_WINDOWS = {
    Window::SEASON, Window::LAST_15, Window::LAST_10, Window::LAST_5};

enum class EntityKind { TEAM, PLAYER };

inline const char* bet_type_str(BetType t) {
    switch (t) {
        case BetType::SPREAD:      return "SPREAD";
        case BetType::TOTAL:       return "TOTAL";
        case BetType::PLAYER_PROP: return "PLAYER_PROP";
        case BetType::MONEYLINE:   return "MONEYLINE";
    }
    return "UNKNOWN";
}

inline BetType parse_bet_type(const std::string& s) {
    if (s == "SPREAD" || s == "spread") return BetType::SPREAD;
    if (s == "TOTAL" || s == "total") return BetType::TOTAL;
    if (s == "PLAYER_PROP" || s == "prop") return BetType::PLAYER_PROP;
    if (s == "MONEYLINE" || s == "moneyline") return BetType::MONEYLINE;
    throw std::invalid_argument("unknown bet type: " + s);
}

inline const char* pick_str(Pick p) {
    switch (p) {
        case Pick::OVER:     return "OVER";
        case Pick::UNDER:    return "UNDER";
        case Pick::SIDE:     return "SIDE";
        case Pick::OPPONENT: return "OPPONENT";
    }
    return "UNKNOWN";
}

inline Pick parse_pick(const std::string& s) {
    if (s == "OVER" || s == "over") return Pick::OVER;
    if (s == "UNDER" || s == "under") return Pick::UNDER;
    if (s == "SIDE" || s == "side") return Pick::SIDE;
    if (s == "OPPONENT" || s == "opponent") return Pick::OPPONENT;
    throw std::invalid_argument("unknown pick: " + s);
}

// OVER and SIDE are the "first" outcome of a market; the kernel's p_over.
inline bool is_first_outcome(Pick p) {
    return p == Pick::OVER || p == Pick::SIDE;
}

inline const char* data_quality_str(DataQuality q) {
    switch (q) {
        case DataQuality::FRESH:       return "FRESH";
        case DataQuality::PARTIAL:     return "PARTIAL";
        case DataQuality::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

inline const char* window_str(Window w) {
    switch (w) {
        case Window::SEASON:  return "season";
        case Window::LAST_15: return "l15";
        case Window::LAST_10: return "l10";
        case Window::LAST_5:  return "l5";
    }
    return "unknown";
}

inline Window parse_window(const std::string& s) {
    if (s == "season") return Window::SEASON;
    if (s == "l15") return Window::LAST_15;
    if (s == "l10") return Window::LAST_10;
    if (s == "l5") return Window::LAST_5;
    throw std::invalid_argument("unknown window: " + s);
}

// ---------------------------------------------------------------------------
// Records returned by DataAccess
// ---------------------------------------------------------------------------
struct Entity {
    std::string id;
    std::string name;
    std::string abbreviation;
    EntityKind kind = EntityKind::TEAM;
    std::string team_id;  // players only
};

struct EventInfo {
    std::string event_id;
    std::string date;  // YYYY-MM-DD
    std::string home_id;
    std::string away_id;
};

// One timeframe of a side's recent form. Team fields and player-stat fields
// share the record; unused fields stay zero.
struct WindowAggregate {
    Window window = Window::SEASON;
    int games = 0;

    double ppg = 0.0;
    double opp_ppg = 0.0;
    double ortg = 0.0;
    double drtg = 0.0;
    double pace = 0.0;
    double avg_total = 0.0;
    double score_std = 0.0;  // std of the side's own points
    double avg_margin = 0.0;

    double stat_value = 0.0;
    double stat_std = 0.0;
    double minutes = 0.0;
    double minutes_std = 0.0;

    bool has_efficiency() const { return ortg > 0.0 && drtg > 0.0 && pace > 0.0; }
};

struct RestInfo {
    int rest_days = 2;      // full days off before the event; 0 = back-to-back
    int games_last_7 = 0;
    int games_last_14 = 0;

    bool back_to_back() const { return rest_days == 0; }

    // 2 points per game above 3 in the trailing week (when >= 4), plus one
    // per game above 7 in the trailing fortnight (when >= 8).
    double fatigue_score() const {
        double score = 0.0;
        if (games_last_7 >= 4) score += (games_last_7 - 3) * 2.0;
        if (games_last_14 >= 8) score += (games_last_14 - 7);
        return score;
    }
};

struct VenueSplits {
    int games = 0;
    double home_avg_total = 0.0;
    double away_avg_total = 0.0;
    double overall_avg_total = 0.0;
    double total_std = 0.0;  // std of game totals; 0 when unknown

    double venue_avg_total(bool is_home) const {
        return is_home ? home_avg_total : away_avg_total;
    }
};

// League baselines and the average quality of opponents a side has faced.
struct ScheduleStrength {
    double league_ortg = 114.0;
    double league_drtg = 114.0;
    double faced_ortg = 114.0;
    double faced_drtg = 114.0;
};

struct OuRecord {
    int games = 0;
    double over_rate = 0.0;
    double under_rate = 0.0;
};

// Oriented from the first entity's perspective.
struct HeadToHead {
    int games = 0;
    double avg_total = 0.0;
    double avg_margin = 0.0;
};

// Decimal prices. price_a is OVER / side A, price_b is UNDER / side B.
struct PricedLine {
    double line = 0.0;
    double price_a = 1.91;
    double price_b = 1.91;
};

struct MarketOdds {
    std::string event_id;
    std::optional<PricedLine> moneyline;
    std::optional<PricedLine> spread;  // line quoted for side A (home)
    std::optional<PricedLine> total;
    std::map<std::string, PricedLine> props;  // key: "<player_id>:<stat>"

    static std::string prop_key(const std::string& player_id, const std::string& stat) {
        return player_id + ":" + stat;
    }
};

struct RealizedResult {
    std::string event_id;
    bool is_final = false;
    std::string home_id;
    std::string away_id;
    double home_score = 0.0;
    double away_score = 0.0;

    std::optional<double> score_of(const std::string& entity_id) const {
        if (entity_id == home_id) return home_score;
        if (entity_id == away_id) return away_score;
        return std::nullopt;
    }
};

// ---------------------------------------------------------------------------
// Context - immutable snapshot assembled once per evaluation request
// ---------------------------------------------------------------------------
struct SideContext {
    Entity entity;
    bool is_home = false;
    std::array<std::optional<WindowAggregate>, 4> windows;
    std::optional<RestInfo> rest;
    std::optional<VenueSplits> venue;
    std::optional<ScheduleStrength> strength;
    std::optional<OuRecord> ou_record;

    const std::optional<WindowAggregate>& window(Window w) const {
        return windows[static_cast<size_t>(w)];
    }

    // Games behind the season window, else the largest recent window.
    int sample_games() const {
        const auto& season = window(Window::SEASON);
        if (season && season->games > 0) return season->games;
        int best = 0;
        for (const auto& w : windows)
            if (w && w->games > best) best = w->games;
        return best;
    }
};

struct Context {
    EventInfo event;
    BetType bet_type = BetType::TOTAL;
    std::optional<Pick> pick;
    std::string stat_type;  // player props only

    // Resolved market: explicit request line wins over the market's line.
    std::optional<double> line;
    double price_a = 1.91;
    double price_b = 1.91;

    SideContext side_a;  // team A, or the player for props
    SideContext side_b;  // team B, or the player's opponent
    std::optional<HeadToHead> head_to_head;
    std::optional<MarketOdds> market;
    std::optional<double> defensive_factor;  // opponent's allowance vs league for stat_type

    DataQuality quality = DataQuality::FRESH;
    std::vector<std::string> partial_inputs;  // inputs that failed to load
};
