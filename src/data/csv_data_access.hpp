#pragma once

#include "data/csv_table.hpp"
#include "data/data_access.hpp"
#include "odds/odds.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>
#include <tuple>
#include <vector>

// ---------------------------------------------------------------------------
// CsvDataAccess - DataAccess over a directory of CSV tables.
//
// Tables (all optional except entities.csv):
//   entities.csv        id,name,abbreviation,kind,team_id
//   events.csv          event_id,date,home_id,away_id
//   aggregates.csv      entity_id,window,stat_type,games,ppg,opp_ppg,ortg,drtg,pace,
//                       avg_total,score_std,avg_margin,stat_value,stat_std,minutes,minutes_std
//   rest.csv            entity_id,date,rest_days,games_last_7,games_last_14
//   venue.csv           entity_id,games,home_avg_total,away_avg_total,overall_avg_total
//                       [,total_std]
//   strength.csv        entity_id,league_ortg,league_drtg,faced_ortg,faced_drtg
//   ou_records.csv      entity_id,games,over_rate,under_rate
//   h2h.csv             a_id,b_id,games,avg_total,avg_margin
//   defense.csv         team_id,stat_type,factor
//   odds.csv            event_id,market,subject,line,price_a,price_b,format
//   results.csv         event_id,status,home_score,away_score
//   player_results.csv  event_id,player_id,stat_type,value
//
// Everything is loaded in the constructor; lookups only read, so one
// instance can serve concurrent evaluations.
// ---------------------------------------------------------------------------
class CsvDataAccess : public DataAccess {
public:
    explicit CsvDataAccess(const std::filesystem::path& dir) {
        if (!std::filesystem::is_directory(dir))
            throw std::runtime_error("Data directory not found: " + dir.string());
        load_entities(dir / "entities.csv");
        if (auto t = optional_table(dir / "events.csv")) load_events(*t);
        if (auto t = optional_table(dir / "aggregates.csv")) load_aggregates(*t);
        if (auto t = optional_table(dir / "rest.csv")) load_rest(*t);
        if (auto t = optional_table(dir / "venue.csv")) load_venue(*t);
        if (auto t = optional_table(dir / "strength.csv")) load_strength(*t);
        if (auto t = optional_table(dir / "ou_records.csv")) load_ou(*t);
        if (auto t = optional_table(dir / "h2h.csv")) load_h2h(*t);
        if (auto t = optional_table(dir / "defense.csv")) load_defense(*t);
        if (auto t = optional_table(dir / "odds.csv")) load_odds(*t);
        if (auto t = optional_table(dir / "results.csv")) load_results(*t);
        if (auto t = optional_table(dir / "player_results.csv")) load_player_results(*t);
    }

    Lookup<Entity> resolve_entity(const std::string& name) override {
        std::string key = lower(name);
        const Entity* match = nullptr;
        for (const auto& e : entities_) {
            if (lower(e.id) == key || lower(e.name) == key || lower(e.abbreviation) == key) {
                if (match && match->id != e.id)
                    return Lookup<Entity>::not_found("ambiguous entity name: " + name);
                match = &e;
            }
        }
        if (!match) return Lookup<Entity>::not_found("unknown entity: " + name);
        return Lookup<Entity>::of(*match);
    }

    Lookup<EventInfo> resolve_event(const Entity& a, const Entity& b,
                                    const std::string& date) override {
        for (const auto& [id, ev] : events_) {
            bool teams = (ev.home_id == a.id && ev.away_id == b.id)
                      || (ev.home_id == b.id && ev.away_id == a.id);
            if (teams && (date.empty() || ev.date == date)) return Lookup<EventInfo>::of(ev);
        }
        return Lookup<EventInfo>::not_found("no event for " + a.id + " vs " + b.id
                                            + (date.empty() ? "" : " on " + date));
    }

    Lookup<WindowAggregate> fetch_recent_aggregates(const Entity& entity, Window window,
                                                    const std::string& stat_type) override {
        auto it = aggregates_.find({entity.id, window, stat_type});
        if (it == aggregates_.end())
            return Lookup<WindowAggregate>::not_found(
                std::string("no ") + window_str(window) + " aggregate for " + entity.id);
        return Lookup<WindowAggregate>::of(it->second);
    }

    Lookup<HeadToHead> fetch_head_to_head(const Entity& a, const Entity& b, int limit) override {
        auto it = h2h_.find({a.id, b.id});
        if (it != h2h_.end()) return Lookup<HeadToHead>::of(capped(it->second, limit));
        it = h2h_.find({b.id, a.id});
        if (it != h2h_.end()) {
            HeadToHead flipped = it->second;
            flipped.avg_margin = -flipped.avg_margin;
            return Lookup<HeadToHead>::of(capped(flipped, limit));
        }
        return Lookup<HeadToHead>::not_found("no head-to-head for " + a.id + " vs " + b.id);
    }

    Lookup<RestInfo> fetch_rest_and_density(const Entity& entity,
                                            const std::string& date) override {
        auto it = rest_.find({entity.id, date});
        if (it == rest_.end())
            return Lookup<RestInfo>::not_found("no rest data for " + entity.id + " on " + date);
        return Lookup<RestInfo>::of(it->second);
    }

    Lookup<MarketOdds> fetch_market_odds(const std::string& event_id) override {
        auto it = odds_.find(event_id);
        if (it == odds_.end())
            return Lookup<MarketOdds>::not_found("no market odds for event " + event_id);
        return Lookup<MarketOdds>::of(it->second);
    }

    Lookup<VenueSplits> fetch_venue_splits(const Entity& entity) override {
        return find_in(venue_, entity.id, "venue splits");
    }

    Lookup<ScheduleStrength> fetch_schedule_strength(const Entity& entity) override {
        return find_in(strength_, entity.id, "schedule strength");
    }

    Lookup<OuRecord> fetch_ou_record(const Entity& entity, double /*line*/) override {
        return find_in(ou_, entity.id, "over/under record");
    }

    Lookup<double> fetch_defensive_factor(const Entity& opponent,
                                          const std::string& stat_type) override {
        auto it = defense_.find({opponent.id, stat_type});
        if (it == defense_.end())
            return Lookup<double>::not_found("no defensive factor for " + opponent.id + "/" + stat_type);
        return Lookup<double>::of(it->second);
    }

    Lookup<RealizedResult> fetch_realized_result(const std::string& event_id) override {
        return find_in(results_, event_id, "result");
    }

    Lookup<double> fetch_realized_stat(const std::string& event_id, const std::string& player_id,
                                       const std::string& stat_type) override {
        auto it = player_results_.find({event_id, player_id, stat_type});
        if (it == player_results_.end())
            return Lookup<double>::not_found("no " + stat_type + " for " + player_id
                                             + " in event " + event_id);
        return Lookup<double>::of(it->second);
    }

private:
    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::optional<CsvTable> optional_table(const std::filesystem::path& p) {
        if (!std::filesystem::exists(p)) return std::nullopt;
        return CsvTable::load(p);
    }

    template <typename T>
    static Lookup<T> find_in(const std::map<std::string, T>& m, const std::string& key,
                             const char* what) {
        auto it = m.find(key);
        if (it == m.end()) return Lookup<T>::not_found(std::string("no ") + what + " for " + key);
        return Lookup<T>::of(it->second);
    }

    static HeadToHead capped(HeadToHead h, int limit) {
        if (limit > 0 && h.games > limit) h.games = limit;
        return h;
    }

    void load_entities(const std::filesystem::path& p) {
        auto t = CsvTable::load(p);
        for (size_t i = 0; i < t.size(); ++i) {
            Entity e;
            e.id = t.text(i, "id");
            e.name = t.text(i, "name");
            e.abbreviation = t.has_column("abbreviation") ? t.text(i, "abbreviation") : "";
            if (t.has_column("kind") && lower(t.text(i, "kind")) == "player")
                e.kind = EntityKind::PLAYER;
            if (t.has_column("team_id")) e.team_id = t.text(i, "team_id");
            entities_.push_back(std::move(e));
        }
    }

    void load_events(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            EventInfo ev{t.text(i, "event_id"), t.text(i, "date"),
                         t.text(i, "home_id"), t.text(i, "away_id")};
            events_[ev.event_id] = ev;
        }
    }

    void load_aggregates(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            WindowAggregate a;
            a.window = parse_window(t.text(i, "window"));
            a.games = t.integer(i, "games");
            a.ppg = t.number(i, "ppg");
            a.opp_ppg = t.number(i, "opp_ppg");
            a.ortg = t.number(i, "ortg");
            a.drtg = t.number(i, "drtg");
            a.pace = t.number(i, "pace");
            a.avg_total = t.number(i, "avg_total");
            a.score_std = t.number(i, "score_std");
            a.avg_margin = t.number(i, "avg_margin");
            a.stat_value = t.number(i, "stat_value");
            a.stat_std = t.number(i, "stat_std");
            a.minutes = t.number(i, "minutes");
            a.minutes_std = t.number(i, "minutes_std");
            aggregates_[{t.text(i, "entity_id"), a.window, t.text(i, "stat_type")}] = a;
        }
    }

    void load_rest(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            RestInfo r;
            r.rest_days = t.integer(i, "rest_days", 2);
            r.games_last_7 = t.integer(i, "games_last_7");
            r.games_last_14 = t.integer(i, "games_last_14");
            rest_[{t.text(i, "entity_id"), t.text(i, "date")}] = r;
        }
    }

    void load_venue(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            VenueSplits v;
            v.games = t.integer(i, "games");
            v.home_avg_total = t.number(i, "home_avg_total");
            v.away_avg_total = t.number(i, "away_avg_total");
            v.overall_avg_total = t.number(i, "overall_avg_total");
            if (t.has_column("total_std")) v.total_std = t.number(i, "total_std");
            venue_[t.text(i, "entity_id")] = v;
        }
    }

    void load_strength(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            ScheduleStrength s;
            s.league_ortg = t.number(i, "league_ortg", s.league_ortg);
            s.league_drtg = t.number(i, "league_drtg", s.league_drtg);
            s.faced_ortg = t.number(i, "faced_ortg", s.faced_ortg);
            s.faced_drtg = t.number(i, "faced_drtg", s.faced_drtg);
            strength_[t.text(i, "entity_id")] = s;
        }
    }

    void load_ou(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            OuRecord r;
            r.games = t.integer(i, "games");
            r.over_rate = t.number(i, "over_rate");
            r.under_rate = t.number(i, "under_rate");
            ou_[t.text(i, "entity_id")] = r;
        }
    }

    void load_h2h(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            HeadToHead h;
            h.games = t.integer(i, "games");
            h.avg_total = t.number(i, "avg_total");
            h.avg_margin = t.number(i, "avg_margin");
            h2h_[{t.text(i, "a_id"), t.text(i, "b_id")}] = h;
        }
    }

    void load_defense(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i)
            defense_[{t.text(i, "team_id"), t.text(i, "stat_type")}] = t.number(i, "factor", 1.0);
    }

    void load_odds(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            const std::string event_id = t.text(i, "event_id");
            const std::string format = t.has_column("format") ? t.text(i, "format") : "decimal";
            PricedLine pl;
            pl.line = t.number(i, "line");
            pl.price_a = odds::to_decimal(t.number(i, "price_a"), format);
            pl.price_b = odds::to_decimal(t.number(i, "price_b"), format);

            auto& m = odds_[event_id];
            m.event_id = event_id;
            const std::string market = lower(t.text(i, "market"));
            if (market == "moneyline") m.moneyline = pl;
            else if (market == "spread") m.spread = pl;
            else if (market == "total") m.total = pl;
            else if (market == "prop") m.props[t.text(i, "subject")] = pl;
            else throw std::runtime_error("odds.csv: unknown market '" + market + "'");
        }
    }

    void load_results(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i) {
            RealizedResult r;
            r.event_id = t.text(i, "event_id");
            r.is_final = lower(t.text(i, "status")) == "final";
            r.home_score = t.number(i, "home_score");
            r.away_score = t.number(i, "away_score");
            auto ev = events_.find(r.event_id);
            if (ev != events_.end()) {
                r.home_id = ev->second.home_id;
                r.away_id = ev->second.away_id;
            }
            results_[r.event_id] = r;
        }
    }

    void load_player_results(const CsvTable& t) {
        for (size_t i = 0; i < t.size(); ++i)
            player_results_[{t.text(i, "event_id"), t.text(i, "player_id"), t.text(i, "stat_type")}]
                = t.number(i, "value");
    }

    std::vector<Entity> entities_;
    std::map<std::string, EventInfo> events_;
    std::map<std::tuple<std::string, Window, std::string>, WindowAggregate> aggregates_;
    std::map<std::pair<std::string, std::string>, RestInfo> rest_;
    std::map<std::string, VenueSplits> venue_;
    std::map<std::string, ScheduleStrength> strength_;
    std::map<std::string, OuRecord> ou_;
    std::map<std::pair<std::string, std::string>, HeadToHead> h2h_;
    std::map<std::pair<std::string, std::string>, double> defense_;
    std::map<std::string, MarketOdds> odds_;
    std::map<std::string, RealizedResult> results_;
    std::map<std::tuple<std::string, std::string, std::string>, double> player_results_;
};
