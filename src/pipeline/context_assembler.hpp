#pragma once

#include "context/context.hpp"
#include "data/data_access.hpp"
#include "odds/odds.hpp"
#include "pipeline/evaluation.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// AssemblyResult
//
// Field keys name each DataAccess input: "entity:a", "event", "market",
// "h2h", "defense", and per side "a:l10", "b:rest", "a:venue", "b:strength",
// "a:ou_record". A key is stale when its call failed (threw); a retry
// refetches the stale keys and every key fetched with their values.
// ---------------------------------------------------------------------------
struct AssemblyResult {
    std::optional<Context> context;  // empty when a required input is missing
    std::vector<std::string> errors;
    std::vector<std::string> invalid_prices;  // rejected quotes or overrides
    std::set<std::string> stale;
    std::string missing_reason;
};

// Keys whose fetch takes another key's value as an argument.
inline const std::vector<std::pair<std::string, std::vector<std::string>>>& field_dependents() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> deps = {
        {"event", {"market", "a:rest", "b:rest"}},
        {"market", {"a:ou_record", "b:ou_record"}},
    };
    return deps;
}

// Stale keys plus everything downstream of them.
inline std::set<std::string> with_dependents(const std::set<std::string>& stale) {
    std::set<std::string> out = stale;
    for (const auto& [key, dependents] : field_dependents())
        if (out.count(key)) out.insert(dependents.begin(), dependents.end());
    return out;
}

struct AssemblerConfig {
    int head_to_head_limit = 10;
};

// ---------------------------------------------------------------------------
// ContextAssembler - builds the Context for one request out of DataAccess
// calls. Never throws for a DataAccess failure.
// ---------------------------------------------------------------------------
class ContextAssembler {
public:
    explicit ContextAssembler(DataAccess& data, const AssemblerConfig& cfg = {})
        : data_(data), cfg_(cfg) {}

    // prior: context from the previous attempt; only keys in `stale` and
    // their dependents are fetched again, every other field is kept.
    AssemblyResult assemble(const EvaluationRequest& req,
                            const std::optional<Context>& prior = std::nullopt,
                            const std::set<std::string>& stale_keys = {}) {
        AssemblyResult out;
        const std::set<std::string> stale = with_dependents(stale_keys);
        Pass pass{prior, stale, out, {}};

        Context ctx = prior ? *prior : Context{};
        if (prior) {
            auto& pi = ctx.partial_inputs;
            pi.erase(std::remove_if(pi.begin(), pi.end(),
                                    [&](const std::string& k) { return stale.count(k) > 0; }),
                     pi.end());
        }
        ctx.bet_type = req.bet_type;
        ctx.pick = req.pick;
        ctx.stat_type = req.stat_type;

        if (pass.want("entity:a")) {
            auto e = pass.fetch<Entity>("entity:a", [&] { return data_.resolve_entity(req.side_a); });
            if (!e) return missing(out, "cannot resolve " + req.side_a);
            ctx.side_a.entity = *e;
        }
        if (pass.want("entity:b")) {
            auto e = pass.fetch<Entity>("entity:b", [&] { return data_.resolve_entity(req.side_b); });
            if (!e) return missing(out, "cannot resolve " + req.side_b);
            ctx.side_b.entity = *e;
        }
        const bool prop = req.bet_type == BetType::PLAYER_PROP;

        if (pass.want("event")) {
            ctx.event = EventInfo{};
            ctx.event.event_id = req.event_id;
            ctx.event.date = req.date;
            // Props resolve the game through the player's team.
            Entity team_a = ctx.side_a.entity;
            if (prop) team_a.id = ctx.side_a.entity.team_id;
            auto ev = pass.fetch<EventInfo>("event", [&] {
                return data_.resolve_event(team_a, ctx.side_b.entity, req.date);
            });
            if (ev && (req.event_id.empty() || ev->event_id == req.event_id)) {
                ctx.event = *ev;
            } else if (!ev) {
                pass.partial("event");
            }
            std::string a_id = prop ? ctx.side_a.entity.team_id : ctx.side_a.entity.id;
            ctx.side_a.is_home = !ctx.event.home_id.empty() && ctx.event.home_id == a_id;
            ctx.side_b.is_home = !ctx.event.home_id.empty() && ctx.event.home_id == ctx.side_b.entity.id;
        }

        fetch_side(pass, ctx.side_a, "a", ctx.event.date, prop ? req.stat_type : std::string());
        if (!prop) fetch_side(pass, ctx.side_b, "b", ctx.event.date, std::string());

        if (!prop && pass.want("h2h")) {
            auto h = pass.fetch<HeadToHead>("h2h", [&] {
                return data_.fetch_head_to_head(ctx.side_a.entity, ctx.side_b.entity,
                                                cfg_.head_to_head_limit);
            });
            ctx.head_to_head = h;
        }
        if (prop && pass.want("defense")) {
            ctx.defensive_factor = pass.fetch<double>("defense", [&] {
                return data_.fetch_defensive_factor(ctx.side_b.entity, req.stat_type);
            });
        }
        if (!ctx.event.event_id.empty() && pass.want("market")) {
            ctx.market = pass.fetch<MarketOdds>("market", [&] {
                return data_.fetch_market_odds(ctx.event.event_id);
            });
        }
        if (!resolve_line(ctx, req, out.invalid_prices)) pass.partial("market");
        else if (!ctx.line && !ctx.market && !req.line) pass.partial("market");

        if (!has_window(ctx.side_a))
            return missing(out, "no performance windows for " + ctx.side_a.entity.id);
        if (!prop && !has_window(ctx.side_b))
            return missing(out, "no performance windows for " + ctx.side_b.entity.id);

        // O/U tendency needs the resolved total.
        if (req.bet_type == BetType::TOTAL && ctx.line) {
            for (auto* side : {&ctx.side_a, &ctx.side_b}) {
                std::string key = std::string(side == &ctx.side_a ? "a" : "b") + ":ou_record";
                if (!pass.want(key)) continue;
                side->ou_record = pass.fetch<OuRecord>(key, [&] {
                    return data_.fetch_ou_record(side->entity, *ctx.line);
                });
            }
        }

        for (const auto& k : pass.partials)
            if (std::find(ctx.partial_inputs.begin(), ctx.partial_inputs.end(), k)
                == ctx.partial_inputs.end())
                ctx.partial_inputs.push_back(k);
        for (const auto& k : out.stale)
            if (std::find(ctx.partial_inputs.begin(), ctx.partial_inputs.end(), k)
                == ctx.partial_inputs.end())
                ctx.partial_inputs.push_back(k);
        ctx.quality = ctx.partial_inputs.empty() ? DataQuality::FRESH : DataQuality::PARTIAL;
        out.context = std::move(ctx);
        return out;
    }

private:
    DataAccess& data_;
    AssemblerConfig cfg_;

    // State of one assemble() call.
    struct Pass {
        const std::optional<Context>& prior;
        const std::set<std::string>& stale;
        AssemblyResult& out;
        std::vector<std::string> partials;

        bool want(const std::string& key) const { return !prior || stale.count(key) > 0; }

        void partial(const std::string& key) { partials.push_back(key); }

        template <typename T, typename Call>
        std::optional<T> fetch(const std::string& key, Call&& call) {
            try {
                Lookup<T> r = call();
                if (r.found()) return *r.value;
                return std::nullopt;
            } catch (const std::exception& e) {
                out.errors.push_back(key + ": " + e.what());
                out.stale.insert(key);
            }
            return std::nullopt;
        }
    };

    static AssemblyResult& missing(AssemblyResult& out, const std::string& reason) {
        out.context.reset();
        out.missing_reason = reason;
        return out;
    }

    static bool has_window(const SideContext& side) {
        return std::any_of(side.windows.begin(), side.windows.end(),
                           [](const std::optional<WindowAggregate>& w) { return w && w->games > 0; });
    }

    void fetch_side(Pass& pass, SideContext& side, const std::string& tag,
                    const std::string& date, const std::string& stat_type) {
        for (Window w : ALL_WINDOWS) {
            std::string key = tag + ":" + window_str(w);
            if (!pass.want(key)) continue;
            auto agg = pass.fetch<WindowAggregate>(key, [&] {
                return data_.fetch_recent_aggregates(side.entity, w, stat_type);
            });
            if (!agg) pass.partial(key);
            side.windows[static_cast<size_t>(w)] = agg;
        }
        if (pass.want(tag + ":rest")) {
            side.rest = pass.fetch<RestInfo>(tag + ":rest", [&] {
                return data_.fetch_rest_and_density(side.entity, date);
            });
            if (!side.rest) pass.partial(tag + ":rest");
        }
        if (!stat_type.empty()) return;  // players carry no venue or strength splits
        if (pass.want(tag + ":venue")) {
            side.venue = pass.fetch<VenueSplits>(tag + ":venue", [&] {
                return data_.fetch_venue_splits(side.entity);
            });
        }
        if (pass.want(tag + ":strength")) {
            side.strength = pass.fetch<ScheduleStrength>(tag + ":strength", [&] {
                return data_.fetch_schedule_strength(side.entity);
            });
        }
    }

    // Explicit request values win over the market. A quote or override
    // priced at or below 1.0 is rejected (false); a rejected override also
    // drops the line.
    static bool resolve_line(Context& ctx, const EvaluationRequest& req,
                             std::vector<std::string>& invalid) {
        std::optional<PricedLine> quoted;
        bool flip = false;
        if (ctx.market) {
            switch (req.bet_type) {
                case BetType::TOTAL:
                    quoted = ctx.market->total;
                    break;
                case BetType::SPREAD:
                    quoted = ctx.market->spread;
                    flip = !ctx.side_a.is_home && ctx.side_b.is_home;
                    break;
                case BetType::MONEYLINE:
                    quoted = ctx.market->moneyline;
                    flip = !ctx.side_a.is_home && ctx.side_b.is_home;
                    break;
                case BetType::PLAYER_PROP: {
                    auto it = ctx.market->props.find(
                        MarketOdds::prop_key(ctx.side_a.entity.id, req.stat_type));
                    if (it != ctx.market->props.end()) quoted = it->second;
                    break;
                }
            }
        }

        ctx.line.reset();
        ctx.price_a = odds::DEFAULT_DECIMAL;
        ctx.price_b = odds::DEFAULT_DECIMAL;

        bool ok = true;
        if (quoted && !(odds::valid_decimal(quoted->price_a) && odds::valid_decimal(quoted->price_b))) {
            invalid.push_back("market quote " + price_pair(quoted->price_a, quoted->price_b));
            quoted.reset();
            ok = false;
        }
        if ((req.price_a && !odds::valid_decimal(*req.price_a))
            || (req.price_b && !odds::valid_decimal(*req.price_b))) {
            invalid.push_back("request override "
                              + price_pair(req.price_a.value_or(odds::DEFAULT_DECIMAL),
                                           req.price_b.value_or(odds::DEFAULT_DECIMAL)));
            return false;
        }

        if (quoted) {
            ctx.line = flip ? -quoted->line : quoted->line;
            ctx.price_a = flip ? quoted->price_b : quoted->price_a;
            ctx.price_b = flip ? quoted->price_a : quoted->price_b;
        }
        if (req.bet_type == BetType::MONEYLINE && (quoted || req.price_a || req.price_b))
            ctx.line = 0.0;
        if (req.line) ctx.line = *req.line;
        if (req.price_a) ctx.price_a = *req.price_a;
        if (req.price_b) ctx.price_b = *req.price_b;
        return ok;
    }

    static std::string price_pair(double a, double b) {
        return std::to_string(a) + "/" + std::to_string(b);
    }
};
