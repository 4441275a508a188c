#pragma once

#include "context/context.hpp"

#include <optional>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// Lookup<T> - a populated record or an explicit "not found" with a reason
// ---------------------------------------------------------------------------
template <typename T>
struct Lookup {
    std::optional<T> value;
    std::string error;

    bool found() const { return value.has_value(); }
    const T& operator*() const { return *value; }
    const T* operator->() const { return &*value; }

    static Lookup of(T v) { return Lookup{std::move(v), {}}; }
    static Lookup not_found(std::string reason) { return Lookup{std::nullopt, std::move(reason)}; }
};

// ---------------------------------------------------------------------------
// DataAccess - read-only source of everything the pipeline consumes.
//
// Every call is idempotent and side-effect-free. Implementations report
// absence through Lookup::not_found; callers still guard against throws.
// Implementations shared across threads must be safe for concurrent reads.
// ---------------------------------------------------------------------------
class DataAccess {
public:
    virtual ~DataAccess() = default;

    virtual Lookup<Entity> resolve_entity(const std::string& name) = 0;
    virtual Lookup<EventInfo> resolve_event(const Entity& a, const Entity& b,
                                            const std::string& date) = 0;

    virtual Lookup<WindowAggregate> fetch_recent_aggregates(const Entity& entity, Window window,
                                                            const std::string& stat_type) = 0;
    virtual Lookup<HeadToHead> fetch_head_to_head(const Entity& a, const Entity& b, int limit) = 0;
    virtual Lookup<RestInfo> fetch_rest_and_density(const Entity& entity,
                                                    const std::string& date) = 0;
    virtual Lookup<MarketOdds> fetch_market_odds(const std::string& event_id) = 0;

    virtual Lookup<VenueSplits> fetch_venue_splits(const Entity& entity) = 0;
    virtual Lookup<ScheduleStrength> fetch_schedule_strength(const Entity& entity) = 0;
    virtual Lookup<OuRecord> fetch_ou_record(const Entity& entity, double line) = 0;
    virtual Lookup<double> fetch_defensive_factor(const Entity& opponent,
                                                  const std::string& stat_type) = 0;

    virtual Lookup<RealizedResult> fetch_realized_result(const std::string& event_id) = 0;
    virtual Lookup<double> fetch_realized_stat(const std::string& event_id,
                                               const std::string& player_id,
                                               const std::string& stat_type) = 0;
};
