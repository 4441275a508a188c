// csv_data_access_test.cpp - CsvDataAccess over a temporary directory of tables

#include <gtest/gtest.h>

#include "data/csv_data_access.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

// ===========================================================================
// Fixture
// ===========================================================================
class CsvDataAccessTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = test_helpers::temp_path("csv_data_access_test_" +
            std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);

        write("entities.csv",
              "id,name,abbreviation,kind,team_id\n"
              "BOS,Boston Celtics,BOS,team,\n"
              "MIA,Miami Heat,MIA,team,\n"
              "P1,Jayson Tatum,JT,player,BOS\n");
        write("events.csv",
              "event_id,date,home_id,away_id\n"
              "E1,2026-01-15,BOS,MIA\n");
        write("aggregates.csv",
              "entity_id,window,stat_type,games,ppg,opp_ppg,ortg,drtg,pace,avg_total,score_std,"
              "avg_margin,stat_value,stat_std,minutes,minutes_std\n"
              "BOS,season,,40,115,110,116,110,99,225,12,5,,,,\n"
              "BOS,l10,,10,117,108,118,109,100,225,11,9,,,,\n"
              "P1,l10,points,10,,,,,,,,,28,5.5,36,4\n");
        write("rest.csv",
              "entity_id,date,rest_days,games_last_7,games_last_14\n"
              "BOS,2026-01-15,0,4,8\n");
        write("h2h.csv",
              "a_id,b_id,games,avg_total,avg_margin\n"
              "BOS,MIA,12,218,4.5\n");
        write("defense.csv",
              "team_id,stat_type,factor\n"
              "MIA,points,1.04\n");
        write("odds.csv",
              "event_id,market,subject,line,price_a,price_b,format\n"
              "E1,total,,220.5,-110,-110,american\n"
              "E1,spread,,-4.5,1.91,1.91,decimal\n"
              "E1,prop,P1:points,26.5,1.87,1.95,decimal\n");
        write("results.csv",
              "event_id,status,home_score,away_score\n"
              "E1,final,112,108\n");
        write("player_results.csv",
              "event_id,player_id,stat_type,value\n"
              "E1,P1,points,31\n");
    }

    void TearDown() override { std::filesystem::remove_all(dir); }

    void write(const std::string& name, const std::string& body) {
        std::ofstream out(dir / name);
        out << body;
    }

    Entity entity(const std::string& id) {
        CsvDataAccess data(dir);
        return *data.resolve_entity(id);
    }
};

// ===========================================================================
// 1. Entity and event resolution
// ===========================================================================

TEST_F(CsvDataAccessTest, ResolvesByIdNameOrAbbreviationIgnoringCase) {
    CsvDataAccess data(dir);
    EXPECT_EQ(data.resolve_entity("bos")->id, "BOS");
    EXPECT_EQ(data.resolve_entity("Miami Heat")->id, "MIA");
    EXPECT_EQ(data.resolve_entity("jt")->id, "P1");
}

TEST_F(CsvDataAccessTest, PlayerCarriesKindAndTeam) {
    CsvDataAccess data(dir);
    auto p = data.resolve_entity("P1");
    ASSERT_TRUE(p.found());
    EXPECT_EQ(p->kind, EntityKind::PLAYER);
    EXPECT_EQ(p->team_id, "BOS");
}

TEST_F(CsvDataAccessTest, UnknownEntityIsNotFoundWithReason) {
    CsvDataAccess data(dir);
    auto e = data.resolve_entity("Lakers");
    EXPECT_FALSE(e.found());
    EXPECT_NE(e.error.find("Lakers"), std::string::npos);
}

TEST_F(CsvDataAccessTest, AmbiguousNameIsNotFound) {
    write("entities.csv",
          "id,name,abbreviation,kind,team_id\n"
          "BOS,Boston,BOS,team,\n"
          "BOS2,Boston,BSN,team,\n");
    CsvDataAccess data(dir);
    auto e = data.resolve_entity("Boston");
    EXPECT_FALSE(e.found());
    EXPECT_NE(e.error.find("ambiguous"), std::string::npos);
}

TEST_F(CsvDataAccessTest, EventResolvesInEitherOrder) {
    CsvDataAccess data(dir);
    auto ev = data.resolve_event(entity("MIA"), entity("BOS"), "2026-01-15");
    ASSERT_TRUE(ev.found());
    EXPECT_EQ(ev->event_id, "E1");
    EXPECT_EQ(ev->home_id, "BOS");
}

TEST_F(CsvDataAccessTest, EventOnOtherDateIsNotFound) {
    CsvDataAccess data(dir);
    EXPECT_FALSE(data.resolve_event(entity("BOS"), entity("MIA"), "2026-02-01").found());
}

// ===========================================================================
// 2. Aggregates and situational data
// ===========================================================================

TEST_F(CsvDataAccessTest, TeamAggregateByWindow) {
    CsvDataAccess data(dir);
    auto agg = data.fetch_recent_aggregates(entity("BOS"), Window::LAST_10, "");
    ASSERT_TRUE(agg.found());
    EXPECT_EQ(agg->games, 10);
    EXPECT_DOUBLE_EQ(agg->ortg, 118.0);
    EXPECT_DOUBLE_EQ(agg->avg_margin, 9.0);
}

TEST_F(CsvDataAccessTest, MissingWindowIsNotFound) {
    CsvDataAccess data(dir);
    EXPECT_FALSE(data.fetch_recent_aggregates(entity("BOS"), Window::LAST_5, "").found());
}

TEST_F(CsvDataAccessTest, PlayerAggregateKeyedByStat) {
    CsvDataAccess data(dir);
    auto agg = data.fetch_recent_aggregates(entity("P1"), Window::LAST_10, "points");
    ASSERT_TRUE(agg.found());
    EXPECT_DOUBLE_EQ(agg->stat_value, 28.0);
    EXPECT_FALSE(data.fetch_recent_aggregates(entity("P1"), Window::LAST_10, "rebounds").found());
}

TEST_F(CsvDataAccessTest, RestAndDensity) {
    CsvDataAccess data(dir);
    auto r = data.fetch_rest_and_density(entity("BOS"), "2026-01-15");
    ASSERT_TRUE(r.found());
    EXPECT_TRUE(r->back_to_back());
    EXPECT_DOUBLE_EQ(r->fatigue_score(), 3.0);
}

TEST_F(CsvDataAccessTest, HeadToHeadReversedFlipsMargin) {
    CsvDataAccess data(dir);
    auto h = data.fetch_head_to_head(entity("MIA"), entity("BOS"), 10);
    ASSERT_TRUE(h.found());
    EXPECT_DOUBLE_EQ(h->avg_margin, -4.5);
    EXPECT_EQ(h->games, 10);  // capped at the limit
}

TEST_F(CsvDataAccessTest, DefensiveFactor) {
    CsvDataAccess data(dir);
    auto f = data.fetch_defensive_factor(entity("MIA"), "points");
    ASSERT_TRUE(f.found());
    EXPECT_DOUBLE_EQ(*f, 1.04);
}

TEST_F(CsvDataAccessTest, VenueSplitsWithOptionalStd) {
    write("venue.csv",
          "entity_id,games,home_avg_total,away_avg_total,overall_avg_total,total_std\n"
          "BOS,40,228,220,224,18.5\n"
          "MIA,40,221,219,220,\n");
    CsvDataAccess data(dir);
    auto bos = data.fetch_venue_splits(entity("BOS"));
    ASSERT_TRUE(bos.found());
    EXPECT_DOUBLE_EQ(bos->venue_avg_total(true), 228.0);
    EXPECT_DOUBLE_EQ(bos->total_std, 18.5);
    EXPECT_DOUBLE_EQ(data.fetch_venue_splits(entity("MIA"))->total_std, 0.0);
}

TEST_F(CsvDataAccessTest, VenueStdColumnMayBeOmitted) {
    write("venue.csv",
          "entity_id,games,home_avg_total,away_avg_total,overall_avg_total\n"
          "BOS,40,228,220,224\n");
    CsvDataAccess data(dir);
    EXPECT_DOUBLE_EQ(data.fetch_venue_splits(entity("BOS"))->total_std, 0.0);
}

TEST_F(CsvDataAccessTest, OptionalTablesAbsentGiveNotFound) {
    CsvDataAccess data(dir);
    EXPECT_FALSE(data.fetch_venue_splits(entity("BOS")).found());
    EXPECT_FALSE(data.fetch_schedule_strength(entity("BOS")).found());
    EXPECT_FALSE(data.fetch_ou_record(entity("BOS"), 220.5).found());
}

// ===========================================================================
// 3. Market odds
// ===========================================================================

TEST_F(CsvDataAccessTest, AmericanPricesConvertedToDecimal) {
    CsvDataAccess data(dir);
    auto m = data.fetch_market_odds("E1");
    ASSERT_TRUE(m.found());
    ASSERT_TRUE(m->total.has_value());
    EXPECT_DOUBLE_EQ(m->total->line, 220.5);
    EXPECT_NEAR(m->total->price_a, 1.0 + 100.0 / 110.0, 1e-12);
}

TEST_F(CsvDataAccessTest, PropMarketKeyedByPlayerAndStat) {
    CsvDataAccess data(dir);
    auto m = data.fetch_market_odds("E1");
    ASSERT_TRUE(m.found());
    auto it = m->props.find(MarketOdds::prop_key("P1", "points"));
    ASSERT_NE(it, m->props.end());
    EXPECT_DOUBLE_EQ(it->second.line, 26.5);
    EXPECT_FALSE(m->moneyline.has_value());
}

TEST_F(CsvDataAccessTest, UnknownMarketThrowsOnLoad) {
    write("odds.csv",
          "event_id,market,subject,line,price_a,price_b,format\n"
          "E1,exotic,,1,2,2,decimal\n");
    EXPECT_THROW(CsvDataAccess{dir}, std::runtime_error);
}

// ===========================================================================
// 4. Results
// ===========================================================================

TEST_F(CsvDataAccessTest, ResultCarriesTeamsFromEvents) {
    CsvDataAccess data(dir);
    auto r = data.fetch_realized_result("E1");
    ASSERT_TRUE(r.found());
    EXPECT_TRUE(r->is_final);
    EXPECT_EQ(r->score_of("BOS").value_or(-1.0), 112.0);
    EXPECT_EQ(r->score_of("MIA").value_or(-1.0), 108.0);
    EXPECT_FALSE(r->score_of("LAL").has_value());
}

TEST_F(CsvDataAccessTest, RealizedPlayerStat) {
    CsvDataAccess data(dir);
    auto v = data.fetch_realized_stat("E1", "P1", "points");
    ASSERT_TRUE(v.found());
    EXPECT_DOUBLE_EQ(*v, 31.0);
    EXPECT_FALSE(data.fetch_realized_stat("E1", "P1", "assists").found());
}

// ===========================================================================
// 5. Load errors
// ===========================================================================

TEST_F(CsvDataAccessTest, MissingDirectoryThrows) {
    EXPECT_THROW(CsvDataAccess{dir / "nope"}, std::runtime_error);
}

TEST_F(CsvDataAccessTest, MissingEntitiesTableThrows) {
    std::filesystem::remove(dir / "entities.csv");
    EXPECT_THROW(CsvDataAccess{dir}, std::runtime_error);
}

TEST_F(CsvDataAccessTest, NonNumericCellThrowsWithColumnName) {
    write("rest.csv",
          "entity_id,date,rest_days,games_last_7,games_last_14\n"
          "BOS,2026-01-15,two,4,8\n");
    try {
        CsvDataAccess data(dir);
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("rest_days"), std::string::npos);
    }
}
