// odds_test.cpp - American/decimal conversion and implied probability

#include <gtest/gtest.h>

#include "odds/odds.hpp"

#include <limits>
#include <stdexcept>

// ===========================================================================
// 1. American to decimal
// ===========================================================================

TEST(OddsTest, FavouriteMinus110) {
    EXPECT_NEAR(odds::american_to_decimal(-110.0), 1.0 + 100.0 / 110.0, 1e-12);
}

TEST(OddsTest, UnderdogPlus150) {
    EXPECT_DOUBLE_EQ(odds::american_to_decimal(150.0), 2.5);
}

TEST(OddsTest, EvenMoneyBothSigns) {
    EXPECT_DOUBLE_EQ(odds::american_to_decimal(100.0), 2.0);
    EXPECT_DOUBLE_EQ(odds::american_to_decimal(-100.0), 2.0);
}

TEST(OddsTest, AmericanInsideDeadBandThrows) {
    EXPECT_THROW(odds::american_to_decimal(50.0), std::invalid_argument);
    EXPECT_THROW(odds::american_to_decimal(-99.0), std::invalid_argument);
}

// ===========================================================================
// 2. Decimal to American
// ===========================================================================

TEST(OddsTest, DecimalAboveTwoIsPositive) {
    EXPECT_DOUBLE_EQ(odds::decimal_to_american(2.5), 150.0);
}

TEST(OddsTest, DecimalBelowTwoIsNegative) {
    EXPECT_NEAR(odds::decimal_to_american(1.5), -200.0, 1e-9);
}

TEST(OddsTest, ConversionInvertsForFavourite) {
    double d = odds::american_to_decimal(-135.0);
    EXPECT_NEAR(odds::decimal_to_american(d), -135.0, 1e-9);
}

TEST(OddsTest, DecimalAtOrBelowOneThrows) {
    EXPECT_THROW(odds::decimal_to_american(1.0), std::invalid_argument);
}

// ===========================================================================
// 3. Implied probability and profit
// ===========================================================================

TEST(OddsTest, ValidDecimalRequiresFinitePriceAboveOne) {
    EXPECT_TRUE(odds::valid_decimal(1.01));
    EXPECT_TRUE(odds::valid_decimal(odds::DEFAULT_DECIMAL));
    EXPECT_FALSE(odds::valid_decimal(1.0));
    EXPECT_FALSE(odds::valid_decimal(-110.0));
    EXPECT_FALSE(odds::valid_decimal(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(odds::valid_decimal(std::numeric_limits<double>::infinity()));
}

TEST(OddsTest, ImpliedProbabilityOfDefaultPrice) {
    EXPECT_NEAR(odds::implied_probability(odds::DEFAULT_DECIMAL), 0.5236, 1e-4);
}

TEST(OddsTest, WinProfitExcludesStake) {
    EXPECT_NEAR(odds::win_profit(1.91), 0.91, 1e-12);
}

TEST(OddsTest, ImpliedProbabilityRejectsInvalidOdds) {
    EXPECT_THROW(odds::implied_probability(0.9), std::invalid_argument);
}

// ===========================================================================
// 4. Format tags
// ===========================================================================

TEST(OddsTest, ToDecimalAmerican) {
    EXPECT_DOUBLE_EQ(odds::to_decimal(200.0, "american"), 3.0);
}

TEST(OddsTest, ToDecimalPassesDecimalThrough) {
    EXPECT_DOUBLE_EQ(odds::to_decimal(1.87, "decimal"), 1.87);
    EXPECT_DOUBLE_EQ(odds::to_decimal(1.87, ""), 1.87);
}

TEST(OddsTest, ToDecimalRejectsUnknownFormat) {
    EXPECT_THROW(odds::to_decimal(1.5, "fractional"), std::invalid_argument);
}

TEST(OddsTest, ToDecimalRejectsDecimalBelowOne) {
    EXPECT_THROW(odds::to_decimal(-110.0, "decimal"), std::invalid_argument);
}
