#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Odds conversion at the market boundary. Everything inside the pipeline
// works in decimal odds (stake included, 1.91 ~ "-110").
// ---------------------------------------------------------------------------
namespace odds {

constexpr double DEFAULT_DECIMAL = 1.91;

// Negative favourite: 100/|a| + 1. Positive underdog: a/100 + 1.
// American prices strictly between -100 and +100 do not exist.
inline double american_to_decimal(double american) {
    if (american >= 100.0) return american / 100.0 + 1.0;
    if (american <= -100.0) return 100.0 / std::abs(american) + 1.0;
    throw std::invalid_argument("american odds must be <= -100 or >= +100, got "
                                + std::to_string(american));
}

inline bool valid_decimal(double decimal) {
    return std::isfinite(decimal) && decimal > 1.0;
}

inline double decimal_to_american(double decimal) {
    if (!(decimal > 1.0))
        throw std::invalid_argument("decimal odds must be > 1.0");
    if (decimal >= 2.0) return (decimal - 1.0) * 100.0;
    return -100.0 / (decimal - 1.0);
}

inline double implied_probability(double decimal) {
    if (!(decimal > 1.0))
        throw std::invalid_argument("decimal odds must be > 1.0");
    return 1.0 / decimal;
}

// Net profit per unit stake on a win.
inline double win_profit(double decimal) {
    return decimal - 1.0;
}

// Parse a price column: "decimal" or "american" format tag.
inline double to_decimal(double price, const std::string& format) {
    if (format == "american") return american_to_decimal(price);
    if (format == "decimal" || format.empty()) {
        if (!(price > 1.0))
            throw std::invalid_argument("decimal odds must be > 1.0");
        return price;
    }
    throw std::invalid_argument("unknown odds format: " + format);
}

}  // namespace odds
