#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Indicator Calculator
// ============================================================================
// Runs the fixed indicator battery over an ordered price history and returns
// the values at the latest bar
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/market/price_bar.hpp"

#include <optional>

namespace fno::strategy {

/// Indicator values at the most recent bar
struct IndicatorSet {
    double rsi = 0.0;            // RSI(14)
    double macd = 0.0;           // MACD(12,26) line
    double macd_signal = 0.0;    // EMA(9) of the MACD line
    double bb_upper = 0.0;       // Bollinger(5, 2)
    double bb_middle = 0.0;
    double bb_lower = 0.0;
    double ema_fast = 0.0;       // EMA(20)
    double sma_slow = 0.0;       // SMA(50)
    std::optional<double> vwap;  // session VWAP, absent without volume
    double adx = 0.0;            // ADX(14)
    double plus_di = 0.0;
    double minus_di = 0.0;
    double stoch_k = 0.0;        // Stochastic(14,3,3)
    double stoch_d = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

class IndicatorCalculator {
public:
    /// Longest lookback in the battery (slow moving average)
    static constexpr size_t MIN_BARS = 50;

    /// Bars needed for the volatility estimate
    static constexpr size_t MIN_VOLATILITY_BARS = 10;

    /// Compute all indicators at the last bar
    /// Throws InsufficientDataError when bars.size() < MIN_BARS or any
    /// indicator has not warmed up
    [[nodiscard]] IndicatorSet compute(market::PriceSeries bars) const;

    /// Annualized close-to-close volatility, sqrt(252) scaling
    /// Throws InsufficientDataError when bars.size() < MIN_VOLATILITY_BARS
    [[nodiscard]] static double annualized_volatility(market::PriceSeries bars);

    /// > 0.30 High, > 0.15 Medium, else Low
    [[nodiscard]] static VolatilityLevel classify_volatility(double annualized) noexcept;
};

}  // namespace fno::strategy
