// ============================================================================
// FNO SIGNAL ENGINE - Strength Scorer Implementation
// ============================================================================

#include "fno/strategy/strength_scorer.hpp"

#include "fno/strategy/indicators/rsi.hpp"

#include <algorithm>
#include <cmath>

namespace fno::strategy {

int StrengthScorer::score(const IndicatorSet& ind) const noexcept {
    int strength = 0;

    // Momentum oscillator
    if (ind.rsi < RSI14::OVERSOLD || ind.rsi > RSI14::OVERBOUGHT) {
        strength += RSI_EXTREME_POINTS;
    } else if (ind.rsi >= 40.0 && ind.rsi <= 60.0) {
        strength += RSI_NEUTRAL_POINTS;
    }

    // A cross in either direction counts
    if (ind.macd != ind.macd_signal) {
        strength += MACD_CROSS_POINTS;
    }

    if (ind.ema_fast != ind.sma_slow) {
        strength += AVERAGE_RELATION_POINTS;
    }

    if (ind.vwap && *ind.vwap > 0.0 &&
        std::abs(ind.close - *ind.vwap) / *ind.vwap < VWAP_PROXIMITY) {
        strength += VWAP_PROXIMITY_POINTS;
    }

    if (ind.adx > ADX_STRONG_TREND) {
        strength += ADX_TREND_POINTS;
    }

    if (ind.volume > 0.0) {
        strength += VOLUME_POINTS;
    }

    return std::min(strength, MAX_SCORE);
}

Trend StrengthScorer::trend(const IndicatorSet& ind) const noexcept {
    int bullish = 0;
    int bearish = 0;

    (ind.rsi > RSI14::MIDLINE ? bullish : bearish) += 1;
    (ind.macd > ind.macd_signal ? bullish : bearish) += 1;
    (ind.ema_fast > ind.sma_slow ? bullish : bearish) += 1;

    return majority(bullish, bearish);
}

Trend StrengthScorer::majority(int bullish_votes, int bearish_votes) noexcept {
    if (bullish_votes > bearish_votes) return Trend::Bullish;
    if (bearish_votes > bullish_votes) return Trend::Bearish;
    return Trend::Sideways;
}

}  // namespace fno::strategy
