#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Strength Scorer
// ============================================================================
// Reduces an IndicatorSet to an additive 0-100 strength score and a
// majority-vote trend label
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/strategy/indicator_calculator.hpp"

namespace fno::strategy {

class StrengthScorer {
public:
    // Score contributions
    static constexpr int RSI_EXTREME_POINTS = 20;
    static constexpr int RSI_NEUTRAL_POINTS = 10;
    static constexpr int MACD_CROSS_POINTS = 15;
    static constexpr int AVERAGE_RELATION_POINTS = 15;
    static constexpr int VWAP_PROXIMITY_POINTS = 10;
    static constexpr int ADX_TREND_POINTS = 15;
    static constexpr int VOLUME_POINTS = 10;
    static constexpr int MAX_SCORE = 100;

    static constexpr double VWAP_PROXIMITY = 0.005;  // 0.5%
    static constexpr double ADX_STRONG_TREND = 25.0;

    [[nodiscard]] int score(const IndicatorSet& indicators) const noexcept;

    /// Majority of RSI-vs-midline, MACD-vs-signal and EMA-vs-SMA votes
    [[nodiscard]] Trend trend(const IndicatorSet& indicators) const noexcept;

    /// Tally of directional votes; equal counts resolve to Sideways
    [[nodiscard]] static Trend majority(int bullish_votes, int bearish_votes) noexcept;
};

}  // namespace fno::strategy
