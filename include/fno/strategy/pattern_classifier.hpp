#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Pattern Classifier
// ============================================================================
// Heuristic chart-pattern label for the latest 10 bars
// Rules are evaluated in priority order, first match wins
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/market/price_bar.hpp"

namespace fno::strategy {

class PatternClassifier {
public:
    static constexpr size_t MIN_BARS = 20;
    static constexpr size_t WINDOW = 10;
    static constexpr double BREAKOUT_HIGH_FACTOR = 0.98;
    static constexpr double BREAKOUT_LOW_FACTOR = 1.02;

    [[nodiscard]] ChartPattern classify(market::PriceSeries bars) const noexcept;
};

}  // namespace fno::strategy
