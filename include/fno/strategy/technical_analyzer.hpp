#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Technical Analyzer
// ============================================================================
// Builds the per-cycle TechnicalSnapshot from a price history:
// indicators, chart pattern, trend, strength and volatility
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/market/price_bar.hpp"
#include "fno/strategy/indicator_calculator.hpp"
#include "fno/strategy/pattern_classifier.hpp"
#include "fno/strategy/strength_scorer.hpp"

namespace fno::strategy {

struct TechnicalSnapshot {
    IndicatorSet indicators;
    ChartPattern pattern = ChartPattern::InsufficientData;
    Trend trend = Trend::Sideways;
    int strength = 0;                 // 0-100
    double annualized_volatility = 0.0;
    VolatilityLevel volatility = VolatilityLevel::Low;
};

class TechnicalAnalyzer {
public:
    /// Throws InsufficientDataError when the history is too short
    [[nodiscard]] TechnicalSnapshot analyze(market::PriceSeries bars) const;

private:
    IndicatorCalculator calculator_;
    PatternClassifier classifier_;
    StrengthScorer scorer_;
};

}  // namespace fno::strategy
