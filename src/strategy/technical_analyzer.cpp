// ============================================================================
// FNO SIGNAL ENGINE - Technical Analyzer Implementation
// ============================================================================

#include "fno/strategy/technical_analyzer.hpp"

namespace fno::strategy {

TechnicalSnapshot TechnicalAnalyzer::analyze(market::PriceSeries bars) const {
    TechnicalSnapshot snapshot;
    snapshot.indicators = calculator_.compute(bars);
    snapshot.pattern = classifier_.classify(bars);
    snapshot.strength = scorer_.score(snapshot.indicators);
    snapshot.trend = scorer_.trend(snapshot.indicators);
    snapshot.annualized_volatility = IndicatorCalculator::annualized_volatility(bars);
    snapshot.volatility = IndicatorCalculator::classify_volatility(snapshot.annualized_volatility);
    return snapshot;
}

}  // namespace fno::strategy
