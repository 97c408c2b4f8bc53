#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Signal Narrative
// ============================================================================
// Short descriptive strings attached to a Signal
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/engine/signal.hpp"
#include "fno/strategy/indicator_calculator.hpp"
#include "fno/strategy/open_interest_analyzer.hpp"
#include "fno/strategy/technical_analyzer.hpp"

#include <string>

namespace fno::engine {

/// "OI shows bullish sentiment (PCR: 1.50) | RSI ... | Overall trend is bullish"
[[nodiscard]] std::string build_reasoning(const strategy::OIAnalysis& oi,
                                          const strategy::TechnicalSnapshot& technical);

/// "<pattern> | <trend> Trend | Strength: N%"
[[nodiscard]] std::string describe_setup(const strategy::TechnicalSnapshot& technical);

/// Close relative to session VWAP, +/-1% band counts as near
[[nodiscard]] std::string describe_vwap(const strategy::IndicatorSet& indicators);

[[nodiscard]] std::string describe_volume(const strategy::IndicatorSet& indicators);

/// Theta pressure from calendar days left until expiry
[[nodiscard]] std::string describe_time_decay(Date expiry, Date today);

[[nodiscard]] SignalNarrative build_narrative(const strategy::OIAnalysis& oi,
                                              const strategy::TechnicalSnapshot& technical,
                                              Date expiry,
                                              Date today);

}  // namespace fno::engine
