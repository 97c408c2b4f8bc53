#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Open Interest Analyzer
// ============================================================================
// Put/call ratio sentiment and OI-implied support/resistance from one
// option chain snapshot
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/market/option_chain.hpp"

#include <cstdint>
#include <optional>

namespace fno::strategy {

struct OIAnalysis {
    int64_t total_call_oi = 0;
    int64_t total_put_oi = 0;
    double put_call_ratio = 0.0;
    Price atm_strike;
    Price max_call_oi_strike;
    Price max_put_oi_strike;
    Price support;       // max-OI put strike
    Price resistance;    // max-OI call strike
    Sentiment sentiment = Sentiment::Neutral;
    OIStrength strength = OIStrength::Moderate;
};

class OpenInterestAnalyzer {
public:
    static constexpr double BULLISH_PCR = 1.3;
    static constexpr double BEARISH_PCR = 0.7;
    static constexpr double STRONG_DIVERGENCE = 0.3;

    /// nullopt when either side has no contracts, call OI sums to zero,
    /// or the chain carries no spot price
    [[nodiscard]] std::optional<OIAnalysis> analyze(const market::OptionChain& chain) const;

    /// Strike nearest spot, ties to the lower strike
    [[nodiscard]] static Price nearest_strike(const market::OptionChain& chain);

    [[nodiscard]] static Sentiment sentiment_for(double pcr) noexcept;
    [[nodiscard]] static OIStrength strength_for(double pcr) noexcept;
};

}  // namespace fno::strategy
