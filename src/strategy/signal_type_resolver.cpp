// ============================================================================
// FNO SIGNAL ENGINE - Signal Type Resolver Implementation
// ============================================================================

#include "fno/strategy/signal_type_resolver.hpp"

#include "fno/strategy/indicators/rsi.hpp"

#include <algorithm>

namespace fno::strategy {

namespace {

int confluence_confidence(int strength) noexcept {
    return std::min(SignalTypeResolver::CONFLUENCE_BASE + strength / SignalTypeResolver::CONFLUENCE_DIVISOR,
                    SignalTypeResolver::CONFLUENCE_CAP);
}

int reversion_confidence(int strength) noexcept {
    return std::min(SignalTypeResolver::REVERSION_BASE + strength / SignalTypeResolver::REVERSION_DIVISOR,
                    SignalTypeResolver::REVERSION_CAP);
}

}  // namespace

std::optional<DirectionalCall> SignalTypeResolver::resolve(const OIAnalysis& oi,
                                                           const TechnicalSnapshot& technical) const noexcept {
    const IndicatorSet& ind = technical.indicators;
    const bool macd_bullish = ind.macd > ind.macd_signal;
    const bool macd_bearish = ind.macd < ind.macd_signal;

    // Directional confluence
    switch (oi.sentiment) {
        case Sentiment::Bullish:
            if (technical.trend == Trend::Bullish && ind.rsi < RSI14::OVERBOUGHT && macd_bullish) {
                return DirectionalCall{Direction::BuyCall, confluence_confidence(technical.strength), false};
            }
            break;
        case Sentiment::Bearish:
            if (technical.trend == Trend::Bearish && ind.rsi > RSI14::OVERSOLD && macd_bearish) {
                return DirectionalCall{Direction::BuyPut, confluence_confidence(technical.strength), false};
            }
            break;
        case Sentiment::Neutral:
            break;
    }

    // Mean-reversion override on RSI extremes
    if (ind.rsi > RSI14::EXTREME_OVERBOUGHT && technical.trend != Trend::Bullish) {
        return DirectionalCall{Direction::BuyPut, reversion_confidence(technical.strength), true};
    }
    if (ind.rsi < RSI14::EXTREME_OVERSOLD && technical.trend != Trend::Bearish) {
        return DirectionalCall{Direction::BuyCall, reversion_confidence(technical.strength), true};
    }

    return std::nullopt;
}

}  // namespace fno::strategy
