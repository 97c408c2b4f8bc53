// ============================================================================
// FNO SIGNAL ENGINE - Indicator Calculator Implementation
// ============================================================================

#include "fno/strategy/indicator_calculator.hpp"

#include "fno/core/error.hpp"
#include "fno/strategy/indicators/adx.hpp"
#include "fno/strategy/indicators/bollinger.hpp"
#include "fno/strategy/indicators/ema.hpp"
#include "fno/strategy/indicators/macd.hpp"
#include "fno/strategy/indicators/rsi.hpp"
#include "fno/strategy/indicators/stochastic.hpp"
#include "fno/strategy/indicators/vwap.hpp"

#include <cmath>
#include <vector>

namespace fno::strategy {

namespace {

constexpr double TRADING_DAYS_PER_YEAR = 252.0;
constexpr double HIGH_VOLATILITY = 0.30;
constexpr double MEDIUM_VOLATILITY = 0.15;

}  // namespace

IndicatorSet IndicatorCalculator::compute(market::PriceSeries bars) const {
    if (bars.size() < MIN_BARS) {
        throw InsufficientDataError(bars.size(), MIN_BARS);
    }

    RSI14 rsi;
    MACD_12_26_9 macd;
    BB5_2 bollinger;
    EMA20 ema_fast;
    SMA50 sma_slow;
    SessionVWAP vwap;
    ADX14 adx;
    Stoch_14_3_3 stoch;

    for (const auto& bar : bars) {
        rsi.update(bar.close);
        macd.update(bar.close);
        bollinger.update(bar.close);
        ema_fast.update(bar.close);
        sma_slow.update(bar.close);
        vwap.update(bar.timestamp, bar.high, bar.low, bar.close, bar.volume);
        adx.update(bar.high, bar.low, bar.close);
        stoch.update(bar.high, bar.low, bar.close);
    }

    // No indicator is read before its warm-up completes
    if (!rsi.is_ready() || !macd.is_ready() || !bollinger.is_ready() ||
        !ema_fast.is_ready() || !sma_slow.is_ready() || !adx.is_ready() ||
        !stoch.is_ready()) {
        throw InsufficientDataError(bars.size(), MIN_BARS);
    }

    IndicatorSet set;
    set.rsi = rsi.value();
    set.macd = macd.value();
    set.macd_signal = macd.signal_line();
    const auto& bands = bollinger.bands();
    set.bb_upper = bands.upper;
    set.bb_middle = bands.middle;
    set.bb_lower = bands.lower;
    set.ema_fast = ema_fast.value();
    set.sma_slow = sma_slow.value();
    set.vwap = vwap.value();
    set.adx = adx.value();
    set.plus_di = adx.plus_di();
    set.minus_di = adx.minus_di();
    set.stoch_k = stoch.value();
    set.stoch_d = stoch.d_line();
    set.close = bars.back().close;
    set.volume = bars.back().volume;
    return set;
}

double IndicatorCalculator::annualized_volatility(market::PriceSeries bars) {
    if (bars.size() < MIN_VOLATILITY_BARS) {
        throw InsufficientDataError(bars.size(), MIN_VOLATILITY_BARS);
    }

    std::vector<double> returns;
    returns.reserve(bars.size() - 1);
    for (size_t i = 1; i < bars.size(); ++i) {
        const double prev = bars[i - 1].close;
        if (prev == 0.0) continue;
        returns.push_back(bars[i].close / prev - 1.0);
    }
    if (returns.size() < 2) {
        throw InsufficientDataError(returns.size() + 1, MIN_VOLATILITY_BARS);
    }

    double mean = 0.0;
    for (double r : returns) mean += r;
    mean /= static_cast<double>(returns.size());

    // Sample standard deviation
    double variance = 0.0;
    for (double r : returns) {
        const double diff = r - mean;
        variance += diff * diff;
    }
    variance /= static_cast<double>(returns.size() - 1);

    return std::sqrt(variance) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

VolatilityLevel IndicatorCalculator::classify_volatility(double annualized) noexcept {
    if (annualized > HIGH_VOLATILITY) return VolatilityLevel::High;
    if (annualized > MEDIUM_VOLATILITY) return VolatilityLevel::Medium;
    return VolatilityLevel::Low;
}

}  // namespace fno::strategy
