#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Price Bar
// ============================================================================
// OHLCV candle of the underlying, produced by the market-data provider
// ============================================================================

#include "fno/core/types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace fno::market {

/// Kline/Candlestick data
/// Sequences are ascending in time with no duplicate timestamps
struct PriceBar {
    Timestamp timestamp;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

using PriceHistory = std::vector<PriceBar>;
using PriceSeries = std::span<const PriceBar>;

/// True when timestamps strictly increase
[[nodiscard]] inline bool is_well_ordered(PriceSeries bars) noexcept {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].timestamp <= bars[i - 1].timestamp) return false;
    }
    return true;
}

}  // namespace fno::market
