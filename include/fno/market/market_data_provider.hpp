#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Market Data Provider
// ============================================================================
// Collaborator interface the pipeline reads from. All network and storage
// access lives behind it; implementations never throw on fetch failure.
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/market/option_chain.hpp"
#include "fno/market/price_bar.hpp"

#include <optional>

namespace fno::market {

class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /// Current-cycle option chain, nullopt when unavailable
    [[nodiscard]] virtual std::optional<OptionChain> get_option_chain(const Symbol& symbol) = 0;

    /// Up to `lookback` most recent bars, ascending. Empty on failure.
    [[nodiscard]] virtual PriceHistory get_price_history(const Symbol& symbol,
                                                         size_t lookback) = 0;

    /// Last traded price of the underlying, 0 on failure
    [[nodiscard]] virtual double get_spot_price(const Symbol& symbol) = 0;
};

}  // namespace fno::market
