#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Strike Selector
// ============================================================================
// Picks the single most liquid contract for a direction, preferring the
// nearest out-of-the-money strikes for buy trades
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/market/option_chain.hpp"

#include <optional>
#include <span>

namespace fno::strategy {

class StrikeSelector {
public:
    static constexpr size_t CANDIDATES = 3;

    /// nullopt when no contract of the direction's type exists
    [[nodiscard]] std::optional<market::OptionContract> select(
        Direction direction,
        std::span<const market::OptionContract> contracts,
        Price spot) const;

    /// OI x volume, or OI alone when volume is zero
    [[nodiscard]] static double liquidity_score(const market::OptionContract& contract) noexcept;
};

}  // namespace fno::strategy
