#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Signal Type Resolver
// ============================================================================
// Fuses OI sentiment, technical trend and strength into a directional call
// Pure: no minimum-confidence filtering, no state
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/strategy/open_interest_analyzer.hpp"
#include "fno/strategy/technical_analyzer.hpp"

#include <optional>

namespace fno::strategy {

struct DirectionalCall {
    Direction direction = Direction::BuyCall;
    int confidence = 0;          // 0-100
    bool mean_reversion = false; // contrarian RSI-extreme call
};

class SignalTypeResolver {
public:
    // Confluence: min(85 + strength / 5, 95)
    static constexpr int CONFLUENCE_BASE = 85;
    static constexpr int CONFLUENCE_DIVISOR = 5;
    static constexpr int CONFLUENCE_CAP = 95;

    // Mean reversion: min(75 + strength / 8, 85)
    static constexpr int REVERSION_BASE = 75;
    static constexpr int REVERSION_DIVISOR = 8;
    static constexpr int REVERSION_CAP = 85;

    /// nullopt means no opportunity, not an error
    [[nodiscard]] std::optional<DirectionalCall> resolve(const OIAnalysis& oi,
                                                         const TechnicalSnapshot& technical) const noexcept;
};

}  // namespace fno::strategy
