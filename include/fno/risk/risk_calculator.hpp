#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Risk Calculator
// ============================================================================
// Target/stop levels from confidence tier and volatility, reward-to-risk
// gate, and unit sizing from a fixed monetary risk budget
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/strategy/technical_analyzer.hpp"

#include <optional>

namespace fno::risk {

// ============================================================================
// Risk Parameters
// ============================================================================

struct RiskConfig {
    // Reward-to-risk gate
    double min_reward_risk = 2.0;

    // Sizing
    double max_risk_per_trade = 500.0;   // Currency at risk per signal
    int min_position_size = 1;
    int max_position_size = 10;

    // Target / stop tiers (fraction of entry)
    double very_high_target_pct = 0.25;  // confidence >= 90
    double very_high_stop_pct = 0.10;
    double high_target_pct = 0.20;       // confidence >= 80
    double high_stop_pct = 0.12;
    double base_target_pct = 0.15;
    double base_stop_pct = 0.15;

    // Volatility adjustment
    double high_volatility_adx = 30.0;
    double volatility_target_scale = 1.2;
    double volatility_stop_scale = 1.1;
};

/// Finalized levels for one trade setup
struct RiskParameters {
    Price entry;
    Price target;
    Price stop_loss;
    double target_pct = 0.0;
    double stop_pct = 0.0;
    double reward_risk = 0.0;
    double per_unit_risk = 0.0;
    int quantity = 1;
    bool volatility_adjusted = false;
};

// ============================================================================
// Position Sizing
// ============================================================================

class PositionSizer {
public:
    /// floor(budget / per_unit_risk) clamped to [min_units, max_units]
    /// Zero or invalid risk yields min_units without dividing
    [[nodiscard]] static int fixed_risk_units(double risk_budget,
                                              double per_unit_risk,
                                              int min_units,
                                              int max_units) noexcept;
};

// ============================================================================
// Risk Calculator
// ============================================================================

class RiskCalculator {
public:
    explicit RiskCalculator(const RiskConfig& config = RiskConfig{}) : config_(config) {}

    /// nullopt when entry is not positive or reward-to-risk < min_reward_risk
    [[nodiscard]] std::optional<RiskParameters> compute(double entry_price,
                                                        Direction direction,
                                                        const strategy::TechnicalSnapshot& technical,
                                                        int confidence) const;

    /// |target - entry| / |entry - stop|, 0 when there is no risk
    [[nodiscard]] static double reward_to_risk(double entry, double target, double stop) noexcept;

    [[nodiscard]] const RiskConfig& config() const { return config_; }

private:
    RiskConfig config_;
};

}  // namespace fno::risk
