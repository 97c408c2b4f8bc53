// ============================================================================
// FNO SIGNAL ENGINE - Risk Calculator Implementation
// ============================================================================

#include "fno/risk/risk_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace fno::risk {

int PositionSizer::fixed_risk_units(double risk_budget,
                                    double per_unit_risk,
                                    int min_units,
                                    int max_units) noexcept {
    if (!(per_unit_risk > 0.0) || !std::isfinite(per_unit_risk) || !(risk_budget > 0.0)) {
        return min_units;
    }

    const double units = std::floor(risk_budget / per_unit_risk);
    if (units >= static_cast<double>(max_units)) return max_units;
    if (units <= static_cast<double>(min_units)) return min_units;
    return static_cast<int>(units);
}

std::optional<RiskParameters> RiskCalculator::compute(double entry_price,
                                                      Direction direction,
                                                      const strategy::TechnicalSnapshot& technical,
                                                      int confidence) const {
    if (!std::isfinite(entry_price)) {
        return std::nullopt;
    }
    entry_price = round_to_tick(entry_price);
    if (!(entry_price > 0.0)) {
        return std::nullopt;
    }

    RiskParameters params;

    switch (confidence_tier(confidence)) {
        case ConfidenceTier::VeryHigh:
            params.target_pct = config_.very_high_target_pct;
            params.stop_pct = config_.very_high_stop_pct;
            break;
        case ConfidenceTier::High:
            params.target_pct = config_.high_target_pct;
            params.stop_pct = config_.high_stop_pct;
            break;
        case ConfidenceTier::Medium:
        case ConfidenceTier::Low:
            params.target_pct = config_.base_target_pct;
            params.stop_pct = config_.base_stop_pct;
            break;
    }

    if (technical.indicators.adx > config_.high_volatility_adx) {
        params.target_pct *= config_.volatility_target_scale;
        params.stop_pct *= config_.volatility_stop_scale;
        params.volatility_adjusted = true;
    }

    double target = 0.0;
    double stop = 0.0;
    if (is_buy(direction)) {
        target = round_to_tick(entry_price * (1.0 + params.target_pct));
        stop = round_to_tick(entry_price * (1.0 - params.stop_pct));
    } else {
        target = round_to_tick(entry_price * (1.0 - params.target_pct));
        stop = round_to_tick(entry_price * (1.0 + params.stop_pct));
    }

    params.reward_risk = reward_to_risk(entry_price, target, stop);
    if (params.reward_risk < config_.min_reward_risk) {
        return std::nullopt;
    }

    params.entry = Price::from_double(entry_price);
    params.target = Price::from_double(target);
    params.stop_loss = Price::from_double(stop);
    params.per_unit_risk = std::abs(entry_price - stop);
    params.quantity = PositionSizer::fixed_risk_units(config_.max_risk_per_trade,
                                                      params.per_unit_risk,
                                                      config_.min_position_size,
                                                      config_.max_position_size);
    return params;
}

double RiskCalculator::reward_to_risk(double entry, double target, double stop) noexcept {
    const double risk = std::abs(entry - stop);
    if (risk <= 0.0) return 0.0;
    return std::abs(target - entry) / risk;
}

}  // namespace fno::risk
