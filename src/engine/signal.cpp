// ============================================================================
// FNO SIGNAL ENGINE - Signal Implementation
// ============================================================================

#include "fno/engine/signal.hpp"

#include "fno/risk/risk_calculator.hpp"

#include <utility>

namespace fno::engine {

namespace {

constexpr int MIN_QUANTITY = 1;
constexpr int MAX_QUANTITY = 10;

}  // namespace

std::optional<Signal> Signal::create(SignalDraft draft, double min_reward_risk) {
    if (!draft.entry.is_valid()) {
        return std::nullopt;
    }
    if (draft.quantity < MIN_QUANTITY || draft.quantity > MAX_QUANTITY) {
        return std::nullopt;
    }

    const double rr = risk::RiskCalculator::reward_to_risk(draft.entry.to_double(),
                                                           draft.target.to_double(),
                                                           draft.stop_loss.to_double());
    if (rr < min_reward_risk) {
        return std::nullopt;
    }

    return Signal(std::move(draft), rr);
}

}  // namespace fno::engine
