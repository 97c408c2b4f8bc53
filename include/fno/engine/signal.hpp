#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Signal
// ============================================================================
// Immutable output unit of the engine. Only Signal::create can build one,
// and it refuses setups whose reward-to-risk is below the minimum.
// ============================================================================

#include "fno/core/types.hpp"
#include "fno/market/option_chain.hpp"
#include "fno/strategy/open_interest_analyzer.hpp"
#include "fno/strategy/technical_analyzer.hpp"

#include <optional>
#include <string>

namespace fno::engine {

/// Human-readable context carried with a signal
struct SignalNarrative {
    std::string reasoning;
    std::string technical_setup;
    std::string vwap_analysis;
    std::string volume_profile;
    std::string time_decay_impact;
};

/// Everything needed to build a Signal
struct SignalDraft {
    Symbol instrument;
    market::OptionContract contract;
    Direction direction = Direction::BuyCall;
    Price entry;
    Price target;
    Price stop_loss;
    int confidence = 0;
    int quantity = 1;
    bool mean_reversion = false;
    SignalNarrative narrative;
    strategy::OIAnalysis oi_analysis;
    strategy::TechnicalSnapshot technical;
    Timestamp created_at;
};

class Signal {
public:
    /// nullopt when reward-to-risk computed from the draft's prices is below
    /// min_reward_risk, or the quantity is outside [1, 10]
    [[nodiscard]] static std::optional<Signal> create(SignalDraft draft, double min_reward_risk);

    [[nodiscard]] const Symbol& instrument() const noexcept { return draft_.instrument; }
    [[nodiscard]] const market::OptionContract& contract() const noexcept { return draft_.contract; }
    [[nodiscard]] Direction direction() const noexcept { return draft_.direction; }
    [[nodiscard]] Price entry() const noexcept { return draft_.entry; }
    [[nodiscard]] Price target() const noexcept { return draft_.target; }
    [[nodiscard]] Price stop_loss() const noexcept { return draft_.stop_loss; }
    [[nodiscard]] int confidence() const noexcept { return draft_.confidence; }
    [[nodiscard]] ConfidenceTier tier() const noexcept { return confidence_tier(draft_.confidence); }
    [[nodiscard]] double reward_risk() const noexcept { return reward_risk_; }
    [[nodiscard]] int quantity() const noexcept { return draft_.quantity; }
    [[nodiscard]] bool is_mean_reversion() const noexcept { return draft_.mean_reversion; }
    [[nodiscard]] Sentiment market_sentiment() const noexcept { return draft_.oi_analysis.sentiment; }
    [[nodiscard]] ChartPattern pattern() const noexcept { return draft_.technical.pattern; }
    [[nodiscard]] const SignalNarrative& narrative() const noexcept { return draft_.narrative; }
    [[nodiscard]] Timestamp created_at() const noexcept { return draft_.created_at; }

    // Provenance
    [[nodiscard]] const strategy::OIAnalysis& oi_analysis() const noexcept { return draft_.oi_analysis; }
    [[nodiscard]] const strategy::TechnicalSnapshot& technical() const noexcept { return draft_.technical; }

private:
    Signal(SignalDraft draft, double reward_risk) : draft_(std::move(draft)), reward_risk_(reward_risk) {}

    SignalDraft draft_;
    double reward_risk_;
};

}  // namespace fno::engine
