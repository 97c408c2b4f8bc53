#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Signal Engine
// ============================================================================
// Per-instrument pipeline:
//   chain -> OI analysis -> history -> technical snapshot -> direction
//   -> confidence gate -> strike -> risk -> quota -> Signal
//
// Every stage short-circuits to a reported outcome; nothing is retried
// within a cycle. Instruments are independent, so evaluate() may be called
// concurrently as long as the provider tolerates it. The quota is the only
// shared mutable state and lives in the injected DailySignalCounter.
// ============================================================================

#include "fno/config/engine_config.hpp"
#include "fno/core/error.hpp"
#include "fno/core/types.hpp"
#include "fno/engine/signal.hpp"
#include "fno/market/market_data_provider.hpp"
#include "fno/risk/daily_signal_counter.hpp"
#include "fno/risk/risk_calculator.hpp"
#include "fno/strategy/open_interest_analyzer.hpp"
#include "fno/strategy/signal_type_resolver.hpp"
#include "fno/strategy/strike_selector.hpp"
#include "fno/strategy/technical_analyzer.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace fno::engine {

struct EvaluationResult {
    EvaluationOutcome outcome = EvaluationOutcome::NoOpportunity;
    std::optional<Signal> signal;  // set only when outcome == Emitted
};

class SignalEngine {
public:
    SignalEngine(market::MarketDataProvider& provider,
                 risk::DailySignalCounter& counter,
                 const config::EngineConfig& config = config::EngineConfig{});

    // Non-copyable (atomic stats)
    SignalEngine(const SignalEngine&) = delete;
    SignalEngine& operator=(const SignalEngine&) = delete;

    /// Run the pipeline once for an instrument
    [[nodiscard]] EvaluationResult evaluate_detailed(const Symbol& instrument);

    /// Same as evaluate_detailed, keeping only the signal
    [[nodiscard]] std::optional<Signal> evaluate(const Symbol& instrument);

    /// Evaluate the configured universe: primary instruments first, then up
    /// to max_stock_scans stocks. Stops early once the daily quota is gone.
    [[nodiscard]] std::vector<Signal> scan();

    /// Evaluate an explicit list in order, stopping once the quota is gone
    [[nodiscard]] std::vector<Signal> scan(std::span<const Symbol> instruments);

    /// Day rollover: clears the emission quota
    void reset_daily_counters() noexcept;

    // ========================================================================
    // Statistics
    // ========================================================================

    [[nodiscard]] uint64_t outcome_count(EvaluationOutcome outcome) const noexcept;
    [[nodiscard]] uint64_t evaluations() const noexcept;
    void reset_stats() noexcept;

    [[nodiscard]] const config::EngineConfig& config() const noexcept { return config_; }

private:
    EvaluationResult run_pipeline(const Symbol& instrument);
    EvaluationResult finish(const Symbol& instrument, EvaluationOutcome outcome,
                            std::optional<Signal> signal = std::nullopt);

    market::MarketDataProvider& provider_;
    risk::DailySignalCounter& counter_;
    config::EngineConfig config_;

    strategy::OpenInterestAnalyzer oi_analyzer_;
    strategy::TechnicalAnalyzer technical_analyzer_;
    strategy::SignalTypeResolver resolver_;
    strategy::StrikeSelector strike_selector_;
    risk::RiskCalculator risk_calculator_;

    static constexpr size_t OUTCOME_COUNT = 8;
    std::array<std::atomic<uint64_t>, OUTCOME_COUNT> outcomes_{};
};

}  // namespace fno::engine
