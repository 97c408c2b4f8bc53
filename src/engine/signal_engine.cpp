// ============================================================================
// FNO SIGNAL ENGINE - Signal Engine Implementation
// ============================================================================

#include "fno/engine/signal_engine.hpp"

#include "fno/engine/signal_narrative.hpp"
#include "fno/utils/logger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace fno::engine {

SignalEngine::SignalEngine(market::MarketDataProvider& provider,
                           risk::DailySignalCounter& counter,
                           const config::EngineConfig& config)
    : provider_(provider),
      counter_(counter),
      config_(config),
      risk_calculator_(config.risk) {}

EvaluationResult SignalEngine::evaluate_detailed(const Symbol& instrument) {
    FNO_SCOPED_TIMER("evaluate");
    try {
        return run_pipeline(instrument);
    } catch (const InsufficientDataError& e) {
        FNO_LOG_DEBUG("{}: {}", instrument.view(), e.what());
        return finish(instrument, EvaluationOutcome::InsufficientData);
    } catch (const std::exception& e) {
        FNO_LOG_ERROR("{}: evaluation failed: {}", instrument.view(), e.what());
        return finish(instrument, EvaluationOutcome::UpstreamUnavailable);
    }
}

std::optional<Signal> SignalEngine::evaluate(const Symbol& instrument) {
    return evaluate_detailed(instrument).signal;
}

EvaluationResult SignalEngine::run_pipeline(const Symbol& instrument) {
    if (counter_.exhausted()) {
        return finish(instrument, EvaluationOutcome::QuotaExhausted);
    }

    // ------------------------------------------------------------------------
    // Option chain and open interest
    // ------------------------------------------------------------------------
    auto chain = provider_.get_option_chain(instrument);
    if (!chain || chain->empty()) {
        FNO_LOG_WARN("{}: option chain unavailable", instrument.view());
        return finish(instrument, EvaluationOutcome::UpstreamUnavailable);
    }

    if (!chain->spot.is_valid()) {
        const double spot = provider_.get_spot_price(instrument);
        if (!(spot > 0.0)) {
            FNO_LOG_WARN("{}: spot price unavailable", instrument.view());
            return finish(instrument, EvaluationOutcome::UpstreamUnavailable);
        }
        chain->spot = Price::from_double(spot);
    }

    const auto oi = oi_analyzer_.analyze(*chain);
    if (!oi) {
        FNO_LOG_DEBUG("{}: chain lacks one side or has no call OI", instrument.view());
        return finish(instrument, EvaluationOutcome::InsufficientData);
    }

    // ------------------------------------------------------------------------
    // Technical snapshot
    // ------------------------------------------------------------------------
    const auto history = provider_.get_price_history(instrument, config_.history_lookback);
    if (history.empty()) {
        FNO_LOG_WARN("{}: price history unavailable", instrument.view());
        return finish(instrument, EvaluationOutcome::UpstreamUnavailable);
    }

    const auto technical = technical_analyzer_.analyze(history);

    // ------------------------------------------------------------------------
    // Direction and confidence gate
    // ------------------------------------------------------------------------
    const auto call = resolver_.resolve(*oi, technical);
    if (!call) {
        FNO_LOG_DEBUG("{}: no confluence (OI {}, trend {}, RSI {:.1f})",
                      instrument.view(), to_string(oi->sentiment),
                      to_string(technical.trend), technical.indicators.rsi);
        return finish(instrument, EvaluationOutcome::NoOpportunity);
    }

    if (call->confidence < config_.min_confidence) {
        FNO_LOG_DEBUG("{}: {} confidence {} below {}", instrument.view(),
                      to_string(call->direction), call->confidence, config_.min_confidence);
        return finish(instrument, EvaluationOutcome::BelowMinConfidence);
    }

    // ------------------------------------------------------------------------
    // Contract and risk
    // ------------------------------------------------------------------------
    const auto contract = strike_selector_.select(call->direction, chain->contracts, chain->spot);
    if (!contract) {
        FNO_LOG_DEBUG("{}: no {} contract in chain", instrument.view(),
                      to_string(option_type_of(call->direction)));
        return finish(instrument, EvaluationOutcome::NoContract);
    }

    const auto risk = risk_calculator_.compute(contract->last_price.to_double(),
                                               call->direction, technical, call->confidence);
    if (!risk) {
        FNO_LOG_DEBUG("{}: {} rejected by reward-to-risk gate", instrument.view(),
                      contract->symbol.view());
        return finish(instrument, EvaluationOutcome::RiskRejected);
    }

    SignalDraft draft;
    draft.instrument = instrument;
    draft.contract = *contract;
    draft.direction = call->direction;
    draft.entry = risk->entry;
    draft.target = risk->target;
    draft.stop_loss = risk->stop_loss;
    draft.confidence = call->confidence;
    draft.quantity = risk->quantity;
    draft.mean_reversion = call->mean_reversion;
    draft.narrative = build_narrative(*oi, technical, contract->expiry, session_date(chain->timestamp));
    draft.oi_analysis = *oi;
    draft.technical = technical;
    draft.created_at = now();

    auto signal = Signal::create(std::move(draft), config_.risk.min_reward_risk);
    if (!signal) {
        return finish(instrument, EvaluationOutcome::RiskRejected);
    }

    // ------------------------------------------------------------------------
    // Quota (authoritative check, taken only for a finished signal)
    // ------------------------------------------------------------------------
    if (!counter_.try_acquire()) {
        return finish(instrument, EvaluationOutcome::QuotaExhausted);
    }

    FNO_LOG_INFO("{}: {} {} @ {:.2f} target {:.2f} stop {:.2f} conf {}% RR {:.2f} qty {}",
                 instrument.view(), to_string(signal->direction()), signal->contract().symbol.view(),
                 signal->entry().to_double(), signal->target().to_double(),
                 signal->stop_loss().to_double(), signal->confidence(),
                 signal->reward_risk(), signal->quantity());
    return finish(instrument, EvaluationOutcome::Emitted, std::move(signal));
}

EvaluationResult SignalEngine::finish(const Symbol& instrument, EvaluationOutcome outcome,
                                      std::optional<Signal> signal) {
    outcomes_[static_cast<size_t>(outcome)].fetch_add(1, std::memory_order_relaxed);
    if (outcome == EvaluationOutcome::QuotaExhausted) {
        FNO_LOG_DEBUG("{}: daily quota of {} reached", instrument.view(), counter_.limit());
    }
    return EvaluationResult{outcome, std::move(signal)};
}

std::vector<Signal> SignalEngine::scan() {
    std::vector<Symbol> universe;
    for (const auto& name : config_.instruments.primary) {
        universe.emplace_back(name);
    }
    const size_t stocks = std::min(config_.instruments.stocks.size(),
                                   config_.instruments.max_stock_scans);
    for (size_t i = 0; i < stocks; ++i) {
        universe.emplace_back(config_.instruments.stocks[i]);
    }
    return scan(universe);
}

std::vector<Signal> SignalEngine::scan(std::span<const Symbol> instruments) {
    std::vector<Signal> signals;
    for (const auto& instrument : instruments) {
        if (counter_.exhausted()) {
            FNO_LOG_INFO("Daily signal limit reached ({}), scan stopped", counter_.limit());
            break;
        }
        auto result = evaluate_detailed(instrument);
        if (result.signal) {
            signals.push_back(std::move(*result.signal));
        }
    }
    FNO_LOG_INFO("Scan complete: {} signal(s), {}/{} used today",
                 signals.size(), counter_.count(), counter_.limit());
    return signals;
}

void SignalEngine::reset_daily_counters() noexcept {
    counter_.reset();
}

uint64_t SignalEngine::outcome_count(EvaluationOutcome outcome) const noexcept {
    return outcomes_[static_cast<size_t>(outcome)].load(std::memory_order_relaxed);
}

uint64_t SignalEngine::evaluations() const noexcept {
    uint64_t total = 0;
    for (const auto& count : outcomes_) {
        total += count.load(std::memory_order_relaxed);
    }
    return total;
}

void SignalEngine::reset_stats() noexcept {
    for (auto& count : outcomes_) {
        count.store(0, std::memory_order_relaxed);
    }
}

}  // namespace fno::engine
