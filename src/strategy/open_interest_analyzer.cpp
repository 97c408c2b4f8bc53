// ============================================================================
// FNO SIGNAL ENGINE - Open Interest Analyzer Implementation
// ============================================================================

#include "fno/strategy/open_interest_analyzer.hpp"

#include <cmath>
#include <cstdlib>

namespace fno::strategy {

namespace {

/// Max OI wins; ties go to higher volume, then to the lower strike
bool outranks(const market::OptionContract& a, const market::OptionContract& b) noexcept {
    if (a.open_interest != b.open_interest) return a.open_interest > b.open_interest;
    if (a.volume != b.volume) return a.volume > b.volume;
    return a.strike < b.strike;
}

}  // namespace

std::optional<OIAnalysis> OpenInterestAnalyzer::analyze(const market::OptionChain& chain) const {
    if (!chain.spot.is_valid()) {
        return std::nullopt;
    }

    const market::OptionContract* max_call = nullptr;
    const market::OptionContract* max_put = nullptr;
    int64_t call_oi = 0;
    int64_t put_oi = 0;

    for (const auto& contract : chain.contracts) {
        switch (contract.type) {
            case OptionType::Call:
                call_oi += contract.open_interest;
                if (!max_call || outranks(contract, *max_call)) max_call = &contract;
                break;
            case OptionType::Put:
                put_oi += contract.open_interest;
                if (!max_put || outranks(contract, *max_put)) max_put = &contract;
                break;
        }
    }

    if (!max_call || !max_put || call_oi <= 0) {
        return std::nullopt;
    }

    OIAnalysis result;
    result.total_call_oi = call_oi;
    result.total_put_oi = put_oi;
    result.put_call_ratio = static_cast<double>(put_oi) / static_cast<double>(call_oi);
    result.atm_strike = nearest_strike(chain);
    result.max_call_oi_strike = max_call->strike;
    result.max_put_oi_strike = max_put->strike;
    result.support = max_put->strike;
    result.resistance = max_call->strike;
    result.sentiment = sentiment_for(result.put_call_ratio);
    result.strength = strength_for(result.put_call_ratio);
    return result;
}

Price OpenInterestAnalyzer::nearest_strike(const market::OptionChain& chain) {
    Price best;
    int64_t best_distance = -1;
    for (const auto& contract : chain.contracts) {
        const int64_t distance = std::llabs(contract.strike.raw() - chain.spot.raw());
        if (best_distance < 0 || distance < best_distance ||
            (distance == best_distance && contract.strike < best)) {
            best = contract.strike;
            best_distance = distance;
        }
    }
    return best;
}

Sentiment OpenInterestAnalyzer::sentiment_for(double pcr) noexcept {
    if (pcr > BULLISH_PCR) return Sentiment::Bullish;
    if (pcr < BEARISH_PCR) return Sentiment::Bearish;
    return Sentiment::Neutral;
}

OIStrength OpenInterestAnalyzer::strength_for(double pcr) noexcept {
    return std::abs(pcr - 1.0) > STRONG_DIVERGENCE ? OIStrength::Strong : OIStrength::Moderate;
}

}  // namespace fno::strategy
