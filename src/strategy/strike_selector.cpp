// ============================================================================
// FNO SIGNAL ENGINE - Strike Selector Implementation
// ============================================================================

#include "fno/strategy/strike_selector.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace fno::strategy {

std::optional<market::OptionContract> StrikeSelector::select(
    Direction direction,
    std::span<const market::OptionContract> contracts,
    Price spot) const {
    const OptionType wanted = option_type_of(direction);

    std::vector<const market::OptionContract*> filtered;
    for (const auto& contract : contracts) {
        if (contract.type == wanted) filtered.push_back(&contract);
    }
    if (filtered.empty()) {
        return std::nullopt;
    }

    std::vector<const market::OptionContract*> candidates;
    if (is_buy(direction)) {
        // Nearest out-of-the-money strikes
        for (const auto* contract : filtered) {
            const bool otm = wanted == OptionType::Call ? contract->strike >= spot
                                                        : contract->strike <= spot;
            if (otm) candidates.push_back(contract);
        }
        std::stable_sort(candidates.begin(), candidates.end(),
                         [wanted](const auto* a, const auto* b) {
                             return wanted == OptionType::Call ? a->strike < b->strike
                                                               : a->strike > b->strike;
                         });
        if (candidates.size() > CANDIDATES) candidates.resize(CANDIDATES);
    }

    if (candidates.empty()) {
        // Nearest to spot regardless of moneyness
        candidates = filtered;
        std::stable_sort(candidates.begin(), candidates.end(),
                         [spot](const auto* a, const auto* b) {
                             return std::llabs(a->strike.raw() - spot.raw()) <
                                    std::llabs(b->strike.raw() - spot.raw());
                         });
        if (candidates.size() > CANDIDATES) candidates.resize(CANDIDATES);
    }

    const market::OptionContract* best = candidates.front();
    for (const auto* contract : candidates) {
        if (liquidity_score(*contract) > liquidity_score(*best)) best = contract;
    }
    return *best;
}

double StrikeSelector::liquidity_score(const market::OptionContract& contract) noexcept {
    const auto oi = static_cast<double>(contract.open_interest);
    return contract.volume > 0 ? oi * static_cast<double>(contract.volume) : oi;
}

}  // namespace fno::strategy
