#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Option Chain
// ============================================================================
// Snapshot of all contracts of one underlying for a single expiry cycle
// ============================================================================

#include "fno/core/types.hpp"

#include <cstdint>
#include <vector>

namespace fno::market {

struct OptionContract {
    Symbol symbol;        // Trading symbol, e.g. NIFTY24OCT19850CE
    Symbol underlying;
    Price strike;
    OptionType type = OptionType::Call;
    Date expiry;
    Price last_price;
    int64_t open_interest = 0;
    int64_t volume = 0;
};

struct OptionChain {
    Symbol underlying;
    Price spot;
    Timestamp timestamp;
    std::vector<OptionContract> contracts;

    [[nodiscard]] size_t count(OptionType type) const noexcept {
        size_t n = 0;
        for (const auto& c : contracts) {
            if (c.type == type) ++n;
        }
        return n;
    }

    [[nodiscard]] bool empty() const noexcept { return contracts.empty(); }
};

}  // namespace fno::market
