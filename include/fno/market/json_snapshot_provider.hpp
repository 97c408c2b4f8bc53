#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - JSON Snapshot Provider
// ============================================================================
// MarketDataProvider backed by one JSON file per instrument:
//   <directory>/<SYMBOL>.json
//   {
//     "spot": 19850.5,
//     "timestamp": 1729503000000,
//     "contracts": [ { "symbol": "NIFTY24OCT19900CE", "strike": 19900,
//                      "type": "CE", "expiry": "2024-10-24",
//                      "ltp": 150.0, "oi": 120000, "volume": 50000 } ],
//     "history": [ { "t": 1729416600000, "o": 0, "h": 0, "l": 0,
//                    "c": 0, "v": 0 } ]
//   }
// Files are re-read on every call so an external recorder can refresh them.
// ============================================================================

#include "fno/market/market_data_provider.hpp"

#include <simdjson.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace fno::market {

class JsonSnapshotProvider final : public MarketDataProvider {
public:
    explicit JsonSnapshotProvider(std::filesystem::path directory);

    [[nodiscard]] std::optional<OptionChain> get_option_chain(const Symbol& symbol) override;
    [[nodiscard]] PriceHistory get_price_history(const Symbol& symbol, size_t lookback) override;
    [[nodiscard]] double get_spot_price(const Symbol& symbol) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    /// "YYYY-MM-DD" to a calendar date, nullopt when malformed
    [[nodiscard]] static std::optional<Date> parse_date(std::string_view text) noexcept;

    /// "CE"/"PE"
    [[nodiscard]] static std::optional<OptionType> parse_option_type(std::string_view text) noexcept;

private:
    [[nodiscard]] std::optional<simdjson::padded_string> load(const Symbol& symbol) const;

    std::filesystem::path directory_;
    simdjson::ondemand::parser parser_;
    std::mutex parser_mutex_;
};

}  // namespace fno::market
