// ============================================================================
// FNO SIGNAL ENGINE - JSON Snapshot Provider Implementation
// ============================================================================

#include "fno/market/json_snapshot_provider.hpp"

#include "fno/utils/logger.hpp"

#include <charconv>
#include <utility>

namespace fno::market {

namespace {

bool parse_int(std::string_view text, int& out) noexcept {
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

}  // namespace

JsonSnapshotProvider::JsonSnapshotProvider(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::optional<simdjson::padded_string> JsonSnapshotProvider::load(const Symbol& symbol) const {
    const auto path = directory_ / (std::string(symbol.view()) + ".json");

    simdjson::padded_string json;
    if (auto error = simdjson::padded_string::load(path.string()).get(json); error) {
        FNO_LOG_WARN("{}: cannot read {} ({})", symbol.view(), path.string(),
                     simdjson::error_message(error));
        return std::nullopt;
    }
    return json;
}

std::optional<OptionChain> JsonSnapshotProvider::get_option_chain(const Symbol& symbol) {
    auto json = load(symbol);
    if (!json) return std::nullopt;

    std::lock_guard lock(parser_mutex_);
    try {
        auto doc = parser_.iterate(*json);

        OptionChain chain;
        chain.underlying = symbol;

        // Spot and timestamp are optional in a snapshot
        double spot = 0.0;
        if (doc["spot"].get_double().get(spot) == simdjson::SUCCESS) {
            chain.spot = Price::from_double(spot);
        }
        int64_t ts = 0;
        chain.timestamp = doc["timestamp"].get_int64().get(ts) == simdjson::SUCCESS
                              ? from_epoch_ms(ts)
                              : now();

        for (auto entry : doc["contracts"].get_array()) {
            OptionContract contract;
            contract.underlying = symbol;
            contract.symbol = Symbol(entry["symbol"].get_string().value());
            contract.strike = Price::from_double(entry["strike"].get_double().value());

            const auto type = parse_option_type(entry["type"].get_string().value());
            const auto expiry = parse_date(entry["expiry"].get_string().value());
            if (!type || !expiry) {
                FNO_LOG_WARN("{}: skipping malformed contract {}", symbol.view(), contract.symbol.view());
                continue;
            }
            contract.type = *type;
            contract.expiry = *expiry;
            contract.last_price = Price::from_double(entry["ltp"].get_double().value());
            contract.open_interest = entry["oi"].get_int64().value();
            contract.volume = entry["volume"].get_int64().value();
            chain.contracts.push_back(contract);
        }

        return chain;
    } catch (const simdjson::simdjson_error& e) {
        FNO_LOG_WARN("{}: option chain parse failed: {}", symbol.view(), e.what());
        return std::nullopt;
    }
}

PriceHistory JsonSnapshotProvider::get_price_history(const Symbol& symbol, size_t lookback) {
    auto json = load(symbol);
    if (!json) return {};

    PriceHistory history;
    {
        std::lock_guard lock(parser_mutex_);
        try {
            auto doc = parser_.iterate(*json);
            for (auto entry : doc["history"].get_array()) {
                PriceBar bar;
                bar.timestamp = from_epoch_ms(entry["t"].get_int64().value());
                bar.open = entry["o"].get_double().value();
                bar.high = entry["h"].get_double().value();
                bar.low = entry["l"].get_double().value();
                bar.close = entry["c"].get_double().value();
                bar.volume = entry["v"].get_double().value();
                history.push_back(bar);
            }
        } catch (const simdjson::simdjson_error& e) {
            FNO_LOG_WARN("{}: price history parse failed: {}", symbol.view(), e.what());
            return {};
        }
    }

    if (!is_well_ordered(history)) {
        FNO_LOG_WARN("{}: price history is not strictly ascending", symbol.view());
        return {};
    }

    if (history.size() > lookback) {
        history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(lookback));
    }
    return history;
}

double JsonSnapshotProvider::get_spot_price(const Symbol& symbol) {
    auto json = load(symbol);
    if (!json) return 0.0;

    std::lock_guard lock(parser_mutex_);
    auto doc = parser_.iterate(*json);
    double spot = 0.0;
    if (doc["spot"].get_double().get(spot) != simdjson::SUCCESS) {
        return 0.0;
    }
    return spot;
}

std::optional<Date> JsonSnapshotProvider::parse_date(std::string_view text) noexcept {
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_int(text.substr(0, 4), year) ||
        !parse_int(text.substr(5, 2), month) ||
        !parse_int(text.substr(8, 2), day)) {
        return std::nullopt;
    }

    const Date date{std::chrono::year{year},
                    std::chrono::month{static_cast<unsigned>(month)},
                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

std::optional<OptionType> JsonSnapshotProvider::parse_option_type(std::string_view text) noexcept {
    if (text == "CE") return OptionType::Call;
    if (text == "PE") return OptionType::Put;
    return std::nullopt;
}

}  // namespace fno::market
