#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Configuration
// ============================================================================
// Engine, risk, instrument universe and logging settings, loaded from YAML
// ============================================================================

#include "fno/risk/risk_calculator.hpp"
#include "fno/utils/logger.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fno::config {

struct InstrumentUniverse {
    std::vector<std::string> primary = {"NIFTY", "BANKNIFTY"};
    std::vector<std::string> stocks = {"RELIANCE", "HDFC", "ICICIBANK", "INFY", "TCS"};
    size_t max_stock_scans = 3;  // stocks evaluated per scan after the indices
};

struct EngineConfig {
    int min_confidence = 75;
    uint32_t max_signals_per_day = 8;
    size_t history_lookback = 200;  // bars requested per instrument

    risk::RiskConfig risk;
    InstrumentUniverse instruments;
    utils::LogConfig logging;
};

/// Load from a YAML file. Missing keys keep their defaults.
/// Throws ConfigError on unreadable files, malformed YAML or invalid values.
[[nodiscard]] EngineConfig load_config(const std::string& path);

/// Same as load_config for in-memory YAML text
[[nodiscard]] EngineConfig parse_config(const std::string& yaml_text);

/// Throws ConfigError describing the first invalid field
void validate(const EngineConfig& config);

}  // namespace fno::config
