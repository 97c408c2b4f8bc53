// ============================================================================
// FNO SIGNAL ENGINE - Configuration Loader
// ============================================================================

#include "fno/config/engine_config.hpp"

#include "fno/core/error.hpp"
#include "fno/strategy/indicator_calculator.hpp"

#include <yaml-cpp/yaml.h>

namespace fno::config {

namespace {

std::vector<std::string> read_symbols(const YAML::Node& node, std::vector<std::string> fallback) {
    if (!node) return fallback;
    std::vector<std::string> symbols;
    for (const auto& entry : node) {
        symbols.push_back(entry.as<std::string>());
    }
    return symbols;
}

EngineConfig from_yaml(const YAML::Node& yaml) {
    EngineConfig config;

    // Engine
    if (yaml["engine"]) {
        auto engine = yaml["engine"];
        config.min_confidence = engine["min_confidence"].as<int>(config.min_confidence);
        config.max_signals_per_day = engine["max_signals_per_day"].as<uint32_t>(config.max_signals_per_day);
        config.history_lookback = engine["history_lookback"].as<size_t>(config.history_lookback);
    }

    // Risk
    if (yaml["risk"]) {
        auto risk = yaml["risk"];
        auto& rc = config.risk;
        rc.min_reward_risk = risk["min_reward_risk"].as<double>(rc.min_reward_risk);
        rc.max_risk_per_trade = risk["max_risk_per_trade"].as<double>(rc.max_risk_per_trade);
        rc.min_position_size = risk["min_position_size"].as<int>(rc.min_position_size);
        rc.max_position_size = risk["max_position_size"].as<int>(rc.max_position_size);
        rc.high_volatility_adx = risk["high_volatility_adx"].as<double>(rc.high_volatility_adx);
    }

    // Instruments
    if (yaml["instruments"]) {
        auto inst = yaml["instruments"];
        auto& universe = config.instruments;
        universe.primary = read_symbols(inst["primary"], universe.primary);
        universe.stocks = read_symbols(inst["stocks"], universe.stocks);
        universe.max_stock_scans = inst["max_stock_scans"].as<size_t>(universe.max_stock_scans);
    }

    // Logging
    if (yaml["logging"]) {
        auto log = yaml["logging"];
        auto& lc = config.logging;
        lc.level = utils::parse_log_level(log["level"].as<std::string>("info"));
        lc.log_file = log["file"].as<std::string>(lc.log_file);
        lc.async = log["async"].as<bool>(lc.async);
        lc.max_file_size_mb = log["max_file_size_mb"].as<size_t>(lc.max_file_size_mb);
        lc.max_files = log["max_files"].as<size_t>(lc.max_files);
    }

    return config;
}

}  // namespace

EngineConfig load_config(const std::string& path) {
    EngineConfig config;
    try {
        config = from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("config load failed (" + path + "): " + e.what());
    }
    validate(config);
    return config;
}

EngineConfig parse_config(const std::string& yaml_text) {
    EngineConfig config;
    try {
        config = from_yaml(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("config parse failed: ") + e.what());
    }
    validate(config);
    return config;
}

void validate(const EngineConfig& config) {
    if (config.min_confidence < 0 || config.min_confidence > 100) {
        throw ConfigError("engine.min_confidence must be within [0, 100]");
    }
    if (config.max_signals_per_day == 0) {
        throw ConfigError("engine.max_signals_per_day must be positive");
    }
    if (config.history_lookback < strategy::IndicatorCalculator::MIN_BARS) {
        throw ConfigError("engine.history_lookback must be at least " +
                          std::to_string(strategy::IndicatorCalculator::MIN_BARS));
    }
    if (config.risk.min_reward_risk <= 0.0) {
        throw ConfigError("risk.min_reward_risk must be positive");
    }
    if (config.risk.max_risk_per_trade <= 0.0) {
        throw ConfigError("risk.max_risk_per_trade must be positive");
    }
    if (config.risk.min_position_size < 1 ||
        config.risk.max_position_size < config.risk.min_position_size ||
        config.risk.max_position_size > 10) {
        throw ConfigError("risk position size bounds must satisfy 1 <= min <= max <= 10");
    }
    if (config.instruments.primary.empty() && config.instruments.stocks.empty()) {
        throw ConfigError("instruments: universe is empty");
    }
}

}  // namespace fno::config
