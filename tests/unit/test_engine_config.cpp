// ============================================================================
// FNO SIGNAL ENGINE - Configuration Unit Tests
// ============================================================================

#include "fno/config/engine_config.hpp"
#include "fno/core/error.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace fno;
using namespace fno::config;

TEST(EngineConfigTest, EmptyDocumentKeepsDefaults) {
    const auto config = parse_config("{}");
    EXPECT_EQ(config.min_confidence, 75);
    EXPECT_EQ(config.max_signals_per_day, 8u);
    EXPECT_DOUBLE_EQ(config.risk.min_reward_risk, 2.0);
    EXPECT_DOUBLE_EQ(config.risk.max_risk_per_trade, 500.0);
    ASSERT_EQ(config.instruments.primary.size(), 2u);
    EXPECT_EQ(config.instruments.primary[0], "NIFTY");
    EXPECT_EQ(config.instruments.stocks.size(), 5u);
    EXPECT_EQ(config.instruments.max_stock_scans, 3u);
}

TEST(EngineConfigTest, OverridesFromYaml) {
    const auto config = parse_config(R"(
engine:
  min_confidence: 80
  max_signals_per_day: 4
  history_lookback: 120
risk:
  min_reward_risk: 2.5
  max_risk_per_trade: 1000
  max_position_size: 5
instruments:
  primary: [FINNIFTY]
  stocks: [SBIN, ITC]
  max_stock_scans: 1
logging:
  level: debug
  file: logs/fno.log
)");

    EXPECT_EQ(config.min_confidence, 80);
    EXPECT_EQ(config.max_signals_per_day, 4u);
    EXPECT_EQ(config.history_lookback, 120u);
    EXPECT_DOUBLE_EQ(config.risk.min_reward_risk, 2.5);
    EXPECT_DOUBLE_EQ(config.risk.max_risk_per_trade, 1000.0);
    EXPECT_EQ(config.risk.max_position_size, 5);
    EXPECT_EQ(config.instruments.primary, std::vector<std::string>{"FINNIFTY"});
    EXPECT_EQ(config.instruments.stocks.size(), 2u);
    EXPECT_EQ(config.instruments.max_stock_scans, 1u);
    EXPECT_EQ(config.logging.level, utils::LogLevel::Debug);
    EXPECT_EQ(config.logging.log_file, "logs/fno.log");
}

TEST(EngineConfigTest, MalformedYamlThrows) {
    EXPECT_THROW((void)parse_config("engine: [unterminated"), ConfigError);
}

TEST(EngineConfigTest, UnconvertibleValueKeepsDefault) {
    const auto config = parse_config("engine:\n  min_confidence: high\n");
    EXPECT_EQ(config.min_confidence, 75);
}

TEST(EngineConfigTest, InvalidValuesThrow) {
    EXPECT_THROW((void)parse_config("engine:\n  min_confidence: 150\n"), ConfigError);
    EXPECT_THROW((void)parse_config("engine:\n  max_signals_per_day: 0\n"), ConfigError);
    EXPECT_THROW((void)parse_config("engine:\n  history_lookback: 0\n"), ConfigError);
    EXPECT_THROW((void)parse_config("engine:\n  history_lookback: 20\n"), ConfigError);
    EXPECT_NO_THROW((void)parse_config("engine:\n  history_lookback: 50\n"));
    EXPECT_THROW((void)parse_config("risk:\n  min_reward_risk: 0\n"), ConfigError);
    EXPECT_THROW((void)parse_config("risk:\n  max_position_size: 20\n"), ConfigError);
    EXPECT_THROW((void)parse_config("instruments:\n  primary: []\n  stocks: []\n"), ConfigError);
}

TEST(EngineConfigTest, MissingFileThrows) {
    EXPECT_THROW((void)load_config("/nonexistent/fno/engine.yaml"), ConfigError);
}

TEST(EngineConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "fno_engine_config_test.yaml";
    {
        std::ofstream out(path);
        out << "engine:\n  min_confidence: 90\n";
    }
    const auto config = load_config(path.string());
    EXPECT_EQ(config.min_confidence, 90);
    std::filesystem::remove(path);
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(utils::parse_log_level("warn"), utils::LogLevel::Warn);
    EXPECT_EQ(utils::parse_log_level("critical"), utils::LogLevel::Critical);
}
