// ============================================================================
// FNO SIGNAL ENGINE - Command Line Scanner
// ============================================================================
// Scans the configured index/stock universe against JSON market snapshots
// and prints every emitted signal.
//
//   fno_signal_engine [[--config] config.yaml] --data <dir> [--repeat N] [--interval S]
//
// --repeat 0 keeps scanning until SIGINT/SIGTERM. The daily quota is reset
// when the UTC session date rolls over.
// ============================================================================

#include "fno/config/engine_config.hpp"
#include "fno/core/error.hpp"
#include "fno/core/types.hpp"
#include "fno/engine/signal_engine.hpp"
#include "fno/engine/signal_sink.hpp"
#include "fno/market/json_snapshot_provider.hpp"
#include "fno/risk/daily_signal_counter.hpp"
#include "fno/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int signal) {
        std::cout << "\n[SIGNAL] Received " << signal << ", stopping...\n";
        g_running = false;
    }

    struct CliOptions {
        std::string config_path = "config/engine.yaml";
        std::string data_dir = "data";
        int repeat = 1;             // 0 = until interrupted
        int interval_seconds = 60;
    };

    void print_usage() {
        std::cerr << "usage: fno_signal_engine [[--config] config.yaml] --data <dir> "
                     "[--repeat N] [--interval SECONDS]\n";
    }

    bool parse_args(int argc, char* argv[], CliOptions& options) {
        int first = 1;
        if (argc > 1 && argv[1][0] != '-') {
            options.config_path = argv[1];
            first = 2;
        }

        for (int i = first; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                options.config_path = argv[++i];
            } else if (arg == "--data" && i + 1 < argc) {
                options.data_dir = argv[++i];
            } else if (arg == "--repeat" && i + 1 < argc) {
                options.repeat = std::atoi(argv[++i]);
            } else if (arg == "--interval" && i + 1 < argc) {
                options.interval_seconds = std::atoi(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                return false;
            } else {
                std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
                return false;
            }
        }
        return options.repeat >= 0 && options.interval_seconds >= 0;
    }
}

using namespace fno;

// ============================================================================
// Console Delivery
// ============================================================================

class ConsoleSignalSink final : public engine::SignalSink {
public:
    void deliver(const engine::Signal& signal) override {
        const auto& n = signal.narrative();
        std::cout << std::fixed << std::setprecision(2)
                  << "\n========================================\n"
                  << " " << signal.instrument().view() << "  " << to_string(signal.direction())
                  << (signal.is_mean_reversion() ? "  (mean reversion)" : "") << "\n"
                  << "========================================\n"
                  << "  Contract:   " << signal.contract().symbol.view()
                  << "  strike " << signal.contract().strike.to_double() << "\n"
                  << "  Entry:      " << signal.entry().to_double() << "\n"
                  << "  Target:     " << signal.target().to_double() << "\n"
                  << "  Stop Loss:  " << signal.stop_loss().to_double() << "\n"
                  << "  R:R         1:" << signal.reward_risk() << "\n"
                  << "  Quantity:   " << signal.quantity() << " lot(s)\n"
                  << "  Confidence: " << signal.confidence() << "% (" << to_string(signal.tier()) << ")\n"
                  << "  Sentiment:  " << to_string(signal.market_sentiment())
                  << "  Volatility: " << to_string(signal.technical().volatility) << "\n"
                  << "  Setup:      " << n.technical_setup << "\n"
                  << "  VWAP:       " << n.vwap_analysis << "\n"
                  << "  Volume:     " << n.volume_profile << "\n"
                  << "  Theta:      " << n.time_decay_impact << "\n"
                  << "  Reasoning:  " << n.reasoning << "\n";
        ++delivered_;
    }

    [[nodiscard]] uint64_t delivered() const { return delivered_; }

private:
    uint64_t delivered_ = 0;
};

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CliOptions options;
    if (!parse_args(argc, argv, options)) {
        print_usage();
        return 2;
    }

    config::EngineConfig config;
    try {
        config = config::load_config(options.config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    utils::Logger::initialize(config.logging);
    FNO_LOG_INFO("Config: {} | data: {} | min confidence {}% | {} signals/day",
                 options.config_path, options.data_dir,
                 config.min_confidence, config.max_signals_per_day);

    try {
        market::JsonSnapshotProvider provider(options.data_dir);
        risk::DailySignalCounter counter(config.max_signals_per_day);
        engine::SignalEngine engine(provider, counter, config);
        ConsoleSignalSink sink;

        auto session = session_date(now());
        for (int cycle = 1; g_running && (options.repeat == 0 || cycle <= options.repeat); ++cycle) {
            const auto today = session_date(now());
            if (today != session) {
                FNO_LOG_INFO("Session rollover, resetting daily quota");
                engine.reset_daily_counters();
                session = today;
            }

            FNO_LOG_INFO("Scan cycle {}", cycle);
            for (const auto& signal : engine.scan()) {
                sink.deliver(signal);
            }

            if (options.repeat != 0 && cycle >= options.repeat) break;
            for (int s = 0; s < options.interval_seconds && g_running; ++s) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }

        FNO_LOG_INFO("Done: {} evaluation(s), {} signal(s) delivered, {} below confidence, {} risk-rejected",
                     engine.evaluations(), sink.delivered(),
                     engine.outcome_count(EvaluationOutcome::BelowMinConfidence),
                     engine.outcome_count(EvaluationOutcome::RiskRejected));
    } catch (const std::exception& e) {
        FNO_LOG_CRITICAL("Unhandled exception: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    }

    utils::Logger::shutdown();
    return 0;
}
