// ============================================================================
// FNO SIGNAL ENGINE - Logger Implementation
// ============================================================================

#include "fno/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace fno::utils {

namespace {

constexpr const char* LOGGER_NAME = "fno";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

Logger::Logger() : logger_(make_console_logger()) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(LOGGER_NAME, sinks.begin(), sinks.end(),
                                                        spdlog::thread_pool(),
                                                        spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::flush_every(std::chrono::milliseconds(config.flush_interval_ms));

    instance().logger_ = std::move(logger);
}

void Logger::shutdown() {
    instance().flush();
    instance().logger_ = make_console_logger();
    spdlog::shutdown();
}

void Logger::set_level(LogLevel level) {
    if (logger_) logger_->set_level(to_spdlog(level));
}

void Logger::flush() {
    if (logger_) logger_->flush();
}

void ScopedTimer::log_duration(int64_t microseconds) const {
    auto& logger = Logger::instance();
    switch (level_) {
        case LogLevel::Trace: logger.trace("{} took {} us", name_, microseconds); break;
        case LogLevel::Debug: logger.debug("{} took {} us", name_, microseconds); break;
        case LogLevel::Info: logger.info("{} took {} us", name_, microseconds); break;
        case LogLevel::Warn: logger.warn("{} took {} us", name_, microseconds); break;
        case LogLevel::Error: logger.error("{} took {} us", name_, microseconds); break;
        case LogLevel::Critical: logger.critical("{} took {} us", name_, microseconds); break;
        case LogLevel::Off: break;
    }
}

}  // namespace fno::utils
