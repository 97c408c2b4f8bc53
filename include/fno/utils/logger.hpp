#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Logger
// ============================================================================
// Process-wide logging wrapper over spdlog
// Colored console sink, optional rotating file sink, optional async queue
// ============================================================================

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace fno::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// "trace" ... "off", case-sensitive; unknown names map to Info
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file;  // empty = console only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    // Performance settings
    bool async = false;
    size_t queue_size = 8192;
    size_t flush_interval_ms = 1000;

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Initialize the global logger (replaces the default console logger)
    static void initialize(const LogConfig& config = LogConfig{});

    /// Flush and drop all sinks
    static void shutdown();

    /// Global logger instance, console-backed until initialize() is called
    static Logger& instance();

    void set_level(LogLevel level);

    template <typename... Args>
    void trace(std::string_view format, Args&&... args) {
        log(spdlog::level::trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view format, Args&&... args) {
        log(spdlog::level::debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view format, Args&&... args) {
        log(spdlog::level::info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view format, Args&&... args) {
        log(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view format, Args&&... args) {
        log(spdlog::level::err, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view format, Args&&... args) {
        log(spdlog::level::critical, format, std::forward<Args>(args)...);
    }

    void flush();

private:
    Logger();

    template <typename... Args>
    void log(spdlog::level::level_enum level, std::string_view format, Args&&... args) {
        const auto logger = logger_;
        if (!logger || !logger->should_log(level)) return;
        const std::string message = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
        logger->log(level, spdlog::string_view_t{message.data(), message.size()});
    }

    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define FNO_LOG_TRACE(...) ::fno::utils::Logger::instance().trace(__VA_ARGS__)
#define FNO_LOG_DEBUG(...) ::fno::utils::Logger::instance().debug(__VA_ARGS__)
#define FNO_LOG_INFO(...) ::fno::utils::Logger::instance().info(__VA_ARGS__)
#define FNO_LOG_WARN(...) ::fno::utils::Logger::instance().warn(__VA_ARGS__)
#define FNO_LOG_ERROR(...) ::fno::utils::Logger::instance().error(__VA_ARGS__)
#define FNO_LOG_CRITICAL(...) ::fno::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define FNO_SCOPED_TIMER_CONCAT_(a, b) a##b
#define FNO_SCOPED_TIMER_NAME_(line) FNO_SCOPED_TIMER_CONCAT_(_fno_timer_, line)
#define FNO_SCOPED_TIMER(name) ::fno::utils::ScopedTimer FNO_SCOPED_TIMER_NAME_(__LINE__)(name)

}  // namespace fno::utils
