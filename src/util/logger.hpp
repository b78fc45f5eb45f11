/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Logger - Structured logging with spdlog
 *
 * Provides:
 * - Component-tagged logging with levels (TRACE .. CRITICAL)
 * - Console sink with optional colors
 * - Optional rotating file sink for long analysis runs
 * - Level configurable via config file, environment or command line
 */

#ifndef MAILRLM_UTIL_LOGGER_HPP
#define MAILRLM_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mailrlm::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Process-wide singleton. The console sink writes to stderr so that
 * command output on stdout stays machine-readable.
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration.
     * Later calls reconfigure the sinks of the existing instance.
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Flush all sinks
     */
    void flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        std::shared_ptr<spdlog::logger> logger;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            logger = logger_;
        }
        if (!logger) return;

        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        auto full_msg = fmt::format("[{}] {}", component, msg);

        switch (level) {
            case LogLevel::Trace:    logger->trace(full_msg); break;
            case LogLevel::Debug:    logger->debug(full_msg); break;
            case LogLevel::Info:     logger->info(full_msg); break;
            case LogLevel::Warn:     logger->warn(full_msg); break;
            case LogLevel::Error:    logger->error(full_msg); break;
            case LogLevel::Critical: logger->critical(full_msg); break;
            default: break;
        }
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging with automatic component tagging
#define MAILRLM_LOG_TRACE(component, ...) \
    ::mailrlm::util::Logger::instance().trace(component, __VA_ARGS__)
#define MAILRLM_LOG_DEBUG(component, ...) \
    ::mailrlm::util::Logger::instance().debug(component, __VA_ARGS__)
#define MAILRLM_LOG_INFO(component, ...) \
    ::mailrlm::util::Logger::instance().info(component, __VA_ARGS__)
#define MAILRLM_LOG_WARN(component, ...) \
    ::mailrlm::util::Logger::instance().warn(component, __VA_ARGS__)
#define MAILRLM_LOG_ERROR(component, ...) \
    ::mailrlm::util::Logger::instance().error(component, __VA_ARGS__)
#define MAILRLM_LOG_CRITICAL(component, ...) \
    ::mailrlm::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Checkpoint = "checkpoint";
    constexpr std::string_view Engine = "engine";
    constexpr std::string_view Llm = "llm";
    constexpr std::string_view Dataset = "dataset";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Cli = "cli";
}

} // namespace mailrlm::util

#endif // MAILRLM_UTIL_LOGGER_HPP
