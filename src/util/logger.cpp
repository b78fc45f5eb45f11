/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <cctype>
#include <vector>

namespace mailrlm::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
        created = true;
    });
    if (!created) {
        instance_->configure(config);
    }
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("mailrlm", sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
    }
    logger_ = logger;
    current_level_.store(config.level, std::memory_order_relaxed);

    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower;
    lower.reserve(level_str.size());
    for (char c : level_str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical" || lower == "crit" || lower == "fatal") return LogLevel::Critical;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "unknown";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

} // namespace mailrlm::util
