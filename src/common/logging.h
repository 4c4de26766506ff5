#pragma once

/// @file logging.h
/// @brief axonsentry logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace axonsentry {

class Config;

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "axonsentry";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "axonsentry.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off"), case-insensitive
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Build a logging configuration from the "logging.*" keys
/// @param config Loaded configuration
/// @return Logging configuration, or an error for an unknown level name
absl::StatusOr<LogConfig> LoadLogConfig(const Config& config);

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define AXONSENTRY_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::axonsentry::GetLogger(), __VA_ARGS__)
#define AXONSENTRY_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::axonsentry::GetLogger(), __VA_ARGS__)
#define AXONSENTRY_LOG_INFO(...) SPDLOG_LOGGER_INFO(::axonsentry::GetLogger(), __VA_ARGS__)
#define AXONSENTRY_LOG_WARN(...) SPDLOG_LOGGER_WARN(::axonsentry::GetLogger(), __VA_ARGS__)
#define AXONSENTRY_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::axonsentry::GetLogger(), __VA_ARGS__)
#define AXONSENTRY_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::axonsentry::GetLogger(), __VA_ARGS__)

}  // namespace axonsentry
