#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "config.h"
#include "error.h"

namespace axonsentry {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

}  // namespace

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lowered =
        absl::AsciiStrToLower(absl::StripAsciiWhitespace(absl::string_view(name.data(), name.size())));

    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;

    return MakeError(ErrorCode::kInvalidLogLevel,
                     absl::StrCat("Unknown log level: '", absl::string_view(name.data(), name.size()), "'"));
}

absl::StatusOr<LogConfig> LoadLogConfig(const Config& config) {
    LogConfig log_config;

    if (config.HasKey("logging.level")) {
        auto level = ParseLogLevel(config.GetString("logging.level"));
        if (!level.ok()) {
            return level.status();
        }
        log_config.level = *level;
    }

    log_config.name = config.GetString("logging.name", log_config.name);
    log_config.pattern = config.GetString("logging.pattern", log_config.pattern);
    log_config.enable_file = config.GetBool("logging.file.enabled", false);
    log_config.file_path = config.GetString("logging.file.path", log_config.file_path);
    log_config.max_file_size = static_cast<size_t>(config.GetInt(
        "logging.file.max_size_mb", static_cast<int64_t>(log_config.max_file_size >> 20))) << 20;
    log_config.max_files = static_cast<size_t>(
        config.GetInt("logging.file.max_files", static_cast<int64_t>(log_config.max_files)));

    return log_config;
}

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always enabled)
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
    sinks.push_back(console_sink);

    // File sink (optional)
    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        sinks.push_back(file_sink);
    }

    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(static_cast<spdlog::level::level_enum>(config.level));
    g_logger->set_pattern(config.pattern);

    // Flush on warn and above
    g_logger->flush_on(spdlog::level::warn);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    InitLogging();
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
}

}  // namespace axonsentry
