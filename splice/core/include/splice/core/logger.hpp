/**
 * @file logger.hpp
 * @brief Logging utilities wrapping spdlog
 *
 * One process-wide logger with a colour console sink and an optional
 * rotating file sink. Use the LOG_* macros everywhere.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace spl {

/// Logging options (see EditorSettings for the config keys)
struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string filePath;                   ///< Empty = console only
    size_t maxFileSize = 10 * 1024 * 1024;  ///< 10MB per rotated file
    size_t maxFiles = 3;
};

/// Initialize logging system (call once at startup)
void initLogging(const std::string& appName, spdlog::level::level_enum level = spdlog::level::info);

/// Initialize logging with a file sink
void initLogging(const std::string& appName, const LogOptions& options);

/// Get default logger (lazily creates a console logger)
std::shared_ptr<spdlog::logger> getLogger();

/// Set log level at runtime
void setLogLevel(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error", "critical", "off"
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

} // namespace spl

#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(spl::getLogger(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(spl::getLogger(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(spl::getLogger(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(spl::getLogger(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(spl::getLogger(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(spl::getLogger(), __VA_ARGS__)
