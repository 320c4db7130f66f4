/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <splice/core/logger.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <mutex>
#include <vector>

namespace spl {

namespace {

std::shared_ptr<spdlog::logger> s_logger;
std::mutex s_loggerMutex;

} // anonymous namespace

void initLogging(const std::string& appName, spdlog::level::level_enum level) {
    LogOptions options;
    options.level = level;
    initLogging(appName, options);
}

void initLogging(const std::string& appName, const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(options.level);
    consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!options.filePath.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.filePath, options.maxFileSize, options.maxFiles);
            fileSink->set_level(options.level);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log file sink disabled: " << ex.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(appName, sinks.begin(), sinks.end());
    logger->set_level(options.level);

    {
        std::lock_guard lock(s_loggerMutex);
        s_logger = logger;
    }
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> getLogger() {
    {
        std::lock_guard lock(s_loggerMutex);
        if (s_logger) {
            return s_logger;
        }
    }
    initLogging("splice");
    std::lock_guard lock(s_loggerMutex);
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    auto logger = getLogger();
    logger->set_level(level);
    for (auto& sink : logger->sinks()) {
        sink->set_level(level);
    }
}

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace spl
