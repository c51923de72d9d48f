/**
 * @file logger.cpp
 * @brief spdlog-backed implementation of the playdeck logging facade
 */

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace playdeck {
namespace logging {

namespace {

constexpr const char* kLoggerName = "playdeck";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

struct LevelInfo {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
};

// Canonical names first; extra spellings accepted by stringToLevel follow
constexpr LevelInfo kLevels[] = {
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
    {LogLevel::Warn, spdlog::level::warn, "warning"},
    {LogLevel::Error, spdlog::level::err, "err"},
    {LogLevel::Critical, spdlog::level::critical, "fatal"},
    {LogLevel::Off, spdlog::level::off, "none"},
};

const LevelInfo& infoFor(LogLevel level) {
    for (const auto& info : kLevels) {
        if (info.level == level) {
            return info;
        }
    }
    return kLevels[2];
}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return infoFor(level).spdlogLevel;
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    for (const auto& info : kLevels) {
        if (info.spdlogLevel == level) {
            return info.level;
        }
    }
    return LogLevel::Info;
}

void installLogger(std::shared_ptr<spdlog::logger> logger, const LogConfig& config) {
    logger->set_level(toSpdlogLevel(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    g_logger = std::move(logger);
    g_initialized.store(true, std::memory_order_release);
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire) && g_logger) {
        g_logger->set_level(toSpdlogLevel(config.level));
        g_logger->set_pattern(config.pattern);
        for (auto& sink : g_logger->sinks()) {
            sink->set_level(toSpdlogLevel(config.level));
        }
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(toSpdlogLevel(config.level));
            if (!config.coloredOutput) {
                console_sink->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console_sink);
        }

        if (!config.filePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups);
            file_sink->set_level(toSpdlogLevel(config.level));
            sinks.push_back(file_sink);
        }

        installLogger(std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end()),
                      config);

        LOG_DEBUG("Logging initialized (level={})", levelToString(config.level));
        if (!config.filePath.empty()) {
            LOG_DEBUG("Log file: {} (max {}KB x {} backups)", config.filePath,
                      config.maxFileSize / 1024, config.maxBackups);
        }
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }

    try {
        LogConfig config;
        config.level = LogLevel::Warn;
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        installLogger(std::make_shared<spdlog::logger>(kLoggerName, sink), config);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        LOG_DEBUG("Log level changed to {}", levelToString(level));
    }
}

LogLevel getLevel() {
    if (g_logger) {
        return fromSpdlogLevel(g_logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return infoFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& info : kLevels) {
        if (info.name == lower) {
            return info.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace playdeck
