/**
 * @file logger.h
 * @brief Logging facade for playdeck
 *
 * All components log through the LOG_* macros below. The backing spdlog logger
 * writes to a colored console sink and, optionally, a rotating file sink.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace playdeck {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief Logging configuration
 *
 * Populated from the "logging" section of the application config
 * (see core/config_loader.h).
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";  // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize (or reconfigure) the logging system
 *
 * A second call updates level and pattern of the existing logger; sinks are
 * only created once.
 *
 * @return true if initialization succeeded
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Minimal stderr-only logger used before the config file has been read
 */
bool initializeEarly();

// Flushes pending messages and drops the logger.
void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

/**
 * @brief Underlying spdlog logger, lazily created with defaults
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive)
 *
 * Accepts the aliases "warning", "err", "fatal" and "none".
 * Unknown names map to Info.
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace playdeck

#include <spdlog/spdlog.h>

#define LOG_TRACE(...)                                \
    do {                                              \
        auto logger = playdeck::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...)                                \
    do {                                              \
        auto logger = playdeck::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(...)                                 \
    do {                                              \
        auto logger = playdeck::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_INFO(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_WARN(...)                                 \
    do {                                              \
        auto logger = playdeck::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_WARN(logger, __VA_ARGS__);  \
    } while (0)

#define LOG_ERROR(...)                                \
    do {                                              \
        auto logger = playdeck::logging::getLogger(); \
        if (logger)                                   \
            SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__); \
    } while (0)

#define LOG_CRITICAL(...)                                \
    do {                                                 \
        auto logger = playdeck::logging::getLogger();    \
        if (logger)                                      \
            SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__); \
    } while (0)

/**
 * @brief Log every N occurrences (per call site)
 *
 * For hot loops such as the ALSA writer thread.
 */
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

/**
 * @brief Log at most once per call site
 */
#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
