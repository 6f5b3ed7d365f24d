/**
 * @file logger.h
 * @brief Logging facade for castgrid, backed by spdlog
 *
 * All daemon components log through the LOG_* macros. The facade owns one
 * spdlog logger with a console sink and an optional rotating file sink, and
 * can be re-applied on reload without losing the sinks already open.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace castgrid {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

// Environment variable that overrides the configured level ("debug", "warn", ...)
constexpr const char* LOG_LEVEL_ENV = "CASTGRID_LOG_LEVEL";

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty: console only
    size_t maxFileSize = static_cast<size_t>(10 * 1024 * 1024);
    size_t maxBackups = 5;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    std::string loggerName = "castgrid";
};

/**
 * @brief Build the logger from config.
 *
 * A second call keeps the sinks and only re-applies level and pattern, so a
 * reload can change verbosity while the file sink stays open.
 */
bool initialize(const LogConfig& config = LogConfig{});

// stderr only; used before the PID lock is held and the config is read
bool initializeEarly();

/**
 * @brief Initialize from the "logging" section of the daemon's JSON config.
 *
 * A missing file or section means defaults. CASTGRID_LOG_LEVEL, when set to a
 * known level name, wins over the file.
 */
bool initializeFromConfig(const std::string& configPath);

// Unknown or mistyped keys leave the existing values in place
void applyLogSection(const nlohmann::json& section, LogConfig& config);

// Level named by CASTGRID_LOG_LEVEL, if set and recognised
std::optional<LogLevel> levelFromEnvironment();

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);
// Case-insensitive; also accepts "warning", "err", "fatal", "none". Unknown names map to Info.
LogLevel stringToLevel(std::string_view str);
std::optional<LogLevel> tryParseLevel(std::string_view str);

}  // namespace logging
}  // namespace castgrid

#include <spdlog/spdlog.h>

#define CASTGRID_LOG_WITH(spdlog_macro, ...)                  \
    do {                                                      \
        auto castgrid_logger_ = castgrid::logging::getLogger(); \
        if (castgrid_logger_)                                 \
            spdlog_macro(castgrid_logger_, __VA_ARGS__);      \
    } while (0)

#define LOG_TRACE(...) CASTGRID_LOG_WITH(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) CASTGRID_LOG_WITH(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) CASTGRID_LOG_WITH(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) CASTGRID_LOG_WITH(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) CASTGRID_LOG_WITH(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) CASTGRID_LOG_WITH(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// LEVEL is the upper-case suffix: LOG_IF(WARN, cond, ...)
#define LOG_IF(LEVEL, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##LEVEL(__VA_ARGS__); \
    } while (0)

// First occurrence and every n-th after it, per call site
#define LOG_EVERY_N(LEVEL, n, ...)                                \
    do {                                                          \
        static std::atomic<uint64_t> castgrid_log_count_{0};      \
        if (castgrid_log_count_.fetch_add(1) % (n) == 0) {        \
            LOG_##LEVEL(__VA_ARGS__);                             \
        }                                                         \
    } while (0)

#define LOG_ONCE(LEVEL, ...)                                     \
    do {                                                         \
        static std::atomic<bool> castgrid_logged_{false};        \
        if (!castgrid_logged_.exchange(true)) {                  \
            LOG_##LEVEL(__VA_ARGS__);                            \
        }                                                        \
    } while (0)
