#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace castgrid {
namespace logging {

namespace {

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
};

constexpr std::array<LevelEntry, 7> kLevels{{
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
}};

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

spdlog::level::level_enum toSpdlog(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.spdlogLevel;
        }
    }
    return spdlog::level::info;
}

LogLevel fromSpdlog(spdlog::level::level_enum level) {
    for (const auto& entry : kLevels) {
        if (entry.spdlogLevel == level) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.consoleOutput) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.coloredOutput) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(console));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }
    return sinks;
}

template <typename T>
void readKey(const nlohmann::json& section, const char* key, bool (nlohmann::json::*check)() const,
             T& out) {
    auto it = section.find(key);
    if (it != section.end() && ((*it).*check)()) {
        out = it->template get<T>();
    }
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire) && g_logger) {
        g_logger->set_level(toSpdlog(config.level));
        g_logger->set_pattern(config.pattern);
        g_logger->info("Log level set to {}", levelToString(config.level));
        return true;
    }

    try {
        auto sinks = buildSinks(config);
        auto logger = std::make_shared<spdlog::logger>(config.loggerName, sinks.begin(), sinks.end());
        logger->set_level(toSpdlog(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::err);
        spdlog::set_default_logger(logger);
        // Replaces the stderr logger from initializeEarly()
        g_logger = std::move(logger);
        g_initialized.store(true, std::memory_order_release);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "castgrid: logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    g_logger->info("Logging initialized (level={})", levelToString(config.level));
    if (!config.filePath.empty()) {
        g_logger->info("Log file: {} ({} MB x {} backups)", config.filePath,
                       config.maxFileSize / (1024 * 1024), config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        return true;
    }

    try {
        g_logger = std::make_shared<spdlog::logger>(
            "castgrid", std::make_shared<spdlog::sinks::stderr_sink_mt>());
        g_logger->set_pattern(LogConfig{}.pattern);
        g_logger->set_level(toSpdlog(levelFromEnvironment().value_or(LogLevel::Info)));
        spdlog::set_default_logger(g_logger);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "castgrid: early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

void applyLogSection(const nlohmann::json& section, LogConfig& config) {
    if (!section.is_object()) {
        return;
    }
    std::string level;
    readKey(section, "level", &nlohmann::json::is_string, level);
    if (!level.empty()) {
        config.level = stringToLevel(level);
    }
    readKey(section, "filePath", &nlohmann::json::is_string, config.filePath);
    readKey(section, "maxFileSize", &nlohmann::json::is_number_unsigned, config.maxFileSize);
    readKey(section, "maxBackups", &nlohmann::json::is_number_unsigned, config.maxBackups);
    readKey(section, "consoleOutput", &nlohmann::json::is_boolean, config.consoleOutput);
    readKey(section, "coloredOutput", &nlohmann::json::is_boolean, config.coloredOutput);
    readKey(section, "pattern", &nlohmann::json::is_string, config.pattern);
}

std::optional<LogLevel> levelFromEnvironment() {
    const char* value = std::getenv(LOG_LEVEL_ENV);
    if (!value) {
        return std::nullopt;
    }
    return tryParseLevel(value);
}

bool initializeFromConfig(const std::string& configPath) {
    LogConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        auto root = nlohmann::json::parse(file, nullptr, false);
        if (root.is_discarded()) {
            std::cerr << "castgrid: " << configPath
                      << " is not valid JSON, logging with defaults" << std::endl;
        } else if (root.is_object() && root.contains("logging")) {
            applyLogSection(root["logging"], config);
        }
    }

    if (auto envLevel = levelFromEnvironment()) {
        config.level = *envLevel;
    }
    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logger) {
        g_logger->info("Logging shutdown");
        g_logger->flush();
    }
    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlog(level));
    }
}

LogLevel getLevel() {
    return g_logger ? fromSpdlog(g_logger->level()) : LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!g_initialized.load(std::memory_order_acquire) && !g_logger) {
        // Library use without an explicit init (tests, tools)
        initialize();
    }
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

std::optional<LogLevel> tryParseLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "none") {
        return LogLevel::Off;
    }
    for (const auto& entry : kLevels) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return std::nullopt;
}

LogLevel stringToLevel(std::string_view str) {
    return tryParseLevel(str).value_or(LogLevel::Info);
}

}  // namespace logging
}  // namespace castgrid
