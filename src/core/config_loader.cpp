#include "core/config_loader.h"

#include "core/daemon_constants.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static void readInt(const nlohmann::json& section, const char* key, int& out, int minValue,
                    int maxValue) {
    if (section.contains(key) && section[key].is_number_integer()) {
        out = std::clamp(section[key].get<int>(), minValue, maxValue);
    }
}

static void readString(const nlohmann::json& section, const char* key, std::string& out) {
    if (section.contains(key) && section[key].is_string()) {
        out = section[key].get<std::string>();
    }
}

static void readBool(const nlohmann::json& section, const char* key, bool& out) {
    if (section.contains(key) && section[key].is_boolean()) {
        out = section[key].get<bool>();
    }
}

static void readPort(const nlohmann::json& section, const char* key, uint16_t& out) {
    if (section.contains(key) && section[key].is_number_integer()) {
        out = static_cast<uint16_t>(std::clamp(section[key].get<int>(), 0, 65535));
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            if (verbose) {
                LOG_WARN("Config: {} is not a JSON object, using defaults", configPath.string());
            }
            return false;
        }

        if (j.contains("discovery") && j["discovery"].is_object()) {
            auto d = j["discovery"];
            try {
                auto& cfg = outConfig.discovery;
                readBool(d, "enabled", cfg.enabled);
                readInt(d, "intervalSeconds", cfg.intervalSeconds, 1, 3600);
                readInt(d, "searchWindowMs", cfg.searchWindowMs, 100, 60000);
                readString(d, "searchTarget", cfg.searchTarget);
                readInt(d, "mxSeconds", cfg.mxSeconds, 1, 5);
                readInt(d, "multicastTtl", cfg.multicastTtl, 1, 255);
                readString(d, "interfaceAddress", cfg.interfaceAddress);
                readInt(d, "disconnectTimeoutSeconds", cfg.disconnectTimeoutSeconds, 1, 86400);
                readInt(d, "errorBackoffSeconds", cfg.errorBackoffSeconds, 1, 86400);
                readInt(d, "descriptionTimeoutMs", cfg.descriptionTimeoutMs, 100, 60000);
                if (cfg.searchTarget.empty()) {
                    cfg.searchTarget = DaemonConstants::SSDP_SEARCH_ALL;
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid discovery settings, using defaults: {}", e.what());
                }
                outConfig.discovery = AppConfig::DiscoveryConfig{};
            }
        }

        if (j.contains("control") && j["control"].is_object()) {
            auto c = j["control"];
            try {
                readInt(c, "timeoutMs", outConfig.control.timeoutMs, 100, 60000);
                readInt(c, "maxAttempts", outConfig.control.maxAttempts, 1, 10);
                readInt(c, "retryDelayMs", outConfig.control.retryDelayMs, 0, 60000);
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid control settings, using defaults: {}", e.what());
                }
                outConfig.control = AppConfig::ControlConfig{};
            }
        }

        if (j.contains("supervisor") && j["supervisor"].is_object()) {
            auto s = j["supervisor"];
            try {
                auto& cfg = outConfig.supervisor;
                readInt(s, "passIntervalSeconds", cfg.passIntervalSeconds, 1, 600);
                readInt(s, "overrideWindowSeconds", cfg.overrideWindowSeconds, 1, 86400);
                readInt(s, "maxPlayRetries", cfg.maxPlayRetries, 1, 100);
                readInt(s, "retryBackoffBaseSeconds", cfg.retryBackoffBaseSeconds, 1, 3600);
                readInt(s, "retryBackoffMaxSeconds", cfg.retryBackoffMaxSeconds, 1, 86400);
                readInt(s, "errorRetrySeconds", cfg.errorRetrySeconds, 1, 86400);
                readInt(s, "pollFailureThreshold", cfg.pollFailureThreshold, 1, 100);
                cfg.retryBackoffMaxSeconds =
                    std::max(cfg.retryBackoffMaxSeconds, cfg.retryBackoffBaseSeconds);
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid supervisor settings, using defaults: {}", e.what());
                }
                outConfig.supervisor = AppConfig::SupervisorConfig{};
            }
        }

        if (j.contains("streaming") && j["streaming"].is_object()) {
            auto s = j["streaming"];
            try {
                auto& cfg = outConfig.streaming;
                readString(s, "bindAddress", cfg.bindAddress);
                readPort(s, "port", cfg.port);
                readPort(s, "portRangeStart", cfg.portRangeStart);
                readPort(s, "portRangeEnd", cfg.portRangeEnd);
                readString(s, "advertiseHost", cfg.advertiseHost);
                readInt(s, "stallTimeoutSeconds", cfg.stallTimeoutSeconds, 1, 86400);
                readInt(s, "retentionSeconds", cfg.retentionSeconds, 0, 7 * 86400);
                readInt(s, "maxSessionHours", cfg.maxSessionHours, 1, 24 * 30);
                readInt(s, "healthCheckIntervalSeconds", cfg.healthCheckIntervalSeconds, 1, 3600);
                if (cfg.portRangeEnd < cfg.portRangeStart) {
                    if (verbose) {
                        LOG_WARN("Config: streaming.portRangeEnd < portRangeStart, swapping");
                    }
                    std::swap(cfg.portRangeStart, cfg.portRangeEnd);
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid streaming settings, using defaults: {}", e.what());
                }
                outConfig.streaming = AppConfig::StreamingConfig{};
            }
        }

        if (j.contains("blackout") && j["blackout"].is_object()) {
            auto b = j["blackout"];
            try {
                readString(b, "clipPath", outConfig.blackout.clipPath);
                readBool(b, "loop", outConfig.blackout.loop);
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid blackout settings, using defaults: {}", e.what());
                }
                outConfig.blackout = AppConfig::BlackoutConfig{};
            }
        }

        if (j.contains("ipc") && j["ipc"].is_object()) {
            auto i = j["ipc"];
            try {
                readString(i, "endpoint", outConfig.ipc.endpoint);
                readInt(i, "pollIntervalMs", outConfig.ipc.pollIntervalMs, 10, 10000);
                if (outConfig.ipc.endpoint.empty()) {
                    outConfig.ipc.endpoint = DaemonConstants::ZEROMQ_IPC_PATH;
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid ipc settings, using defaults: {}", e.what());
                }
                outConfig.ipc = AppConfig::IpcConfig{};
            }
        }

        if (j.contains("logging")) {
            castgrid::logging::applyLogSection(j["logging"], outConfig.logging);
        }

        readString(j, "devicesFile", outConfig.devicesFile);

        if (verbose) {
            LOG_INFO("Config: Loaded from {}", configPath.string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}, using defaults", configPath.string(),
                      e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

bool validateDeviceConfig(const DeviceConfigEntry& entry, std::string& error) {
    const std::string type = toLower(entry.type);
    if (type.empty()) {
        error = "missing type";
        return false;
    }
    if (type != "dlna" && type != "transcreen") {
        error = "unknown type '" + entry.type + "'";
        return false;
    }
    if (entry.hostname.empty()) {
        error = "missing hostname";
        return false;
    }
    if (type == "dlna" && entry.actionUrl.empty()) {
        error = "missing action_url";
        return false;
    }
    if (entry.videoFile.empty()) {
        error = "missing video_file";
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(entry.videoFile, ec)) {
        error = "video_file not found: " + entry.videoFile;
        return false;
    }
    return true;
}

bool loadDeviceConfigs(const std::filesystem::path& path, std::vector<DeviceConfigEntry>& out,
                       std::string& error) {
    out.clear();
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open " + path.string();
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        error = "parse error in " + path.string() + ": " + e.what();
        return false;
    }
    if (!j.is_array()) {
        error = path.string() + " must contain a JSON array";
        return false;
    }

    size_t index = 0;
    for (const auto& item : j) {
        index++;
        if (!item.is_object()) {
            LOG_ERROR("Devices: entry {} is not an object, skipped", index);
            continue;
        }

        DeviceConfigEntry entry;
        readString(item, "device_name", entry.deviceName);
        readString(item, "type", entry.type);
        readString(item, "hostname", entry.hostname);
        readString(item, "action_url", entry.actionUrl);
        readString(item, "video_file", entry.videoFile);
        readBool(item, "loop", entry.loop);
        readInt(item, "priority", entry.priority, -1000, 1000);
        readString(item, "discovery_method", entry.discoveryMethod);
        readString(item, "group", entry.group);
        readString(item, "zone", entry.zone);
        entry.type = toLower(entry.type);

        std::string reason;
        if (!validateDeviceConfig(entry, reason)) {
            LOG_ERROR("Devices: entry {} ({}) skipped: {}", index,
                      entry.deviceName.empty() ? entry.hostname : entry.deviceName, reason);
            continue;
        }
        out.push_back(std::move(entry));
    }

    LOG_INFO("Devices: {} of {} entries loaded from {}", out.size(), j.size(), path.string());
    return true;
}
