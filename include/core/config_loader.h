#ifndef CASTGRID_CONFIG_LOADER_H
#define CASTGRID_CONFIG_LOADER_H

#include "logging/logger.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    struct DiscoveryConfig {
        bool enabled = true;
        int intervalSeconds = 10;
        int searchWindowMs = 5000;
        std::string searchTarget = "ssdp:all";
        int mxSeconds = 3;
        int multicastTtl = 4;
        std::string interfaceAddress;  // empty: kernel default route
        int disconnectTimeoutSeconds = 30;
        int errorBackoffSeconds = 60;
        int descriptionTimeoutMs = 5000;
    } discovery;

    struct ControlConfig {
        int timeoutMs = 5000;
        int maxAttempts = 3;
        int retryDelayMs = 2000;
    } control;

    struct SupervisorConfig {
        int passIntervalSeconds = 5;
        int overrideWindowSeconds = 300;
        int maxPlayRetries = 3;
        int retryBackoffBaseSeconds = 5;
        int retryBackoffMaxSeconds = 60;
        int errorRetrySeconds = 60;
        int pollFailureThreshold = 3;
    } supervisor;

    struct StreamingConfig {
        std::string bindAddress = "0.0.0.0";
        uint16_t port = 0;  // 0: first free port in the range
        uint16_t portRangeStart = 9000;
        uint16_t portRangeEnd = 9100;
        std::string advertiseHost;  // empty: first non-loopback IPv4 address
        int stallTimeoutSeconds = 90;
        int retentionSeconds = 3600;
        int maxSessionHours = 24;
        int healthCheckIntervalSeconds = 5;
    } streaming;

    struct BlackoutConfig {
        std::string clipPath = "data/black.mp4";
        bool loop = true;
    } blackout;

    struct IpcConfig {
        std::string endpoint = "ipc:///tmp/castgrid.sock";
        int pollIntervalMs = 100;
    } ipc;

    castgrid::logging::LogConfig logging;

    std::string devicesFile = "devices.json";
};

// One entry of the device list file
struct DeviceConfigEntry {
    std::string deviceName;
    std::string type;  // "dlna" | "transcreen"
    std::string hostname;
    std::string actionUrl;
    std::string videoFile;
    bool loop = true;
    int priority = 0;
    std::string discoveryMethod;
    std::string group;
    std::string zone;
};

// Load configuration from JSON file
// Returns true if loaded successfully, false if file not found or parse error (uses defaults)
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

// Loads the device list. Invalid entries are skipped and logged; returns false only
// when the file cannot be read or is not a JSON array.
bool loadDeviceConfigs(const std::filesystem::path& path, std::vector<DeviceConfigEntry>& out,
                       std::string& error);

// Checks required fields and that video_file exists.
bool validateDeviceConfig(const DeviceConfigEntry& entry, std::string& error);

#endif  // CASTGRID_CONFIG_LOADER_H
