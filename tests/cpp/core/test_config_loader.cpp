/**
 * @file test_config_loader.cpp
 * @brief Unit tests for config loader (daemon config and device list)
 */

#include "core/config_loader.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;
    fs::path devicesPath;
    fs::path videoPath;

    void SetUp() override {
        // Unique per test so parallel ctest runs never share a directory
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "unknown_test";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("castgrid_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
        testConfigPath = tempDir / "test_config.json";
        devicesPath = tempDir / "devices.json";
        videoPath = tempDir / "loop.mp4";
        std::ofstream(videoPath) << "not really a video";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
        file.close();
    }
};

// ============================================================
// loadAppConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    AppConfig config;
    bool result = loadAppConfig("/nonexistent/path/config.json", config, false);

    EXPECT_FALSE(result);
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    AppConfig config;
    loadAppConfig("/nonexistent/path/config.json", config, false);

    EXPECT_TRUE(config.discovery.enabled);
    EXPECT_EQ(config.discovery.intervalSeconds, 10);
    EXPECT_EQ(config.discovery.searchTarget, "ssdp:all");
    EXPECT_EQ(config.discovery.disconnectTimeoutSeconds, 30);
    EXPECT_EQ(config.control.timeoutMs, 5000);
    EXPECT_EQ(config.control.maxAttempts, 3);
    EXPECT_EQ(config.supervisor.overrideWindowSeconds, 300);
    EXPECT_EQ(config.streaming.port, 0);
    EXPECT_EQ(config.streaming.portRangeStart, 9000);
    EXPECT_EQ(config.streaming.portRangeEnd, 9100);
    EXPECT_EQ(config.ipc.endpoint, "ipc:///tmp/castgrid.sock");
    EXPECT_EQ(config.devicesFile, "devices.json");
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeFile(testConfigPath, "{}");

    AppConfig config;
    EXPECT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.supervisor.passIntervalSeconds, 5);
}

TEST_F(ConfigLoaderTest, InvalidJsonFallsBackToDefaults) {
    writeFile(testConfigPath, "{ not json");

    AppConfig config;
    EXPECT_FALSE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.discovery.intervalSeconds, 10);
}

TEST_F(ConfigLoaderTest, ReadsAllSections) {
    writeFile(testConfigPath, R"({
        "discovery": {"enabled": false, "intervalSeconds": 20, "searchTarget": "urn:schemas-upnp-org:service:AVTransport:1"},
        "control": {"timeoutMs": 1500, "maxAttempts": 5, "retryDelayMs": 250},
        "supervisor": {"overrideWindowSeconds": 120, "maxPlayRetries": 4},
        "streaming": {"port": 9050, "advertiseHost": "192.168.1.10", "stallTimeoutSeconds": 45},
        "blackout": {"clipPath": "/srv/black.mp4", "loop": false},
        "ipc": {"endpoint": "tcp://127.0.0.1:5555"},
        "devicesFile": "/etc/castgrid/devices.json"
    })");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_FALSE(config.discovery.enabled);
    EXPECT_EQ(config.discovery.intervalSeconds, 20);
    EXPECT_EQ(config.discovery.searchTarget, "urn:schemas-upnp-org:service:AVTransport:1");
    EXPECT_EQ(config.control.timeoutMs, 1500);
    EXPECT_EQ(config.control.maxAttempts, 5);
    EXPECT_EQ(config.control.retryDelayMs, 250);
    EXPECT_EQ(config.supervisor.overrideWindowSeconds, 120);
    EXPECT_EQ(config.supervisor.maxPlayRetries, 4);
    EXPECT_EQ(config.streaming.port, 9050);
    EXPECT_EQ(config.streaming.advertiseHost, "192.168.1.10");
    EXPECT_EQ(config.streaming.stallTimeoutSeconds, 45);
    EXPECT_EQ(config.blackout.clipPath, "/srv/black.mp4");
    EXPECT_FALSE(config.blackout.loop);
    EXPECT_EQ(config.ipc.endpoint, "tcp://127.0.0.1:5555");
    EXPECT_EQ(config.devicesFile, "/etc/castgrid/devices.json");
}

TEST_F(ConfigLoaderTest, ClampsOutOfRangeValues) {
    writeFile(testConfigPath, R"({
        "discovery": {"mxSeconds": 60, "intervalSeconds": 0},
        "control": {"maxAttempts": 0}
    })");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.discovery.mxSeconds, 5);
    EXPECT_EQ(config.discovery.intervalSeconds, 1);
    EXPECT_EQ(config.control.maxAttempts, 1);
}

TEST_F(ConfigLoaderTest, WrongTypesKeepDefaults) {
    writeFile(testConfigPath, R"({"control": {"timeoutMs": "fast"}, "blackout": {"loop": 1}})");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.control.timeoutMs, 5000);
    EXPECT_TRUE(config.blackout.loop);
}

TEST_F(ConfigLoaderTest, SwapsInvertedPortRange) {
    writeFile(testConfigPath, R"({"streaming": {"portRangeStart": 9200, "portRangeEnd": 9100}})");

    AppConfig config;
    ASSERT_TRUE(loadAppConfig(testConfigPath, config, false));
    EXPECT_EQ(config.streaming.portRangeStart, 9100);
    EXPECT_EQ(config.streaming.portRangeEnd, 9200);
}

// ============================================================
// Device list tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadsValidDevicesAndSkipsInvalidOnes) {
    writeFile(devicesPath, R"([
        {"device_name": "Lobby", "type": "dlna", "hostname": "10.0.0.5",
         "action_url": "http://10.0.0.5:49152/upnp/control/AVTransport1",
         "video_file": ")" + videoPath.string() + R"(", "loop": false, "zone": "north"},
        {"device_name": "Wall", "type": "Transcreen", "hostname": "10.0.0.6:8080",
         "video_file": ")" + videoPath.string() + R"("},
        {"device_name": "NoAction", "type": "dlna", "hostname": "10.0.0.7",
         "video_file": ")" + videoPath.string() + R"("},
        {"device_name": "MissingVideo", "type": "transcreen", "hostname": "10.0.0.8",
         "video_file": "/nonexistent/clip.mp4"},
        {"device_name": "BadType", "type": "chromecast", "hostname": "10.0.0.9",
         "video_file": ")" + videoPath.string() + R"("},
        "not an object"
    ])");

    std::vector<DeviceConfigEntry> entries;
    std::string error;
    ASSERT_TRUE(loadDeviceConfigs(devicesPath, entries, error)) << error;
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].deviceName, "Lobby");
    EXPECT_EQ(entries[0].type, "dlna");
    EXPECT_FALSE(entries[0].loop);
    EXPECT_EQ(entries[0].zone, "north");

    EXPECT_EQ(entries[1].deviceName, "Wall");
    EXPECT_EQ(entries[1].type, "transcreen");
    EXPECT_TRUE(entries[1].loop);
}

TEST_F(ConfigLoaderTest, DeviceListMustBeAnArray) {
    writeFile(devicesPath, R"({"device_name": "Lobby"})");

    std::vector<DeviceConfigEntry> entries;
    std::string error;
    EXPECT_FALSE(loadDeviceConfigs(devicesPath, entries, error));
    EXPECT_NE(error.find("array"), std::string::npos);
}

TEST_F(ConfigLoaderTest, MissingDeviceListReportsError) {
    std::vector<DeviceConfigEntry> entries;
    std::string error;
    EXPECT_FALSE(loadDeviceConfigs(tempDir / "absent.json", entries, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigLoaderTest, ValidateRequiresActionUrlOnlyForDlna) {
    DeviceConfigEntry entry;
    entry.type = "transcreen";
    entry.hostname = "10.0.0.6";
    entry.videoFile = videoPath.string();

    std::string error;
    EXPECT_TRUE(validateDeviceConfig(entry, error)) << error;

    entry.type = "dlna";
    EXPECT_FALSE(validateDeviceConfig(entry, error));
    EXPECT_EQ(error, "missing action_url");
}
