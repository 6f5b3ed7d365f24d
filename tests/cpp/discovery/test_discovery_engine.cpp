#include "discovery/configured_device.h"
#include "discovery/discovery_engine.h"
#include "support/fake_http_transport.h"
#include "support/fake_ssdp_socket.h"
#include "support/manual_clock.h"

#include <gtest/gtest.h>

using devices::ConnectionStatus;
using test_support::FakeHttpTransport;

namespace {

const char* kDescriptionXml =
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\"><device>"
    "<friendlyName>Lobby TV</friendlyName><UDN>uuid:lobby</UDN>"
    "<serviceList><service><serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
    "<controlURL>/AVTransport/control</controlURL></service></serviceList>"
    "</device></root>";

discovery::SsdpDatagram rendererReply(const std::string& host, const std::string& uuid) {
    discovery::SsdpDatagram datagram;
    datagram.sourceHost = host;
    datagram.sourcePort = 1900;
    datagram.payload = "HTTP/1.1 200 OK\r\n"
                       "LOCATION: http://" + host + ":8200/desc.xml\r\n"
                       "ST: urn:schemas-upnp-org:service:AVTransport:1\r\n"
                       "USN: " + uuid + "::urn:schemas-upnp-org:service:AVTransport:1\r\n"
                       "\r\n";
    return datagram;
}

class DiscoveryEngineTest : public ::testing::Test {
   protected:
    void SetUp() override {
        http.route(":8200/desc.xml", FakeHttpTransport::ok(kDescriptionXml));

        discovery::DiscoveryEngine::Dependencies deps;
        deps.registry = &registry;
        deps.socket = &socket;
        deps.http = &http;
        deps.now = clock.provider();
        deps.eventPublisher = [this](const nlohmann::json& event) { events.push_back(event); };

        discovery::DiscoveryOptions options;
        options.disconnectTimeout = std::chrono::seconds(30);
        options.errorBackoff = std::chrono::seconds(60);
        engine = std::make_unique<discovery::DiscoveryEngine>(std::move(deps), options);
    }

    size_t countEvents(const std::string& type) const {
        size_t count = 0;
        for (const auto& event : events) {
            if (event["type"] == type) {
                count++;
            }
        }
        return count;
    }

    devices::DeviceRegistry registry;
    test_support::FakeSsdpSocket socket;
    FakeHttpTransport http;
    test_support::ManualClock clock;
    std::vector<nlohmann::json> events;
    std::unique_ptr<discovery::DiscoveryEngine> engine;
};

}  // namespace

TEST_F(DiscoveryEngineTest, NewRendererIsRegisteredAndConnected) {
    socket.setReplies({rendererReply("192.168.1.50", "uuid:lobby")});

    auto report = engine->runCycle();
    EXPECT_EQ(report.replies, 1u);
    EXPECT_EQ(report.newDevices, 1u);
    EXPECT_NE(socket.lastRequest().find("M-SEARCH"), std::string::npos);

    auto device = registry.get("uuid:lobby");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->friendlyName, "Lobby TV");
    EXPECT_EQ(device->hostname, "192.168.1.50");
    EXPECT_EQ(device->port, 8200);
    EXPECT_EQ(device->controlUrl, "http://192.168.1.50:8200/AVTransport/control");
    EXPECT_EQ(device->discoveryMethod, "ssdp");
    EXPECT_EQ(device->connectionStatus, ConnectionStatus::Connected);
    EXPECT_EQ(device->lastDiscoveredAt, clock.now());
    EXPECT_EQ(countEvents("device_discovered"), 1u);
}

TEST_F(DiscoveryEngineTest, MalformedAndForeignRepliesAreDropped) {
    discovery::SsdpDatagram garbage;
    garbage.sourceHost = "192.168.1.9";
    garbage.payload = "this is not ssdp";
    discovery::SsdpDatagram gateway;
    gateway.sourceHost = "192.168.1.1";
    gateway.payload = "HTTP/1.1 200 OK\r\nST: urn:schemas-upnp-org:device:InternetGatewayDevice:1\r\n\r\n";
    socket.setReplies({garbage, gateway, rendererReply("192.168.1.50", "uuid:lobby")});

    auto report = engine->runCycle();
    EXPECT_EQ(report.malformed, 1u);
    EXPECT_EQ(report.ignored, 1u);
    EXPECT_EQ(report.newDevices, 1u);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(DiscoveryEngineTest, DuplicateRepliesInOneCycleCountOnce) {
    auto reply = rendererReply("192.168.1.50", "uuid:lobby");
    socket.setReplies({reply, reply, reply});

    auto report = engine->runCycle();
    EXPECT_EQ(report.accepted, 1u);
    EXPECT_EQ(http.countRequests("desc.xml"), 1u);
}

TEST_F(DiscoveryEngineTest, DescriptionFailureSkipsDevice) {
    http.route(":8200/desc.xml", FakeHttpTransport::status(404));
    socket.setReplies({rendererReply("192.168.1.50", "uuid:lobby")});

    auto report = engine->runCycle();
    EXPECT_EQ(report.descriptionFailures, 1u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(DiscoveryEngineTest, UnseenDeviceDisconnectsAfterTimeoutAndReconnects) {
    socket.setReplies({rendererReply("192.168.1.50", "uuid:lobby")});
    engine->runCycle();

    socket.setReplies({});
    clock.advance(std::chrono::seconds(29));
    engine->runCycle();
    EXPECT_EQ(registry.get("uuid:lobby")->connectionStatus, ConnectionStatus::Connected);

    clock.advance(std::chrono::seconds(1));
    auto report = engine->runCycle();
    EXPECT_EQ(report.disconnected, 1u);
    EXPECT_EQ(registry.get("uuid:lobby")->connectionStatus, ConnectionStatus::Disconnected);
    EXPECT_EQ(countEvents("device_disconnected"), 1u);

    // Records are never removed by discovery; a new reply brings the device back
    socket.setReplies({rendererReply("192.168.1.50", "uuid:lobby")});
    clock.advance(std::chrono::seconds(5));
    report = engine->runCycle();
    EXPECT_EQ(report.reconnected, 1u);
    EXPECT_EQ(report.newDevices, 0u);
    EXPECT_EQ(registry.get("uuid:lobby")->connectionStatus, ConnectionStatus::Connected);
    EXPECT_EQ(http.countRequests("desc.xml"), 1u);
}

TEST_F(DiscoveryEngineTest, SocketErrorIsReportedAndCycleContinues) {
    socket.failWith("bind failed");

    auto report = engine->runCycle();
    EXPECT_TRUE(report.socketError);
    EXPECT_EQ(engine->statusJson()["last_error"], "bind failed");

    socket.setReplies({rendererReply("192.168.1.50", "uuid:lobby")});
    report = engine->runCycle();
    EXPECT_FALSE(report.socketError);
    EXPECT_EQ(report.newDevices, 1u);
    EXPECT_TRUE(engine->statusJson()["last_error"].is_null());
}

TEST_F(DiscoveryEngineTest, PausedEngineSkipsCycles) {
    engine->pause();
    EXPECT_TRUE(engine->isPaused());
    EXPECT_TRUE(engine->runCycle().skipped);
    EXPECT_EQ(socket.searches(), 0);
    EXPECT_FALSE(engine->scanNow());
    EXPECT_EQ(countEvents("discovery_paused"), 1u);

    engine->resume();
    EXPECT_FALSE(engine->runCycle().skipped);
    EXPECT_EQ(socket.searches(), 1);
}

TEST_F(DiscoveryEngineTest, ConfiguredDeviceIsPinnedAndMergesSsdpReplies) {
    DeviceConfigEntry entry;
    entry.deviceName = "Lobby";
    entry.type = "dlna";
    entry.hostname = "192.168.1.50";
    entry.actionUrl = "http://192.168.1.50:8200/AVTransport/control";
    devices::Device device;
    std::string error;
    ASSERT_TRUE(discovery::deviceFromConfig(entry, device, error)) << error;

    ASSERT_TRUE(engine->registerConfiguredDevice(device));
    EXPECT_FALSE(engine->registerConfiguredDevice(device));
    EXPECT_EQ(registry.get("192.168.1.50")->connectionStatus, ConnectionStatus::Connected);

    socket.setReplies({rendererReply("192.168.1.50", "uuid:lobby")});
    auto report = engine->runCycle();
    EXPECT_EQ(report.updated, 1u);
    EXPECT_EQ(report.newDevices, 0u);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get("192.168.1.50")->lastDiscoveredAt, clock.now());

    // Pinned devices do not age out
    socket.setReplies({});
    clock.advance(std::chrono::minutes(10));
    engine->runCycle();
    EXPECT_EQ(registry.get("192.168.1.50")->connectionStatus, ConnectionStatus::Connected);
}

TEST_F(DiscoveryEngineTest, UnreachableDeviceBacksOffThenReconnects) {
    DeviceConfigEntry entry;
    entry.type = "transcreen";
    entry.hostname = "10.0.0.7:8080";
    devices::Device device;
    std::string error;
    ASSERT_TRUE(discovery::deviceFromConfig(entry, device, error)) << error;
    ASSERT_TRUE(engine->registerConfiguredDevice(device));

    EXPECT_TRUE(engine->markUnreachable("10.0.0.7", "3 consecutive poll failures"));
    EXPECT_EQ(registry.get("10.0.0.7")->connectionStatus, ConnectionStatus::Error);
    EXPECT_FALSE(engine->markUnreachable("10.0.0.7", "again"));
    EXPECT_EQ(countEvents("device_error"), 1u);

    clock.advance(std::chrono::seconds(59));
    engine->runCycle();
    EXPECT_EQ(registry.get("10.0.0.7")->connectionStatus, ConnectionStatus::Error);

    clock.advance(std::chrono::seconds(1));
    engine->runCycle();
    EXPECT_EQ(registry.get("10.0.0.7")->connectionStatus, ConnectionStatus::Disconnected);

    // The next cycle reconnects the pinned record
    auto report = engine->runCycle();
    EXPECT_EQ(report.reconnected, 1u);
    EXPECT_EQ(registry.get("10.0.0.7")->connectionStatus, ConnectionStatus::Connected);
}

TEST_F(DiscoveryEngineTest, EventsCarryTypeAndTimestamp) {
    socket.setReplies({rendererReply("192.168.1.50", "uuid:lobby")});
    engine->runCycle();

    ASSERT_FALSE(events.empty());
    const auto& event = events.front();
    EXPECT_EQ(event["type"], "device_discovered");
    EXPECT_EQ(event["timestamp"], castgrid::toUnixMillis(clock.now()));
    EXPECT_EQ(event["data"]["id"], "uuid:lobby");
}

TEST(ConfiguredDevice, DlnaEntryUsesActionUrl) {
    DeviceConfigEntry entry;
    entry.type = "dlna";
    entry.actionUrl = "http://192.168.1.60:1400/MediaRenderer/AVTransport/Control";
    entry.group = "lobby";

    devices::Device device;
    std::string error;
    ASSERT_TRUE(discovery::deviceFromConfig(entry, device, error)) << error;
    EXPECT_EQ(device.id, "192.168.1.60");
    EXPECT_EQ(device.hostname, "192.168.1.60");
    EXPECT_EQ(device.port, 1400);
    EXPECT_EQ(device.controlUrl, entry.actionUrl);
    EXPECT_EQ(device.friendlyName, "192.168.1.60");
    EXPECT_EQ(device.discoveryMethod, "config");
    EXPECT_EQ(device.group, "lobby");
    EXPECT_TRUE(device.pinned);
}

TEST(ConfiguredDevice, TranscreenEntrySplitsHostAndPort) {
    DeviceConfigEntry entry;
    entry.deviceName = "Window display";
    entry.type = "Transcreen";
    entry.hostname = "10.0.0.7:8080";

    devices::Device device;
    std::string error;
    ASSERT_TRUE(discovery::deviceFromConfig(entry, device, error)) << error;
    EXPECT_EQ(device.protocol, devices::ProtocolKind::Transcreen);
    EXPECT_EQ(device.id, "10.0.0.7");
    EXPECT_EQ(device.port, 8080);
    EXPECT_EQ(device.friendlyName, "Window display");
}

TEST(ConfiguredDevice, RejectsUnknownTypeAndBadUrl) {
    devices::Device device;
    std::string error;

    DeviceConfigEntry unknown;
    unknown.type = "chromecast";
    unknown.hostname = "10.0.0.8";
    EXPECT_FALSE(discovery::deviceFromConfig(unknown, device, error));
    EXPECT_NE(error.find("chromecast"), std::string::npos);

    DeviceConfigEntry badUrl;
    badUrl.type = "dlna";
    badUrl.actionUrl = "not-a-url";
    EXPECT_FALSE(discovery::deviceFromConfig(badUrl, device, error));
    EXPECT_NE(error.find("action_url"), std::string::npos);
}
