#include "daemon/control/control_plane.h"
#include "support/fake_http_transport.h"
#include "support/fake_ssdp_socket.h"
#include "support/manual_clock.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <zmq.hpp>

using test_support::FakeHttpTransport;

namespace fs = std::filesystem;

namespace {

class ControlPlaneTest : public ::testing::Test {
   protected:
    void SetUp() override {
        static std::atomic<int> counter{0};
        tempDir = fs::temp_directory_path() /
                  ("castgrid_control_plane_test_" + std::to_string(::getpid()) + "_" +
                   std::to_string(counter++));
        fs::create_directories(tempDir);
        contentPath = (tempDir / "menu.mp4").string();
        clipPath = (tempDir / "black.mp4").string();
        std::ofstream(contentPath) << "menu";
        std::ofstream(clipPath) << "black";

        config.ipc.endpoint = "ipc://" + (tempDir / "castgrid.sock").string();
        config.ipc.pollIntervalMs = 50;

        http = std::make_shared<FakeHttpTransport>();
        http->route(":8200/", FakeHttpTransport::ok());
        http->route(":8200/", "GetTransportInfo",
                    {FakeHttpTransport::ok(
                        "<CurrentTransportState>STOPPED</CurrentTransportState>")});

        devices::Device device;
        device.id = "uuid:lobby";
        device.hostname = "192.168.1.50";
        device.port = 8200;
        device.controlUrl = "http://192.168.1.50:8200/AVTransport/control";
        device.connectionStatus = devices::ConnectionStatus::Connected;
        registry.add(device);

        control::ControlOptions controlOptions;
        controlOptions.maxAttempts = 1;
        client = std::make_unique<control::ControlClient>(http, controlOptions);
        client->setSleeper([](std::chrono::milliseconds) {});
        sessions = std::make_unique<streaming::StreamingSessionRegistry>(clock.provider());
        sessions->setBaseUrl("http://192.168.1.10:9000");

        discovery::DiscoveryEngine::Dependencies discoveryDeps;
        discoveryDeps.registry = &registry;
        discoveryDeps.socket = &socket;
        discoveryDeps.http = http.get();
        discoveryDeps.now = clock.provider();
        discoveryEngine = std::make_unique<discovery::DiscoveryEngine>(
            std::move(discoveryDeps), discovery::DiscoveryOptions{});

        playback::PlaybackSupervisor::Dependencies supervisorDeps;
        supervisorDeps.registry = &registry;
        supervisorDeps.control = client.get();
        supervisorDeps.sessions = sessions.get();
        supervisorDeps.now = clock.provider();
        supervisor = std::make_unique<playback::PlaybackSupervisor>(std::move(supervisorDeps),
                                                                    playback::SupervisorOptions{});

        blackout::BlackoutCoordinator::Dependencies blackoutDeps;
        blackoutDeps.registry = &registry;
        blackoutDeps.supervisor = supervisor.get();
        blackoutDeps.now = clock.provider();
        blackout::BlackoutOptions blackoutOptions;
        blackoutOptions.clipPath = clipPath;
        coordinator = std::make_unique<blackout::BlackoutCoordinator>(std::move(blackoutDeps),
                                                                      blackoutOptions);

        daemon_control::ControlPlaneDependencies deps;
        deps.config = &config;
        deps.stop = &stop;
        deps.zmqBindFailed = &bindFailed;
        deps.registry = &registry;
        deps.discovery = discoveryEngine.get();
        deps.supervisor = supervisor.get();
        deps.sessions = sessions.get();
        deps.blackout = coordinator.get();
        plane = std::make_unique<daemon_control::ControlPlane>(std::move(deps));
        ASSERT_TRUE(plane->start());
    }

    void TearDown() override {
        plane->stop();
        supervisor->stop();
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    std::string send(const std::string& message) {
        zmq::socket_t req(ctx, zmq::socket_type::req);
        req.set(zmq::sockopt::rcvtimeo, 5000);
        req.set(zmq::sockopt::linger, 0);
        req.connect(config.ipc.endpoint);
        req.send(zmq::buffer(message), zmq::send_flags::none);
        zmq::message_t reply;
        if (!req.recv(reply, zmq::recv_flags::none)) {
            return {};
        }
        return std::string(static_cast<char*>(reply.data()), reply.size());
    }

    nlohmann::json sendJson(const std::string& cmd, const nlohmann::json& params) {
        nlohmann::json request;
        request["cmd"] = cmd;
        request["params"] = params;
        auto reply = send(request.dump());
        EXPECT_FALSE(reply.empty());
        return nlohmann::json::parse(reply);
    }

    fs::path tempDir;
    std::string contentPath;
    std::string clipPath;
    AppConfig config;
    daemon_core::StopController stop;
    std::atomic<bool> bindFailed{false};

    test_support::ManualClock clock;
    test_support::FakeSsdpSocket socket;
    std::shared_ptr<FakeHttpTransport> http;
    devices::DeviceRegistry registry;
    std::unique_ptr<control::ControlClient> client;
    std::unique_ptr<streaming::StreamingSessionRegistry> sessions;
    std::unique_ptr<discovery::DiscoveryEngine> discoveryEngine;
    std::unique_ptr<playback::PlaybackSupervisor> supervisor;
    std::unique_ptr<blackout::BlackoutCoordinator> coordinator;
    std::unique_ptr<daemon_control::ControlPlane> plane;
    zmq::context_t ctx{1};
};

}  // namespace

TEST_F(ControlPlaneTest, PingAndDeviceList) {
    EXPECT_EQ(send("PING"), "OK");

    auto list = sendJson("DEVICE_LIST", nlohmann::json::object());
    EXPECT_EQ(list["status"], "ok");
    EXPECT_EQ(list["data"]["device_count"], 1);
    EXPECT_EQ(list["data"]["devices"][0]["id"], "uuid:lobby");
}

TEST_F(ControlPlaneTest, DeviceStatusByRawPayload) {
    auto reply = send("DEVICE_STATUS:uuid:lobby");
    ASSERT_EQ(reply.rfind("OK:", 0), 0u) << reply;
    auto data = nlohmann::json::parse(reply.substr(3));
    EXPECT_EQ(data["hostname"], "192.168.1.50");
    EXPECT_TRUE(data["session"].is_null());

    EXPECT_EQ(send("DEVICE_STATUS:uuid:ghost"), "ERR:DEVICE_NOT_FOUND:Unknown device: uuid:ghost");
    EXPECT_EQ(send("DEVICE_STATUS"),
              "ERR:IPC_INVALID_PARAMS:Missing params.device_id field");
}

TEST_F(ControlPlaneTest, PlayThenStopHoldsDevice) {
    auto missing = sendJson("PLAY", {{"device_id", "uuid:lobby"}});
    EXPECT_EQ(missing["error_code"], "IPC_INVALID_PARAMS");

    auto play = sendJson("PLAY", {{"device_id", "uuid:lobby"}, {"video_file", contentPath}});
    ASSERT_EQ(play["status"], "ok") << play.dump();
    EXPECT_EQ(play["data"]["session"]["content_ref"], contentPath);
    EXPECT_EQ(play["data"]["user_control"]["reason"], "user_play");
    EXPECT_EQ(http->countRequests("192.168.1.50", "Play"), 1u);

    auto stop = sendJson("STOP", {{"device_id", "uuid:lobby"}});
    ASSERT_EQ(stop["status"], "ok") << stop.dump();
    EXPECT_EQ(stop["data"]["user_control"]["reason"], "manual_stop");
    EXPECT_FALSE(sessions->currentFor("uuid:lobby").has_value());
}

TEST_F(ControlPlaneTest, ParameterValidation) {
    auto seek = sendJson("SEEK", {{"device_id", "uuid:lobby"}, {"position", "1:00"}});
    EXPECT_EQ(seek["error_code"], "IPC_INVALID_PARAMS");

    auto brightness = sendJson("SET_BRIGHTNESS", {{"brightness", 101}});
    EXPECT_EQ(brightness["error_code"], "VALIDATION_INVALID_BRIGHTNESS");

    auto mode = sendJson("USER_CONTROL_SET", {{"device_id", "uuid:lobby"}, {"mode", "forever"}});
    EXPECT_EQ(mode["error_code"], "VALIDATION_INVALID_USER_CONTROL");

    auto progress = sendJson("SESSION_PROGRESS", {{"session_id", "nope"}, {"position", 3}});
    EXPECT_EQ(progress["error_code"], "STREAM_SESSION_NOT_FOUND");
}

TEST_F(ControlPlaneTest, DiscoveryPauseAndScan) {
    auto paused = sendJson("DISCOVERY_PAUSE", nlohmann::json::object());
    EXPECT_EQ(paused["status"], "ok");
    EXPECT_EQ(paused["data"]["paused"], true);
    EXPECT_TRUE(discoveryEngine->isPaused());

    auto scan = sendJson("DISCOVERY_SCAN", nlohmann::json::object());
    EXPECT_EQ(scan["error_code"], "DISCOVERY_SOCKET_ERROR");

    auto resumed = sendJson("DISCOVERY_RESUME", nlohmann::json::object());
    EXPECT_EQ(resumed["data"]["paused"], false);
}

TEST_F(ControlPlaneTest, BlackoutStatusAndStats) {
    auto status = sendJson("BLACKOUT_STATUS", nlohmann::json::object());
    EXPECT_EQ(status["data"]["blackout_active"], false);
    EXPECT_EQ(status["data"]["brightness"], 100);

    auto stats = sendJson("PLAYBACK_STATS", nlohmann::json::object());
    EXPECT_EQ(stats["data"]["devices"], 1);
    EXPECT_EQ(stats["data"]["blackout_active"], false);
    EXPECT_TRUE(stats["data"].contains("sessions"));
    // Counters are recorded once a reply is built, so only earlier commands show up
    EXPECT_EQ(stats["data"]["commands"]["BLACKOUT_STATUS"]["requests"], 1);
    EXPECT_FALSE(stats["data"]["commands"].contains("PLAYBACK_STATS"));
}

TEST_F(ControlPlaneTest, DeviceRemoveForgetsDevice) {
    supervisor->reconcileDevice("uuid:lobby");
    ASSERT_TRUE(supervisor->tracks("uuid:lobby"));

    auto removed = sendJson("DEVICE_REMOVE", {{"device_id", "uuid:lobby"}});
    EXPECT_EQ(removed["status"], "ok");
    EXPECT_FALSE(registry.contains("uuid:lobby"));
    EXPECT_FALSE(supervisor->tracks("uuid:lobby"));
    EXPECT_FALSE(sessions->currentFor("uuid:lobby").has_value());

    supervisor->runPass();
    EXPECT_FALSE(supervisor->tracks("uuid:lobby"));

    auto again = sendJson("DEVICE_REMOVE", {{"device_id", "uuid:lobby"}});
    EXPECT_EQ(again["error_code"], "DEVICE_NOT_FOUND");
}

TEST_F(ControlPlaneTest, ReloadAndShutdownGoThroughStopController) {
    EXPECT_EQ(send("RELOAD"), "OK:Reload scheduled");
    EXPECT_EQ(stop.poll(), daemon_core::StopReason::Reload);
    EXPECT_EQ(stop.origin(), "operator");

    auto shutdown = sendJson("SHUTDOWN", nlohmann::json::object());
    EXPECT_EQ(shutdown["status"], "ok");
    EXPECT_EQ(stop.poll(), daemon_core::StopReason::Shutdown);
}

TEST_F(ControlPlaneTest, BindFailureStopsDaemon) {
    daemon_control::ControlPlaneDependencies deps;
    AppConfig clash;
    clash.ipc.endpoint = "tcp://127.0.0.1:47621";
    daemon_ipc::ZmqCommandServer holder(clash.ipc.endpoint);
    ASSERT_TRUE(holder.start());

    daemon_core::StopController otherStop;
    std::atomic<bool> otherBindFailed{false};
    deps.config = &clash;
    deps.stop = &otherStop;
    deps.zmqBindFailed = &otherBindFailed;
    daemon_control::ControlPlane other(std::move(deps));

    EXPECT_FALSE(other.start());
    EXPECT_TRUE(otherBindFailed.load());
    EXPECT_EQ(otherStop.poll(), daemon_core::StopReason::Shutdown);
    EXPECT_EQ(otherStop.origin(), "control plane bind failure");
}
