#include "daemon/control/ipc_protocol.h"

#include <gtest/gtest.h>

using daemon_ipc::parseRequest;

TEST(IpcProtocolTest, RawRequestSplitsAtFirstColon) {
    auto request = parseRequest("stop:uuid:lobby");
    EXPECT_FALSE(request.isJson);
    EXPECT_EQ(request.command, "STOP");
    EXPECT_EQ(request.payload, "uuid:lobby");
    EXPECT_TRUE(request.params().empty());

    auto withParams = parseRequest("blackout_activate:{\"x\":1}");
    EXPECT_EQ(withParams.params()["x"], 1);
}

TEST(IpcProtocolTest, RawRequestStopsAtNulTerminator) {
    std::string raw("PING\0garbage", 12);
    auto request = parseRequest(raw);
    EXPECT_EQ(request.command, "PING");
    EXPECT_TRUE(request.payload.empty());
}

TEST(IpcProtocolTest, JsonRequest) {
    auto request = parseRequest(R"({"cmd":"seek","params":{"device_id":"tv","position_seconds":5}})");
    EXPECT_TRUE(request.isJson);
    EXPECT_TRUE(request.parseError.empty());
    EXPECT_EQ(request.command, "SEEK");
    EXPECT_EQ(request.params()["position_seconds"], 5);

    auto noParams = parseRequest(R"({"cmd":"PING","params":[1]})");
    EXPECT_TRUE(noParams.params().is_object());
    EXPECT_TRUE(noParams.params().empty());

    auto broken = parseRequest("{\"cmd\":");
    EXPECT_TRUE(broken.isJson);
    EXPECT_FALSE(broken.parseError.empty());
}

TEST(IpcProtocolTest, RepliesFollowTheRequestForm) {
    auto raw = parseRequest("STATUS");
    EXPECT_EQ(daemon_ipc::buildOkResponse(raw), "OK");
    EXPECT_EQ(daemon_ipc::buildOkResponse(raw, {}, "done"), "OK:done");
    auto err = daemon_ipc::buildErrorResponse(raw, CastEngine::ErrorCode::DEVICE_NOT_FOUND,
                                              "no such device");
    EXPECT_EQ(err, "ERR:DEVICE_NOT_FOUND:no such device");
    EXPECT_TRUE(daemon_ipc::isErrorResponse(raw, err));
    EXPECT_FALSE(daemon_ipc::isErrorResponse(raw, "OK:ERR"));

    auto json = parseRequest(R"({"cmd":"STATUS"})");
    auto okText = daemon_ipc::buildOkResponse(json, {{"devices", 2}});
    auto ok = nlohmann::json::parse(okText);
    EXPECT_EQ(ok["status"], "ok");
    EXPECT_EQ(ok["data"]["devices"], 2);
    EXPECT_FALSE(ok.contains("message"));
    EXPECT_FALSE(daemon_ipc::isErrorResponse(json, okText));
    EXPECT_TRUE(daemon_ipc::isErrorResponse(
        json, daemon_ipc::buildErrorResponse(json, CastEngine::ErrorCode::INTERNAL_UNKNOWN, "x")));
}

TEST(IpcProtocolTest, EventTopicIsTheEventType) {
    auto event = daemon_ipc::makeEvent({{"type", "playback_recovered"}, {"device_id", "tv"}});
    EXPECT_EQ(event.topic, "playback_recovered");
    EXPECT_EQ(nlohmann::json::parse(event.body)["device_id"], "tv");

    EXPECT_EQ(daemon_ipc::makeEvent({{"device_id", "tv"}}).topic, "event");
}

TEST(IpcProtocolTest, PubEndpointSitsNextToTheControlSocket) {
    EXPECT_EQ(daemon_ipc::derivePubEndpoint("ipc:///tmp/castgrid.sock"),
              "ipc:///tmp/castgrid.sock.pub");
    EXPECT_EQ(daemon_ipc::derivePubEndpoint("tcp://127.0.0.1:5555"), "tcp://127.0.0.1:5556");
    EXPECT_EQ(daemon_ipc::derivePubEndpoint("tcp://*:abc"), "tcp://*:abc.pub");
}
