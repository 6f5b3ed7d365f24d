#include "devices/device_registry.h"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using devices::ConnectionStatus;
using devices::Device;
using devices::DeviceRegistry;

namespace {

Device makeDevice(const std::string& id, const std::string& host) {
    Device device;
    device.id = id;
    device.friendlyName = "Renderer " + id;
    device.hostname = host;
    device.port = 49152;
    return device;
}

castgrid::Timestamp at(int seconds) {
    return castgrid::Timestamp(std::chrono::seconds(1714521600 + seconds));
}

}  // namespace

TEST(DeviceRegistry, AddRejectsDuplicateAndEmptyIds) {
    DeviceRegistry registry;
    EXPECT_TRUE(registry.add(makeDevice("uuid:a", "10.0.0.1")));
    EXPECT_FALSE(registry.add(makeDevice("uuid:a", "10.0.0.2")));
    EXPECT_FALSE(registry.add(makeDevice("", "10.0.0.3")));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get("uuid:a")->hostname, "10.0.0.1");
}

TEST(DeviceRegistry, RemoveAndClear) {
    DeviceRegistry registry;
    registry.add(makeDevice("a", "10.0.0.1"));
    registry.add(makeDevice("b", "10.0.0.2"));

    EXPECT_TRUE(registry.remove("a"));
    EXPECT_FALSE(registry.remove("a"));
    EXPECT_FALSE(registry.contains("a"));
    EXPECT_TRUE(registry.contains("b"));

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST(DeviceRegistry, FollowsConnectionStateMachine) {
    DeviceRegistry registry;
    registry.add(makeDevice("a", "10.0.0.1"));
    std::string error;

    // disconnected -> connected skips connecting
    EXPECT_FALSE(registry.transition("a", ConnectionStatus::Connected, at(0), error));
    EXPECT_NE(error.find("disconnected"), std::string::npos);

    EXPECT_TRUE(registry.transition("a", ConnectionStatus::Connecting, at(1), error));
    EXPECT_TRUE(registry.transition("a", ConnectionStatus::Connected, at(2), error));
    EXPECT_TRUE(registry.transition("a", ConnectionStatus::Error, at(3), error));
    EXPECT_FALSE(registry.transition("a", ConnectionStatus::Connected, at(4), error));
    EXPECT_TRUE(registry.transition("a", ConnectionStatus::Disconnected, at(5), error));

    auto device = registry.get("a");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->connectionStatus, ConnectionStatus::Disconnected);
    EXPECT_EQ(device->connectionChangedAt, at(5));
}

TEST(DeviceRegistry, SameStateTransitionIsNoop) {
    DeviceRegistry registry;
    registry.add(makeDevice("a", "10.0.0.1"));
    std::string error;

    EXPECT_TRUE(registry.transition("a", ConnectionStatus::Disconnected, at(9), error));
    EXPECT_FALSE(registry.get("a")->connectionChangedAt.has_value());
}

TEST(DeviceRegistry, TransitionOfUnknownDeviceFails) {
    DeviceRegistry registry;
    std::string error;
    EXPECT_FALSE(registry.transition("ghost", ConnectionStatus::Connecting, at(0), error));
    EXPECT_NE(error.find("ghost"), std::string::npos);
}

TEST(DeviceRegistry, FindByHostAndModify) {
    DeviceRegistry registry;
    registry.add(makeDevice("a", "10.0.0.1"));
    registry.add(makeDevice("b", "10.0.0.2"));

    EXPECT_EQ(registry.findByHost("10.0.0.2").value_or(""), "b");
    EXPECT_FALSE(registry.findByHost("10.0.0.3").has_value());
    EXPECT_FALSE(registry.findByHost("").has_value());

    EXPECT_TRUE(registry.modify("a", [](Device& d) { d.friendlyName = "Lobby"; }));
    EXPECT_FALSE(registry.modify("ghost", [](Device&) {}));
    EXPECT_EQ(registry.get("a")->friendlyName, "Lobby");
}

TEST(DeviceRegistry, ConcurrentModifyKeepsEveryUpdate) {
    DeviceRegistry registry;
    registry.add(makeDevice("a", "10.0.0.1"));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry]() {
            for (int i = 0; i < 250; ++i) {
                registry.modify("a", [](Device& d) { d.port++; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(registry.get("a")->port, 49152 + 1000);
}

TEST(DeviceRegistry, JsonViewListsDevices) {
    DeviceRegistry registry;
    registry.add(makeDevice("a", "10.0.0.1"));
    auto json = registry.toJson();
    EXPECT_EQ(json["device_count"], 1);
    EXPECT_EQ(json["devices"][0]["id"], "a");
    EXPECT_EQ(json["devices"][0]["connection_status"], "disconnected");
    EXPECT_EQ(json["devices"][0]["user_control"]["mode"], "auto");
}

TEST(UserControl, HoldsUntilExpiry) {
    devices::UserControl control;
    EXPECT_FALSE(control.isHolding(at(0)));

    control.mode = devices::UserControlMode::User;
    EXPECT_TRUE(control.isHolding(at(0)));

    control.expiresAt = at(300);
    EXPECT_TRUE(control.isHolding(at(299)));
    EXPECT_FALSE(control.isHolding(at(300)));
}
