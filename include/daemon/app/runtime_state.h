#pragma once

#include "core/config_loader.h"

#include <atomic>
#include <memory>
#include <vector>

namespace devices {
class DeviceRegistry;
}  // namespace devices

namespace control {
class ControlClient;
class HttpTransport;
}  // namespace control

namespace discovery {
class DiscoveryEngine;
class SsdpSocket;
}  // namespace discovery

namespace streaming {
class StreamingSessionRegistry;
class StreamingServer;
}  // namespace streaming

namespace playback {
class PlaybackSupervisor;
}  // namespace playback

namespace blackout {
class BlackoutCoordinator;
}  // namespace blackout

namespace daemon_app {

struct ControlFlags {
    // Cleared when the current iteration stops; long-running component loops watch it
    std::atomic<bool> running{true};
    std::atomic<bool> zmqBindFailed{false};
};

// Components of one run() iteration. Built once, torn down in reverse order.
struct ComponentState {
    std::unique_ptr<devices::DeviceRegistry> registry;
    std::shared_ptr<control::HttpTransport> http;
    std::unique_ptr<control::ControlClient> control;
    std::unique_ptr<discovery::SsdpSocket> ssdpSocket;
    std::unique_ptr<discovery::DiscoveryEngine> discovery;
    std::unique_ptr<streaming::StreamingSessionRegistry> sessions;
    std::unique_ptr<streaming::StreamingServer> server;
    std::unique_ptr<playback::PlaybackSupervisor> supervisor;
    std::unique_ptr<blackout::BlackoutCoordinator> blackout;
};

struct RuntimeState {
    AppConfig config;
    std::vector<DeviceConfigEntry> deviceConfigs;

    ControlFlags flags;
    ComponentState components;
};

}  // namespace daemon_app
