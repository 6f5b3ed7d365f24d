#pragma once

#include "blackout/blackout_coordinator.h"
#include "core/config_loader.h"
#include "daemon/control/zmq_server.h"
#include "daemon/core/graceful_shutdown.h"
#include "devices/device_registry.h"
#include "discovery/discovery_engine.h"
#include "playback/playback_supervisor.h"
#include "streaming/session_registry.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace daemon_control {

struct ControlPlaneDependencies {
    AppConfig* config = nullptr;
    // RELOAD and SHUTDOWN land here, as does a failed bind
    daemon_core::StopController* stop = nullptr;
    std::atomic<bool>* zmqBindFailed = nullptr;

    devices::DeviceRegistry* registry = nullptr;
    discovery::DiscoveryEngine* discovery = nullptr;
    playback::PlaybackSupervisor* supervisor = nullptr;
    streaming::StreamingSessionRegistry* sessions = nullptr;
    blackout::BlackoutCoordinator* blackout = nullptr;

    // Periodic JSON dump of playback and session statistics; disabled when empty
    std::string statsFilePath;
};

class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();

    std::function<void(const nlohmann::json&)> eventPublisher();

   private:
    void registerHandlers();
    void startStatsThread();
    void stopStatsThread();
    void publish(const nlohmann::json& payload);
    nlohmann::json collectStats() const;

    std::string handlePing(const daemon_ipc::IpcRequest& request);
    std::string handleReload(const daemon_ipc::IpcRequest& request);
    std::string handleShutdown(const daemon_ipc::IpcRequest& request);
    std::string handleDeviceList(const daemon_ipc::IpcRequest& request);
    std::string handleDeviceStatus(const daemon_ipc::IpcRequest& request);
    std::string handleDeviceRemove(const daemon_ipc::IpcRequest& request);
    std::string handlePlay(const daemon_ipc::IpcRequest& request);
    std::string handleStop(const daemon_ipc::IpcRequest& request);
    std::string handlePause(const daemon_ipc::IpcRequest& request);
    std::string handleResume(const daemon_ipc::IpcRequest& request);
    std::string handleSeek(const daemon_ipc::IpcRequest& request);
    std::string handleUserControlSet(const daemon_ipc::IpcRequest& request);
    std::string handleDiscoveryPause(const daemon_ipc::IpcRequest& request);
    std::string handleDiscoveryResume(const daemon_ipc::IpcRequest& request);
    std::string handleDiscoveryStatus(const daemon_ipc::IpcRequest& request);
    std::string handleDiscoveryScan(const daemon_ipc::IpcRequest& request);
    std::string handleSetBrightness(const daemon_ipc::IpcRequest& request);
    std::string handleBlackoutActivate(const daemon_ipc::IpcRequest& request);
    std::string handleBlackoutRestore(const daemon_ipc::IpcRequest& request);
    std::string handleBlackoutStatus(const daemon_ipc::IpcRequest& request);
    std::string handleSessionList(const daemon_ipc::IpcRequest& request);
    std::string handleSessionProgress(const daemon_ipc::IpcRequest& request);
    std::string handlePlaybackStats(const daemon_ipc::IpcRequest& request);

    ControlPlaneDependencies deps_;
    std::unique_ptr<daemon_ipc::ZmqCommandServer> zmqServer_;
    std::atomic<bool> statsThreadRunning_{false};
    std::thread statsThread_;
};

}  // namespace daemon_control
