#pragma once

#include "control/control_client.h"
#include "core/clock.h"
#include "core/error_codes.h"
#include "devices/device_registry.h"
#include "playback/device_worker.h"
#include "streaming/session_registry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace playback {

enum class SupervisorState { Idle, Requesting, Playing, UserPaused, Error };

const char* supervisorStateToString(SupervisorState state);

struct DesiredContent {
    std::string contentRef;
    bool loop = true;
};

struct SupervisorOptions {
    std::chrono::seconds passInterval{5};
    std::chrono::seconds overrideWindow{300};
    int maxPlayRetries = 3;
    std::chrono::seconds retryBackoffBase{5};
    std::chrono::seconds retryBackoffMax{60};
    std::chrono::seconds errorRetry{60};
    int pollFailureThreshold = 3;
};

struct CommandResult {
    CastEngine::ErrorCode code = CastEngine::ErrorCode::OK;
    std::string message;
    nlohmann::json data = nlohmann::json::object();

    bool ok() const {
        return code == CastEngine::ErrorCode::OK;
    }
    static CommandResult failure(CastEngine::ErrorCode code, std::string message) {
        CommandResult result;
        result.code = code;
        result.message = std::move(message);
        return result;
    }
};

// What a device was doing when a blackout took it over
struct HeldState {
    bool wasPlaying = false;
    std::optional<std::string> contentRef;
    bool loop = true;
    std::optional<int> positionSeconds;
    devices::UserControl priorUserControl;
};

/**
 * @brief Reconciliation loop keeping each connected device on its desired content.
 *
 * Sole writer of playback_state, current_session_id and user_control. Each device
 * has a DeviceWorker; reconciliation passes, operator commands and blackout holds
 * for one device are serialized through it, so a slow device never blocks others.
 *
 * A device whose user_control is held (mode user, expiry in the future or none) is
 * never touched by reconciliation. Expiry is a timestamp comparison at each pass.
 */
class PlaybackSupervisor {
   public:
    struct Dependencies {
        devices::DeviceRegistry* registry = nullptr;
        control::ControlClient* control = nullptr;
        streaming::StreamingSessionRegistry* sessions = nullptr;
        castgrid::NowProvider now;
        // Reported when a device stops answering; connection status belongs to discovery
        std::function<void(const std::string& deviceId, const std::string& reason)>
            unreachableReporter;
        std::function<void(const nlohmann::json&)> eventPublisher;
    };

    PlaybackSupervisor(Dependencies deps, SupervisorOptions options);
    ~PlaybackSupervisor();

    PlaybackSupervisor(const PlaybackSupervisor&) = delete;
    PlaybackSupervisor& operator=(const PlaybackSupervisor&) = delete;

    void start();
    void stop();
    // Ends the periodic pass loop; queued per-device work keeps running.
    void stopScheduling();
    // True while any device worker has queued or running work
    bool hasPendingWork();

    // Queues one reconciliation per device; devices whose worker is still busy are skipped.
    void runPass();
    // One reconciliation of a single device, waiting for it to finish.
    void reconcileDevice(const std::string& deviceId);

    void setDesiredContent(const std::string& deviceId, DesiredContent desired);
    void clearDesiredContent(const std::string& deviceId);
    std::optional<DesiredContent> desiredContent(const std::string& deviceId) const;

    // Operator commands
    CommandResult play(const std::string& deviceId, const std::string& contentRef, bool loop);
    CommandResult stop(const std::string& deviceId);
    CommandResult pause(const std::string& deviceId);
    CommandResult resume(const std::string& deviceId);
    CommandResult seek(const std::string& deviceId, int positionSeconds);
    CommandResult setUserControl(const std::string& deviceId, devices::UserControlMode mode,
                                 const std::string& reason,
                                 std::optional<int> expiresInSeconds);

    // Blackout support. beginHold captures the device's state and holds it indefinitely.
    std::optional<HeldState> beginHold(const std::string& deviceId, const std::string& reason);
    CommandResult playHeld(const std::string& deviceId, const std::string& contentRef, bool loop);
    CommandResult stopHeld(const std::string& deviceId);
    void releaseHold(const std::string& deviceId, const devices::UserControl& prior);

    // Drops runtime state and the worker of a removed device. Call after the registry removal:
    // passes only create workers for devices still in the registry.
    void forgetDevice(const std::string& deviceId);
    // A worker or runtime state exists for the device
    bool tracks(const std::string& deviceId) const;

    SupervisorState stateOf(const std::string& deviceId) const;
    nlohmann::json deviceJson(const std::string& deviceId) const;
    nlohmann::json statsJson() const;

    void setEventPublisher(std::function<void(const nlohmann::json&)> eventPublisher);

   private:
    struct History {
        uint64_t attempts = 0;
        uint64_t successes = 0;
        uint64_t failures = 0;
        std::optional<castgrid::Timestamp> lastAttemptAt;
        std::optional<castgrid::Timestamp> lastSuccessAt;
        std::string lastError;
    };

    struct Runtime {
        SupervisorState state = SupervisorState::Idle;
        std::optional<DesiredContent> desired;
        int playFailures = 0;
        int pollFailures = 0;
        std::optional<castgrid::Timestamp> nextAttemptAt;
        std::optional<std::string> completedContent;  // non-looping content that ran to its end
        History history;
    };

    std::shared_ptr<DeviceWorker> workerFor(const std::string& deviceId);
    // nullptr when the device has left the registry
    std::shared_ptr<DeviceWorker> workerForRegistered(const std::string& deviceId);
    Runtime loadRuntime(const std::string& deviceId) const;
    void storeRuntime(const std::string& deviceId, const Runtime& runtime);

    // Run on the device's worker
    void doReconcile(const std::string& deviceId);
    control::ControlResult startPlayback(const devices::Device& device, Runtime& runtime,
                                         const std::string& contentRef, bool loop);
    void handlePlayFailure(const devices::Device& device, Runtime& runtime,
                           const control::ControlResult& result);
    void resetToIdle(const std::string& deviceId, Runtime& runtime,
                     streaming::SessionStatus sessionStatus);
    void setUserControlRecord(const std::string& deviceId, const devices::UserControl& control);
    std::optional<devices::Device> requireDevice(const std::string& deviceId,
                                                 CommandResult& error) const;

    static bool isBlackoutHold(const devices::Device& device);
    std::chrono::seconds backoffFor(int failures) const;
    void reportUnreachable(const std::string& deviceId, const std::string& reason);
    void emitEvent(const std::string& type, const nlohmann::json& data);
    void loop();

    Dependencies deps_;
    SupervisorOptions options_;

    mutable std::mutex runtimeMutex_;
    std::map<std::string, Runtime> runtimes_;

    mutable std::mutex workersMutex_;
    std::map<std::string, std::shared_ptr<DeviceWorker>> workers_;

    std::mutex loopMutex_;
    std::condition_variable loopCv_;
    std::atomic<bool> loopRunning_{false};
    std::thread loopThread_;

    std::mutex publisherMutex_;
};

}  // namespace playback
