#pragma once

#include "core/clock.h"
#include "core/error_codes.h"
#include "devices/device_registry.h"
#include "playback/playback_supervisor.h"

#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace blackout {

struct BlackoutOptions {
    std::string clipPath;  // pre-provisioned black video
    bool loop = true;
};

// Exists only while its device is blacked out; consumed by restore exactly once.
struct BlackoutSnapshot {
    std::string deviceId;
    bool wasPlaying = false;
    std::optional<std::string> priorContentRef;
    bool priorLoop = true;
    std::optional<int> priorPositionSeconds;
    devices::UserControl priorUserControl;
    castgrid::Timestamp capturedAt{};
};

struct DeviceError {
    std::string deviceId;
    CastEngine::ErrorCode code = CastEngine::ErrorCode::OK;
    std::string message;
};

struct BlackoutResult {
    // blackout_activated, already_active, blackout_deactivated, not_active, updated, error
    std::string status;
    CastEngine::ErrorCode code = CastEngine::ErrorCode::OK;
    std::string message;
    std::vector<std::string> affected;
    std::vector<std::string> restored;
    std::vector<DeviceError> errors;
    bool blackoutActive = false;
    int brightness = 100;

    nlohmann::json toJson() const;
};

/**
 * @brief Puts every connected device on a black clip and brings it back.
 *
 * Per-device work fans out concurrently through PlaybackSupervisor; a device
 * failing never fails the batch. activate() and restore() are serialized.
 */
class BlackoutCoordinator {
   public:
    struct Dependencies {
        devices::DeviceRegistry* registry = nullptr;
        playback::PlaybackSupervisor* supervisor = nullptr;
        castgrid::NowProvider now;
        std::function<void(const nlohmann::json&)> eventPublisher;
    };

    BlackoutCoordinator(Dependencies deps, BlackoutOptions options);

    BlackoutCoordinator(const BlackoutCoordinator&) = delete;
    BlackoutCoordinator& operator=(const BlackoutCoordinator&) = delete;

    BlackoutResult activate();
    BlackoutResult restore();

    // 0 blacks out, >0 after a blackout restores. Range 0..100.
    BlackoutResult setBrightness(int level);

    bool isActive() const;
    std::optional<BlackoutSnapshot> snapshotFor(const std::string& deviceId) const;
    nlohmann::json statusJson() const;

    void setEventPublisher(std::function<void(const nlohmann::json&)> eventPublisher);

    // Teardown hook for tests and reloads; does not touch devices
    void clear();

   private:
    BlackoutResult activateLocked();
    BlackoutResult restoreLocked();
    void emitEvent(const std::string& type, const nlohmann::json& data);

    Dependencies deps_;
    BlackoutOptions options_;

    std::mutex operationMutex_;
    mutable std::mutex mutex_;
    bool active_ = false;
    int brightness_ = 100;
    std::map<std::string, BlackoutSnapshot> snapshots_;
};

}  // namespace blackout
