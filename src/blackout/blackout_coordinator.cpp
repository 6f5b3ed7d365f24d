#include "blackout/blackout_coordinator.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <filesystem>
#include <future>
#include <utility>

namespace blackout {
namespace {

struct DeviceOutcome {
    std::string deviceId;
    std::optional<BlackoutSnapshot> snapshot;
    std::optional<DeviceError> error;
};

nlohmann::json errorsToJson(const std::vector<DeviceError>& errors) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& error : errors) {
        list.push_back({{"device_id", error.deviceId},
                        {"error_code", CastEngine::errorCodeToString(error.code)},
                        {"message", error.message}});
    }
    return list;
}

}  // namespace

nlohmann::json BlackoutResult::toJson() const {
    nlohmann::json j;
    j["status"] = status;
    j["blackout_active"] = blackoutActive;
    j["brightness"] = brightness;
    j["affected_devices"] = affected;
    j["restored_devices"] = restored;
    j["errors"] = errorsToJson(errors);
    if (!message.empty()) {
        j["message"] = message;
    }
    return j;
}

BlackoutCoordinator::BlackoutCoordinator(Dependencies deps, BlackoutOptions options)
    : deps_(std::move(deps)), options_(std::move(options)) {
    if (!deps_.now) {
        deps_.now = castgrid::systemNowProvider();
    }
}

void BlackoutCoordinator::setEventPublisher(
    std::function<void(const nlohmann::json&)> eventPublisher) {
    std::lock_guard<std::mutex> lock(mutex_);
    deps_.eventPublisher = std::move(eventPublisher);
}

void BlackoutCoordinator::emitEvent(const std::string& type, const nlohmann::json& data) {
    std::function<void(const nlohmann::json&)> publisher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        publisher = deps_.eventPublisher;
    }
    if (!publisher) {
        return;
    }
    nlohmann::json payload;
    payload["type"] = type;
    payload["timestamp"] = castgrid::toUnixMillis(deps_.now());
    if (!data.is_null() && !data.empty()) {
        payload["data"] = data;
    }
    publisher(payload);
}

bool BlackoutCoordinator::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::optional<BlackoutSnapshot> BlackoutCoordinator::snapshotFor(
    const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(deviceId);
    if (it == snapshots_.end()) {
        return std::nullopt;
    }
    return it->second;
}

BlackoutResult BlackoutCoordinator::activate() {
    std::lock_guard<std::mutex> operationLock(operationMutex_);
    return activateLocked();
}

BlackoutResult BlackoutCoordinator::restore() {
    std::lock_guard<std::mutex> operationLock(operationMutex_);
    return restoreLocked();
}

BlackoutResult BlackoutCoordinator::activateLocked() {
    BlackoutResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.brightness = brightness_;
        if (active_) {
            result.status = "already_active";
            result.blackoutActive = true;
            return result;
        }
    }

    std::error_code ec;
    if (options_.clipPath.empty() || !std::filesystem::is_regular_file(options_.clipPath, ec)) {
        result.status = "error";
        result.code = CastEngine::ErrorCode::BLACKOUT_CLIP_MISSING;
        result.message = "Blackout clip not found: " + options_.clipPath;
        LOG_ERROR("[Blackout] {}", result.message);
        return result;
    }

    std::vector<std::string> targets;
    for (const auto& device : deps_.registry->list()) {
        if (device.connectionStatus != devices::ConnectionStatus::Connected) {
            continue;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!snapshots_.count(device.id)) {
            targets.push_back(device.id);
        }
    }

    LOG_INFO("[Blackout] Activating on {} device(s)", targets.size());
    std::vector<std::future<DeviceOutcome>> pending;
    pending.reserve(targets.size());
    for (const auto& id : targets) {
        pending.push_back(std::async(std::launch::async, [this, id]() {
            DeviceOutcome outcome;
            outcome.deviceId = id;
            auto held = deps_.supervisor->beginHold(id, DaemonConstants::REASON_BLACKOUT);
            if (!held) {
                outcome.error = DeviceError{id, CastEngine::ErrorCode::DEVICE_NOT_FOUND,
                                            "device disappeared"};
                return outcome;
            }
            auto played = deps_.supervisor->playHeld(id, options_.clipPath, options_.loop);
            if (!played.ok()) {
                // Hand the device back rather than leave it held with no snapshot
                deps_.supervisor->releaseHold(id, held->priorUserControl);
                outcome.error = DeviceError{id, played.code, played.message};
                return outcome;
            }

            BlackoutSnapshot snapshot;
            snapshot.deviceId = id;
            snapshot.wasPlaying = held->wasPlaying;
            snapshot.priorContentRef = held->contentRef;
            snapshot.priorLoop = held->loop;
            snapshot.priorPositionSeconds = held->positionSeconds;
            snapshot.priorUserControl = held->priorUserControl;
            snapshot.capturedAt = deps_.now();
            outcome.snapshot = std::move(snapshot);
            return outcome;
        }));
    }

    for (auto& future : pending) {
        auto outcome = future.get();
        if (outcome.error) {
            LOG_WARN("[Blackout] {} not blacked out: {}", outcome.deviceId, outcome.error->message);
            result.errors.push_back(std::move(*outcome.error));
            continue;
        }
        result.affected.push_back(outcome.deviceId);
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_[outcome.deviceId] = std::move(*outcome.snapshot);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = true;
        brightness_ = 0;
    }
    result.status = "blackout_activated";
    result.blackoutActive = true;
    result.brightness = 0;
    if (!result.errors.empty()) {
        result.code = CastEngine::ErrorCode::BLACKOUT_PARTIAL_FAILURE;
    }
    LOG_INFO("[Blackout] Active: {} affected, {} failed", result.affected.size(),
             result.errors.size());
    emitEvent("blackout_activated", result.toJson());
    return result;
}

BlackoutResult BlackoutCoordinator::restoreLocked() {
    BlackoutResult result;
    std::map<std::string, BlackoutSnapshot> snapshots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.brightness = brightness_;
        if (!active_) {
            result.status = "not_active";
            return result;
        }
        snapshots = snapshots_;
    }

    LOG_INFO("[Blackout] Restoring {} device(s)", snapshots.size());
    std::vector<std::future<DeviceOutcome>> pending;
    pending.reserve(snapshots.size());
    for (const auto& entry : snapshots) {
        pending.push_back(std::async(std::launch::async, [this, snapshot = entry.second]() {
            DeviceOutcome outcome;
            outcome.deviceId = snapshot.deviceId;
            playback::CommandResult attempt;
            if (snapshot.wasPlaying && snapshot.priorContentRef) {
                attempt = deps_.supervisor->playHeld(snapshot.deviceId, *snapshot.priorContentRef,
                                                     snapshot.priorLoop);
            } else {
                attempt = deps_.supervisor->stopHeld(snapshot.deviceId);
            }
            deps_.supervisor->releaseHold(snapshot.deviceId, snapshot.priorUserControl);
            if (!attempt.ok()) {
                outcome.error = DeviceError{snapshot.deviceId, attempt.code, attempt.message};
            }
            return outcome;
        }));
    }

    for (auto& future : pending) {
        auto outcome = future.get();
        {
            // Consumed whatever happened, so a failed restore is never replayed
            std::lock_guard<std::mutex> lock(mutex_);
            snapshots_.erase(outcome.deviceId);
        }
        if (outcome.error) {
            LOG_WARN("[Blackout] {} restore failed: {}", outcome.deviceId, outcome.error->message);
            result.errors.push_back(std::move(*outcome.error));
        } else {
            result.restored.push_back(outcome.deviceId);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        brightness_ = 100;
    }
    result.status = "blackout_deactivated";
    result.blackoutActive = false;
    result.brightness = 100;
    if (!result.errors.empty()) {
        result.code = CastEngine::ErrorCode::BLACKOUT_PARTIAL_FAILURE;
    }
    emitEvent("blackout_restored", result.toJson());
    return result;
}

BlackoutResult BlackoutCoordinator::setBrightness(int level) {
    if (level < 0 || level > 100) {
        BlackoutResult result;
        result.status = "error";
        result.code = CastEngine::ErrorCode::VALIDATION_INVALID_BRIGHTNESS;
        result.message = "brightness must be within 0..100, got " + std::to_string(level);
        std::lock_guard<std::mutex> lock(mutex_);
        result.blackoutActive = active_;
        result.brightness = brightness_;
        return result;
    }

    std::lock_guard<std::mutex> operationLock(operationMutex_);
    if (level == 0) {
        return activateLocked();
    }
    if (isActive()) {
        auto result = restoreLocked();
        std::lock_guard<std::mutex> lock(mutex_);
        brightness_ = level;
        result.brightness = level;
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    brightness_ = level;
    BlackoutResult result;
    result.status = "updated";
    result.brightness = level;
    return result;
}

nlohmann::json BlackoutCoordinator::statusJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json status;
    status["blackout_active"] = active_;
    status["brightness"] = brightness_;
    status["clip_path"] = options_.clipPath;
    nlohmann::json backedUp = nlohmann::json::array();
    for (const auto& [id, snapshot] : snapshots_) {
        backedUp.push_back({{"device_id", id},
                            {"was_playing", snapshot.wasPlaying},
                            {"prior_content_ref", snapshot.priorContentRef
                                                      ? nlohmann::json(*snapshot.priorContentRef)
                                                      : nlohmann::json()},
                            {"prior_position", snapshot.priorPositionSeconds
                                                   ? nlohmann::json(*snapshot.priorPositionSeconds)
                                                   : nlohmann::json()}});
    }
    status["backed_up_devices"] = backedUp;
    return status;
}

void BlackoutCoordinator::clear() {
    std::lock_guard<std::mutex> operationLock(operationMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.clear();
    active_ = false;
    brightness_ = 100;
}

}  // namespace blackout
