#include "daemon/control/control_plane.h"

#include "daemon/metrics/stats_file.h"
#include "logging/logger.h"

#include <chrono>
#include <optional>
#include <thread>
#include <utility>

namespace daemon_control {
namespace {

using daemon_ipc::buildErrorResponse;
using daemon_ipc::buildOkResponse;
using CastEngine::ErrorCode;

// device_id from params, or the whole raw payload ("STOP:living-room")
std::optional<std::string> deviceIdParam(const daemon_ipc::IpcRequest& request) {
    auto params = request.params();
    if (params.contains("device_id") && params["device_id"].is_string()) {
        return params["device_id"].get<std::string>();
    }
    if (!request.isJson && !request.payload.empty() && request.payload.front() != '{') {
        return request.payload;
    }
    return std::nullopt;
}

std::string missingDevice(const daemon_ipc::IpcRequest& request) {
    return buildErrorResponse(request, ErrorCode::IPC_INVALID_PARAMS,
                              "Missing params.device_id field");
}

std::string respond(const daemon_ipc::IpcRequest& request,
                    const playback::CommandResult& result) {
    if (!result.ok()) {
        return buildErrorResponse(request, result.code, result.message);
    }
    return buildOkResponse(request, result.data, result.message);
}

std::string respond(const daemon_ipc::IpcRequest& request,
                    const blackout::BlackoutResult& result) {
    // A partial failure is still a completed batch; the per-device errors ride in data
    if (result.status == "error") {
        return buildErrorResponse(request, result.code, result.message);
    }
    return buildOkResponse(request, result.toJson(), result.message);
}

}  // namespace

ControlPlane::ControlPlane(ControlPlaneDependencies deps) : deps_(std::move(deps)) {}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    if (deps_.config) {
        zmqServer_ = std::make_unique<daemon_ipc::ZmqCommandServer>(
            deps_.config->ipc.endpoint, deps_.config->ipc.pollIntervalMs);
    } else {
        zmqServer_ = std::make_unique<daemon_ipc::ZmqCommandServer>();
    }
    registerHandlers();

    if (zmqServer_->start()) {
        startStatsThread();
        return true;
    }

    if (deps_.zmqBindFailed) {
        deps_.zmqBindFailed->store(true, std::memory_order_release);
    }
    if (deps_.stop) {
        deps_.stop->requestShutdown("control plane bind failure");
    }
    return false;
}

void ControlPlane::stop() {
    stopStatsThread();
    // Kept alive after stop: component threads may still publish until teardown
    if (zmqServer_) {
        zmqServer_->stop();
    }
}

std::function<void(const nlohmann::json&)> ControlPlane::eventPublisher() {
    return [this](const nlohmann::json& payload) { publish(payload); };
}

void ControlPlane::publish(const nlohmann::json& payload) {
    if (!zmqServer_) {
        return;
    }
    zmqServer_->publishEvent(payload);
}

void ControlPlane::registerHandlers() {
    using Method = std::string (ControlPlane::*)(const daemon_ipc::IpcRequest&);
    static const std::pair<const char*, Method> kCommands[] = {
        {"PING", &ControlPlane::handlePing},
        {"RELOAD", &ControlPlane::handleReload},
        {"SHUTDOWN", &ControlPlane::handleShutdown},
        {"DEVICE_LIST", &ControlPlane::handleDeviceList},
        {"DEVICE_STATUS", &ControlPlane::handleDeviceStatus},
        {"DEVICE_REMOVE", &ControlPlane::handleDeviceRemove},
        {"PLAY", &ControlPlane::handlePlay},
        {"STOP", &ControlPlane::handleStop},
        {"PAUSE", &ControlPlane::handlePause},
        {"RESUME", &ControlPlane::handleResume},
        {"SEEK", &ControlPlane::handleSeek},
        {"USER_CONTROL_SET", &ControlPlane::handleUserControlSet},
        {"DISCOVERY_PAUSE", &ControlPlane::handleDiscoveryPause},
        {"DISCOVERY_RESUME", &ControlPlane::handleDiscoveryResume},
        {"DISCOVERY_STATUS", &ControlPlane::handleDiscoveryStatus},
        {"DISCOVERY_SCAN", &ControlPlane::handleDiscoveryScan},
        {"SET_BRIGHTNESS", &ControlPlane::handleSetBrightness},
        {"BLACKOUT_ACTIVATE", &ControlPlane::handleBlackoutActivate},
        {"BLACKOUT_RESTORE", &ControlPlane::handleBlackoutRestore},
        {"BLACKOUT_STATUS", &ControlPlane::handleBlackoutStatus},
        {"SESSION_LIST", &ControlPlane::handleSessionList},
        {"SESSION_PROGRESS", &ControlPlane::handleSessionProgress},
        {"PLAYBACK_STATS", &ControlPlane::handlePlaybackStats},
    };
    for (const auto& [name, method] : kCommands) {
        zmqServer_->registerCommand(
            name, [this, method](const daemon_ipc::IpcRequest& req) { return (this->*method)(req); });
    }
}

nlohmann::json ControlPlane::collectStats() const {
    nlohmann::json stats;
    if (deps_.supervisor) {
        stats["playback"] = deps_.supervisor->statsJson();
    }
    if (deps_.sessions) {
        stats["sessions"] = deps_.sessions->statsJson();
    }
    if (deps_.registry) {
        stats["devices"] = deps_.registry->size();
    }
    if (deps_.blackout) {
        stats["blackout_active"] = deps_.blackout->isActive();
    }
    if (zmqServer_) {
        stats["commands"] = zmqServer_->commandStatsJson();
    }
    return stats;
}

void ControlPlane::startStatsThread() {
    if (deps_.statsFilePath.empty()) {
        return;
    }
    if (statsThreadRunning_.exchange(true)) {
        return;
    }
    statsThread_ = std::thread([this]() {
        daemon_metrics::StatsFile statsFile(deps_.statsFilePath);
        bool lastWriteFailed = false;
        while (statsThreadRunning_.load(std::memory_order_acquire)) {
            std::string error;
            bool written = statsFile.write(collectStats(), error);
            if (!written && !lastWriteFailed) {
                LOG_WARN("Failed to write stats file: {}", error);
            }
            lastWriteFailed = !written;

            if (deps_.stop && deps_.stop->stopping()) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    });
}

void ControlPlane::stopStatsThread() {
    if (!statsThreadRunning_.exchange(false)) {
        return;
    }
    if (statsThread_.joinable()) {
        statsThread_.join();
    }
}

std::string ControlPlane::handlePing(const daemon_ipc::IpcRequest& request) {
    return buildOkResponse(request);
}

std::string ControlPlane::handleReload(const daemon_ipc::IpcRequest& request) {
    if (!deps_.stop) {
        return buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN, "Reload not available");
    }
    deps_.stop->requestReload("operator");
    return buildOkResponse(request, {}, "Reload scheduled");
}

std::string ControlPlane::handleShutdown(const daemon_ipc::IpcRequest& request) {
    if (!deps_.stop) {
        return buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN, "Shutdown not available");
    }
    deps_.stop->requestShutdown("operator");
    return buildOkResponse(request, {}, "Shutdown scheduled");
}

std::string ControlPlane::handleDeviceList(const daemon_ipc::IpcRequest& request) {
    return buildOkResponse(request, deps_.registry->toJson());
}

std::string ControlPlane::handleDeviceStatus(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    if (!deviceId) {
        return missingDevice(request);
    }
    auto device = deps_.registry->get(*deviceId);
    if (!device) {
        return buildErrorResponse(request, ErrorCode::DEVICE_NOT_FOUND,
                                  "Unknown device: " + *deviceId);
    }

    nlohmann::json data = devices::deviceToJson(*device);
    data["supervisor"] = deps_.supervisor->deviceJson(*deviceId);
    auto session = deps_.sessions->currentFor(*deviceId);
    data["session"] = session ? streaming::sessionToJson(*session) : nlohmann::json();
    return buildOkResponse(request, data);
}

std::string ControlPlane::handleDeviceRemove(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    if (!deviceId) {
        return missingDevice(request);
    }
    if (!deps_.registry->contains(*deviceId)) {
        return buildErrorResponse(request, ErrorCode::DEVICE_NOT_FOUND,
                                  "Unknown device: " + *deviceId);
    }

    // Registry first: a pass running concurrently then cannot recreate the device's worker
    deps_.registry->remove(*deviceId);
    deps_.sessions->endForDevice(*deviceId);
    deps_.supervisor->forgetDevice(*deviceId);
    LOG_INFO("Device removed by operator: {}", *deviceId);
    return buildOkResponse(request, {}, "Device removed");
}

std::string ControlPlane::handlePlay(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    if (!deviceId) {
        return missingDevice(request);
    }
    auto params = request.params();
    std::string content = params.value("video_file", std::string());
    if (content.empty()) {
        content = params.value("content", std::string());
    }
    if (content.empty()) {
        return buildErrorResponse(request, ErrorCode::IPC_INVALID_PARAMS,
                                  "Missing params.video_file field");
    }
    bool loop = params.value("loop", true);
    return respond(request, deps_.supervisor->play(*deviceId, content, loop));
}

std::string ControlPlane::handleStop(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    if (!deviceId) {
        return missingDevice(request);
    }
    return respond(request, deps_.supervisor->stop(*deviceId));
}

std::string ControlPlane::handlePause(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    if (!deviceId) {
        return missingDevice(request);
    }
    return respond(request, deps_.supervisor->pause(*deviceId));
}

std::string ControlPlane::handleResume(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    if (!deviceId) {
        return missingDevice(request);
    }
    return respond(request, deps_.supervisor->resume(*deviceId));
}

std::string ControlPlane::handleSeek(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    auto params = request.params();
    if (!deviceId) {
        return missingDevice(request);
    }
    if (!params.contains("position") || !params["position"].is_number_integer()) {
        return buildErrorResponse(request, ErrorCode::IPC_INVALID_PARAMS,
                                  "params.position must be an integer number of seconds");
    }
    return respond(request, deps_.supervisor->seek(*deviceId, params["position"].get<int>()));
}

std::string ControlPlane::handleUserControlSet(const daemon_ipc::IpcRequest& request) {
    auto deviceId = deviceIdParam(request);
    if (!deviceId) {
        return missingDevice(request);
    }
    auto params = request.params();
    auto mode = devices::parseUserControlMode(params.value("mode", std::string()));
    if (!mode) {
        return buildErrorResponse(request, ErrorCode::VALIDATION_INVALID_USER_CONTROL,
                                  "params.mode must be 'auto' or 'user'");
    }

    std::optional<int> expiresIn;
    if (params.contains("expires_in_seconds") && !params["expires_in_seconds"].is_null()) {
        if (!params["expires_in_seconds"].is_number_integer()) {
            return buildErrorResponse(request, ErrorCode::VALIDATION_INVALID_USER_CONTROL,
                                      "params.expires_in_seconds must be an integer");
        }
        expiresIn = params["expires_in_seconds"].get<int>();
    }
    std::string reason = params.value("reason", std::string());
    return respond(request, deps_.supervisor->setUserControl(*deviceId, *mode, reason, expiresIn));
}

std::string ControlPlane::handleDiscoveryPause(const daemon_ipc::IpcRequest& request) {
    deps_.discovery->pause();
    return buildOkResponse(request, deps_.discovery->statusJson(), "Discovery paused");
}

std::string ControlPlane::handleDiscoveryResume(const daemon_ipc::IpcRequest& request) {
    deps_.discovery->resume();
    return buildOkResponse(request, deps_.discovery->statusJson(), "Discovery resumed");
}

std::string ControlPlane::handleDiscoveryStatus(const daemon_ipc::IpcRequest& request) {
    return buildOkResponse(request, deps_.discovery->statusJson());
}

std::string ControlPlane::handleDiscoveryScan(const daemon_ipc::IpcRequest& request) {
    if (!deps_.discovery->scanNow()) {
        return buildErrorResponse(request, ErrorCode::DISCOVERY_SOCKET_ERROR,
                                  "Discovery is paused or not running");
    }
    return buildOkResponse(request, deps_.discovery->statusJson(), "Discovery scan scheduled");
}

std::string ControlPlane::handleSetBrightness(const daemon_ipc::IpcRequest& request) {
    auto params = request.params();
    if (!params.contains("brightness") || !params["brightness"].is_number_integer()) {
        return buildErrorResponse(request, ErrorCode::VALIDATION_INVALID_BRIGHTNESS,
                                  "params.brightness must be an integer between 0 and 100");
    }
    return respond(request, deps_.blackout->setBrightness(params["brightness"].get<int>()));
}

std::string ControlPlane::handleBlackoutActivate(const daemon_ipc::IpcRequest& request) {
    return respond(request, deps_.blackout->activate());
}

std::string ControlPlane::handleBlackoutRestore(const daemon_ipc::IpcRequest& request) {
    return respond(request, deps_.blackout->restore());
}

std::string ControlPlane::handleBlackoutStatus(const daemon_ipc::IpcRequest& request) {
    return buildOkResponse(request, deps_.blackout->statusJson());
}

std::string ControlPlane::handleSessionList(const daemon_ipc::IpcRequest& request) {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& session : deps_.sessions->list()) {
        sessions.push_back(streaming::sessionToJson(session));
    }
    return buildOkResponse(request, sessions);
}

std::string ControlPlane::handleSessionProgress(const daemon_ipc::IpcRequest& request) {
    auto params = request.params();
    std::string sessionId = params.value("session_id", std::string());
    if (sessionId.empty()) {
        return buildErrorResponse(request, ErrorCode::IPC_INVALID_PARAMS,
                                  "Missing params.session_id field");
    }

    std::optional<int> position;
    std::optional<int> duration;
    if (params.contains("position") && params["position"].is_number_integer()) {
        position = params["position"].get<int>();
    }
    if (params.contains("duration") && params["duration"].is_number_integer()) {
        duration = params["duration"].get<int>();
    }
    if (!deps_.sessions->updateProgress(sessionId, position, duration)) {
        return buildErrorResponse(request, ErrorCode::STREAM_SESSION_NOT_FOUND,
                                  "Unknown session: " + sessionId);
    }
    auto session = deps_.sessions->lookup(sessionId);
    return buildOkResponse(request, session ? streaming::sessionToJson(*session) : nlohmann::json());
}

std::string ControlPlane::handlePlaybackStats(const daemon_ipc::IpcRequest& request) {
    return buildOkResponse(request, collectStats());
}

}  // namespace daemon_control
