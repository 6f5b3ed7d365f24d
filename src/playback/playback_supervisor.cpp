#include "playback/playback_supervisor.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"
#include "streaming/http_range.h"

#include <algorithm>
#include <filesystem>
#include <utility>
#include <vector>

namespace playback {
namespace {

nlohmann::json optionalTime(const std::optional<castgrid::Timestamp>& ts) {
    return ts ? nlohmann::json(castgrid::toUnixMillis(*ts)) : nlohmann::json();
}

CommandResult fromControl(const control::ControlResult& result) {
    CommandResult command;
    command.code = result.code;
    command.message = result.message;
    return command;
}

bool isPlayingState(control::TransportState state) {
    return state == control::TransportState::Playing ||
           state == control::TransportState::Transitioning;
}

bool isStoppedState(control::TransportState state) {
    return state == control::TransportState::Stopped ||
           state == control::TransportState::NoMediaPresent;
}

// Renderers echo TrackURI back decoded or with a rewritten host; only the session id is stable
bool reportsSession(const std::string& trackUri, const std::string& sessionId) {
    std::string target = trackUri;
    size_t scheme = target.find("://");
    if (scheme != std::string::npos) {
        size_t pathStart = target.find('/', scheme + 3);
        target = pathStart == std::string::npos ? "/" : target.substr(pathStart);
    }
    auto reported = streaming::sessionIdFromTarget(target);
    return reported && *reported == sessionId;
}

}  // namespace

const char* supervisorStateToString(SupervisorState state) {
    switch (state) {
    case SupervisorState::Idle:
        return "idle";
    case SupervisorState::Requesting:
        return "requesting";
    case SupervisorState::Playing:
        return "playing";
    case SupervisorState::UserPaused:
        return "user_paused";
    case SupervisorState::Error:
        return "error";
    }
    return "unknown";
}

PlaybackSupervisor::PlaybackSupervisor(Dependencies deps, SupervisorOptions options)
    : deps_(std::move(deps)), options_(options) {
    if (!deps_.now) {
        deps_.now = castgrid::systemNowProvider();
    }
}

PlaybackSupervisor::~PlaybackSupervisor() {
    stop();
}

void PlaybackSupervisor::start() {
    if (loopRunning_.exchange(true)) {
        return;
    }
    loopThread_ = std::thread(&PlaybackSupervisor::loop, this);
    LOG_INFO("[Supervisor] Started (pass every {}s, override window {}s)",
             options_.passInterval.count(), options_.overrideWindow.count());
}

void PlaybackSupervisor::stopScheduling() {
    loopRunning_.store(false, std::memory_order_release);
    loopCv_.notify_all();
}

bool PlaybackSupervisor::hasPendingWork() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (const auto& [id, worker] : workers_) {
        if (worker->isBusy()) {
            return true;
        }
    }
    return false;
}

void PlaybackSupervisor::stop() {
    bool wasRunning = loopRunning_.exchange(false) || loopThread_.joinable();
    loopCv_.notify_all();
    if (loopThread_.joinable()) {
        loopThread_.join();
    }

    // Let queued per-device work finish rather than cutting it off
    std::map<std::string, std::shared_ptr<DeviceWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        workers.swap(workers_);
    }
    for (auto& [id, worker] : workers) {
        worker->stop();
    }
    if (wasRunning) {
        LOG_INFO("[Supervisor] Stopped");
    }
}

void PlaybackSupervisor::loop() {
    while (loopRunning_.load(std::memory_order_acquire)) {
        runPass();
        std::unique_lock<std::mutex> lock(loopMutex_);
        loopCv_.wait_for(lock, options_.passInterval,
                         [&]() { return !loopRunning_.load(std::memory_order_acquire); });
    }
}

std::shared_ptr<DeviceWorker> PlaybackSupervisor::workerFor(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(workersMutex_);
    auto& worker = workers_[deviceId];
    if (!worker) {
        worker = std::make_shared<DeviceWorker>(deviceId);
    }
    return worker;
}

std::shared_ptr<DeviceWorker> PlaybackSupervisor::workerForRegistered(const std::string& deviceId) {
    // Checked under workersMutex_ so a concurrent forgetDevice cannot be undone
    std::lock_guard<std::mutex> lock(workersMutex_);
    auto it = workers_.find(deviceId);
    if (it != workers_.end()) {
        return it->second;
    }
    if (!deps_.registry->contains(deviceId)) {
        return nullptr;
    }
    auto worker = std::make_shared<DeviceWorker>(deviceId);
    workers_.emplace(deviceId, worker);
    return worker;
}

PlaybackSupervisor::Runtime PlaybackSupervisor::loadRuntime(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(runtimeMutex_);
    auto it = runtimes_.find(deviceId);
    return it == runtimes_.end() ? Runtime{} : it->second;
}

void PlaybackSupervisor::storeRuntime(const std::string& deviceId, const Runtime& runtime) {
    std::lock_guard<std::mutex> lock(runtimeMutex_);
    runtimes_[deviceId] = runtime;
}

void PlaybackSupervisor::setEventPublisher(
    std::function<void(const nlohmann::json&)> eventPublisher) {
    std::lock_guard<std::mutex> lock(publisherMutex_);
    deps_.eventPublisher = std::move(eventPublisher);
}

void PlaybackSupervisor::emitEvent(const std::string& type, const nlohmann::json& data) {
    std::function<void(const nlohmann::json&)> publisher;
    {
        std::lock_guard<std::mutex> lock(publisherMutex_);
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

void PlaybackSupervisor::reportUnreachable(const std::string& deviceId,
                                           const std::string& reason) {
    if (deps_.unreachableReporter) {
        deps_.unreachableReporter(deviceId, reason);
    }
}

std::chrono::seconds PlaybackSupervisor::backoffFor(int failures) const {
    auto delay = options_.retryBackoffBase;
    for (int i = 1; i < failures && delay < options_.retryBackoffMax; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.retryBackoffMax);
}

bool PlaybackSupervisor::isBlackoutHold(const devices::Device& device) {
    return device.userControl.mode == devices::UserControlMode::User &&
           device.userControl.reason == std::string(DaemonConstants::REASON_BLACKOUT);
}

void PlaybackSupervisor::setUserControlRecord(const std::string& deviceId,
                                              const devices::UserControl& control) {
    deps_.registry->modify(deviceId,
                           [&](devices::Device& device) { device.userControl = control; });
}

void PlaybackSupervisor::resetToIdle(const std::string& deviceId, Runtime& runtime,
                                     streaming::SessionStatus sessionStatus) {
    deps_.sessions->endForDevice(deviceId, sessionStatus);
    deps_.registry->modify(deviceId, [](devices::Device& device) {
        device.playbackState = devices::PlaybackState::Idle;
        device.currentSessionId.reset();
    });
    runtime.state = SupervisorState::Idle;
}

std::optional<devices::Device> PlaybackSupervisor::requireDevice(const std::string& deviceId,
                                                                 CommandResult& error) const {
    auto device = deps_.registry->get(deviceId);
    if (!device) {
        error = CommandResult::failure(CastEngine::ErrorCode::DEVICE_NOT_FOUND,
                                       "Unknown device: " + deviceId);
        return std::nullopt;
    }
    return device;
}

control::ControlResult PlaybackSupervisor::startPlayback(const devices::Device& device,
                                                         Runtime& runtime,
                                                         const std::string& contentRef,
                                                         bool loop) {
    const auto now = deps_.now();
    runtime.state = SupervisorState::Requesting;
    runtime.history.attempts++;
    runtime.history.lastAttemptAt = now;

    // The previous session stops being servable before the device hears the new URL
    auto session = deps_.sessions->allocate(device.id, contentRef);
    deps_.registry->modify(device.id, [&](devices::Device& d) {
        d.currentSessionId = session.sessionId;
        d.playbackState = devices::PlaybackState::Buffering;
    });

    auto result = deps_.control->play(device, session.servedUrl, loop);
    if (result.ok()) {
        runtime.state = SupervisorState::Playing;
        runtime.playFailures = 0;
        runtime.pollFailures = 0;
        runtime.nextAttemptAt.reset();
        runtime.completedContent.reset();
        runtime.history.successes++;
        runtime.history.lastSuccessAt = now;
        deps_.registry->modify(device.id, [](devices::Device& d) {
            d.playbackState = devices::PlaybackState::Playing;
        });
        emitEvent("playback_started", {{"device_id", device.id},
                                       {"session_id", session.sessionId},
                                       {"content_ref", contentRef},
                                       {"url", session.servedUrl},
                                       {"loop", loop}});
        return result;
    }

    deps_.sessions->end(session.sessionId, streaming::SessionStatus::Error);
    deps_.registry->modify(device.id, [](devices::Device& d) {
        d.playbackState = devices::PlaybackState::Idle;
        d.currentSessionId.reset();
    });
    runtime.state = SupervisorState::Idle;
    runtime.history.failures++;
    runtime.history.lastError = result.message;
    return result;
}

void PlaybackSupervisor::handlePlayFailure(const devices::Device& device, Runtime& runtime,
                                           const control::ControlResult& result) {
    const auto now = deps_.now();
    runtime.playFailures++;
    if (runtime.playFailures >= options_.maxPlayRetries) {
        runtime.state = SupervisorState::Error;
        runtime.playFailures = 0;
        runtime.nextAttemptAt = now + options_.errorRetry;
        LOG_ERROR("[Supervisor] {} failed to play after {} attempts, retrying in {}s: {}",
                  device.id, options_.maxPlayRetries, options_.errorRetry.count(),
                  result.message);
        if (result.unreachable()) {
            reportUnreachable(device.id, result.message);
        }
    } else {
        auto delay = backoffFor(runtime.playFailures);
        runtime.nextAttemptAt = now + delay;
        LOG_WARN("[Supervisor] {} play attempt {} failed, next in {}s: {}", device.id,
                 runtime.playFailures, delay.count(), result.message);
    }
    emitEvent("playback_failed", {{"device_id", device.id},
                                  {"error_code", CastEngine::errorCodeToString(result.code)},
                                  {"message", result.message},
                                  {"state", supervisorStateToString(runtime.state)}});
}

void PlaybackSupervisor::doReconcile(const std::string& deviceId) {
    auto device = deps_.registry->get(deviceId);
    if (!device) {
        return;
    }
    const auto now = deps_.now();
    Runtime runtime = loadRuntime(deviceId);

    if (device->userControl.mode == devices::UserControlMode::User) {
        if (device->userControl.isHolding(now)) {
            return;
        }
        LOG_INFO("[Supervisor] Override on {} expired ({})", deviceId,
                 device->userControl.reason.value_or(""));
        setUserControlRecord(deviceId, devices::UserControl{});
        device->userControl = devices::UserControl{};
        if (runtime.state == SupervisorState::UserPaused) {
            runtime.state = SupervisorState::Idle;
        }
        emitEvent("override_expired", {{"device_id", deviceId}});
    }

    if (device->connectionStatus != devices::ConnectionStatus::Connected) {
        if (deps_.sessions->currentFor(deviceId)) {
            LOG_INFO("[Supervisor] {} left connected state, ending its session", deviceId);
            resetToIdle(deviceId, runtime, streaming::SessionStatus::Completed);
            emitEvent("playback_stopped", {{"device_id", deviceId}, {"reason", "disconnected"}});
        } else if (runtime.state == SupervisorState::Playing ||
                   runtime.state == SupervisorState::Requesting) {
            runtime.state = SupervisorState::Idle;
        }
        storeRuntime(deviceId, runtime);
        return;
    }

    if (!runtime.desired) {
        storeRuntime(deviceId, runtime);
        return;
    }
    if (runtime.nextAttemptAt && now < *runtime.nextAttemptAt) {
        storeRuntime(deviceId, runtime);
        return;
    }
    const DesiredContent desired = *runtime.desired;

    control::TransportStatus status;
    auto poll = deps_.control->getTransportState(*device, status);
    if (!poll.ok() && poll.code != CastEngine::ErrorCode::DEVICE_UNSUPPORTED_ACTION) {
        runtime.pollFailures++;
        LOG_DEBUG("[Supervisor] Poll {} failed ({}/{}): {}", deviceId, runtime.pollFailures,
                  options_.pollFailureThreshold, poll.message);
        if (runtime.pollFailures >= options_.pollFailureThreshold) {
            LOG_WARN("[Supervisor] {} stopped answering transport polls", deviceId);
            runtime.pollFailures = 0;
            runtime.history.lastError = poll.message;
            resetToIdle(deviceId, runtime, streaming::SessionStatus::Error);
            runtime.state = SupervisorState::Error;
            runtime.nextAttemptAt = now + options_.errorRetry;
            reportUnreachable(deviceId, poll.message);
        }
        storeRuntime(deviceId, runtime);
        return;
    }
    runtime.pollFailures = 0;

    auto session = deps_.sessions->currentFor(deviceId);
    if (session && (status.positionSeconds || status.durationSeconds)) {
        deps_.sessions->updateProgress(session->sessionId, status.positionSeconds,
                                       status.durationSeconds);
    }

    const bool sameContent = session && session->contentRef == desired.contentRef;
    bool matches = false;
    if (sameContent) {
        if (isPlayingState(status.state)) {
            matches = status.currentUri.empty() ||
                      reportsSession(status.currentUri, session->sessionId);
        } else if (status.state == control::TransportState::Unknown) {
            matches = runtime.state == SupervisorState::Playing;
        }
    }
    if (matches) {
        if (runtime.state != SupervisorState::Playing) {
            runtime.state = SupervisorState::Playing;
            deps_.registry->modify(deviceId, [](devices::Device& d) {
                d.playbackState = devices::PlaybackState::Playing;
            });
        }
        storeRuntime(deviceId, runtime);
        return;
    }

    if (!desired.loop) {
        if (sameContent && runtime.state == SupervisorState::Playing &&
            isStoppedState(status.state)) {
            LOG_INFO("[Supervisor] {} finished {}", deviceId, desired.contentRef);
            resetToIdle(deviceId, runtime, streaming::SessionStatus::Completed);
            runtime.completedContent = desired.contentRef;
            emitEvent("playback_stopped", {{"device_id", deviceId}, {"reason", "completed"}});
            storeRuntime(deviceId, runtime);
            return;
        }
        if (runtime.completedContent == desired.contentRef) {
            storeRuntime(deviceId, runtime);
            return;
        }
    }

    LOG_INFO("[Supervisor] {} is {} (expected {}), starting playback", deviceId,
             dlna_soap::transportStateToString(status.state), desired.contentRef);
    auto result = startPlayback(*device, runtime, desired.contentRef, desired.loop);
    if (!result.ok()) {
        handlePlayFailure(*device, runtime, result);
    }
    storeRuntime(deviceId, runtime);
}

void PlaybackSupervisor::runPass() {
    for (const auto& id : deps_.registry->ids()) {
        auto worker = workerForRegistered(id);
        if (!worker) {
            continue;
        }
        if (worker->isBusy()) {
            LOG_DEBUG("[Supervisor] {} still busy, skipping this pass", id);
            continue;
        }
        worker->post([this, id]() { doReconcile(id); });
    }
}

void PlaybackSupervisor::reconcileDevice(const std::string& deviceId) {
    workerFor(deviceId)->submit([this, deviceId]() { doReconcile(deviceId); }).get();
}

void PlaybackSupervisor::setDesiredContent(const std::string& deviceId, DesiredContent desired) {
    workerFor(deviceId)
        ->submit([&]() {
            Runtime runtime = loadRuntime(deviceId);
            runtime.desired = std::move(desired);
            runtime.completedContent.reset();
            runtime.playFailures = 0;
            runtime.nextAttemptAt.reset();
            storeRuntime(deviceId, runtime);
        })
        .get();
}

void PlaybackSupervisor::clearDesiredContent(const std::string& deviceId) {
    workerFor(deviceId)
        ->submit([&]() {
            Runtime runtime = loadRuntime(deviceId);
            runtime.desired.reset();
            storeRuntime(deviceId, runtime);
        })
        .get();
}

std::optional<DesiredContent> PlaybackSupervisor::desiredContent(
    const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(runtimeMutex_);
    auto it = runtimes_.find(deviceId);
    return it == runtimes_.end() ? std::nullopt : it->second.desired;
}

CommandResult PlaybackSupervisor::play(const std::string& deviceId, const std::string& contentRef,
                                       bool loop) {
    std::error_code ec;
    if (contentRef.empty() || !std::filesystem::is_regular_file(contentRef, ec)) {
        return CommandResult::failure(CastEngine::ErrorCode::VALIDATION_FILE_NOT_FOUND,
                                      "Content not found: " + contentRef);
    }

    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            if (isBlackoutHold(*device)) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_HELD,
                                              deviceId + " is held by blackout");
            }
            if (device->connectionStatus != devices::ConnectionStatus::Connected) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_NOT_CONNECTED,
                                              deviceId + " is not connected");
            }

            const auto now = deps_.now();
            Runtime runtime = loadRuntime(deviceId);
            runtime.desired = DesiredContent{contentRef, loop};
            runtime.completedContent.reset();
            runtime.playFailures = 0;
            runtime.nextAttemptAt.reset();

            devices::UserControl hold;
            hold.mode = devices::UserControlMode::User;
            hold.expiresAt = now + options_.overrideWindow;
            hold.reason = DaemonConstants::REASON_USER_PLAY;
            setUserControlRecord(deviceId, hold);

            auto result = startPlayback(*device, runtime, contentRef, loop);
            if (!result.ok()) {
                handlePlayFailure(*device, runtime, result);
            }
            storeRuntime(deviceId, runtime);

            CommandResult command = fromControl(result);
            if (auto session = deps_.sessions->currentFor(deviceId)) {
                command.data["session"] = streaming::sessionToJson(*session);
            }
            command.data["user_control"] = devices::userControlToJson(hold);
            return command;
        })
        .get();
}

CommandResult PlaybackSupervisor::stop(const std::string& deviceId) {
    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            if (isBlackoutHold(*device)) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_HELD,
                                              deviceId + " is held by blackout");
            }

            const auto now = deps_.now();
            devices::UserControl hold;
            hold.mode = devices::UserControlMode::User;
            hold.expiresAt = now + options_.overrideWindow;
            hold.reason = DaemonConstants::REASON_MANUAL_STOP;
            // The hold goes in before the stop call so no pass can slip a replay in between
            setUserControlRecord(deviceId, hold);

            control::ControlResult result;
            if (device->connectionStatus == devices::ConnectionStatus::Connected) {
                result = deps_.control->stop(*device);
            }

            Runtime runtime = loadRuntime(deviceId);
            resetToIdle(deviceId, runtime, streaming::SessionStatus::Completed);
            runtime.state = SupervisorState::UserPaused;
            storeRuntime(deviceId, runtime);

            LOG_INFO("[Supervisor] {} stopped by operator, autonomous play held for {}s",
                     deviceId, options_.overrideWindow.count());
            emitEvent("playback_stopped", {{"device_id", deviceId},
                                           {"reason", DaemonConstants::REASON_MANUAL_STOP},
                                           {"expires_at", castgrid::toUnixMillis(*hold.expiresAt)}});

            CommandResult command = fromControl(result);
            command.data["user_control"] = devices::userControlToJson(hold);
            return command;
        })
        .get();
}

CommandResult PlaybackSupervisor::pause(const std::string& deviceId) {
    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            if (isBlackoutHold(*device)) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_HELD,
                                              deviceId + " is held by blackout");
            }
            if (device->connectionStatus != devices::ConnectionStatus::Connected) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_NOT_CONNECTED,
                                              deviceId + " is not connected");
            }

            auto result = deps_.control->pause(*device);
            if (!result.ok()) {
                return fromControl(result);
            }

            devices::UserControl hold;
            hold.mode = devices::UserControlMode::User;
            hold.expiresAt = deps_.now() + options_.overrideWindow;
            hold.reason = DaemonConstants::REASON_USER_PAUSE;
            setUserControlRecord(deviceId, hold);

            if (auto session = deps_.sessions->currentFor(deviceId)) {
                deps_.sessions->setPaused(session->sessionId, true);
            }
            deps_.registry->modify(deviceId, [](devices::Device& d) {
                d.playbackState = devices::PlaybackState::Paused;
            });
            Runtime runtime = loadRuntime(deviceId);
            runtime.state = SupervisorState::UserPaused;
            storeRuntime(deviceId, runtime);

            CommandResult command;
            command.data["user_control"] = devices::userControlToJson(hold);
            return command;
        })
        .get();
}

CommandResult PlaybackSupervisor::resume(const std::string& deviceId) {
    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            if (isBlackoutHold(*device)) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_HELD,
                                              deviceId + " is held by blackout");
            }
            if (device->connectionStatus != devices::ConnectionStatus::Connected) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_NOT_CONNECTED,
                                              deviceId + " is not connected");
            }

            Runtime runtime = loadRuntime(deviceId);
            auto session = deps_.sessions->currentFor(deviceId);
            control::ControlResult result;
            if (session) {
                bool loop = runtime.desired ? runtime.desired->loop : true;
                result = deps_.control->resume(*device, session->servedUrl, loop);
                if (result.ok()) {
                    deps_.sessions->setPaused(session->sessionId, false);
                    deps_.registry->modify(deviceId, [](devices::Device& d) {
                        d.playbackState = devices::PlaybackState::Playing;
                    });
                    runtime.state = SupervisorState::Playing;
                }
            } else if (runtime.desired) {
                runtime.completedContent.reset();
                result = startPlayback(*device, runtime, runtime.desired->contentRef,
                                       runtime.desired->loop);
                if (!result.ok()) {
                    handlePlayFailure(*device, runtime, result);
                }
            } else {
                return CommandResult::failure(CastEngine::ErrorCode::STREAM_SESSION_NOT_FOUND,
                                              deviceId + " has nothing to resume");
            }

            if (result.ok()) {
                setUserControlRecord(deviceId, devices::UserControl{});
            }
            storeRuntime(deviceId, runtime);
            return fromControl(result);
        })
        .get();
}

CommandResult PlaybackSupervisor::seek(const std::string& deviceId, int positionSeconds) {
    if (positionSeconds < 0) {
        return CommandResult::failure(CastEngine::ErrorCode::VALIDATION_INVALID_CONFIG,
                                      "position must be >= 0");
    }
    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            if (device->connectionStatus != devices::ConnectionStatus::Connected) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_NOT_CONNECTED,
                                              deviceId + " is not connected");
            }
            auto session = deps_.sessions->currentFor(deviceId);
            if (!session) {
                return CommandResult::failure(CastEngine::ErrorCode::STREAM_SESSION_NOT_FOUND,
                                              deviceId + " has no active session");
            }
            auto result = deps_.control->seek(*device, positionSeconds);
            if (result.ok()) {
                deps_.sessions->updateProgress(session->sessionId, positionSeconds, std::nullopt);
            }
            return fromControl(result);
        })
        .get();
}

CommandResult PlaybackSupervisor::setUserControl(const std::string& deviceId,
                                                 devices::UserControlMode mode,
                                                 const std::string& reason,
                                                 std::optional<int> expiresInSeconds) {
    if (expiresInSeconds && *expiresInSeconds <= 0) {
        return CommandResult::failure(CastEngine::ErrorCode::VALIDATION_INVALID_USER_CONTROL,
                                      "expires_in_seconds must be positive");
    }
    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            if (isBlackoutHold(*device)) {
                return CommandResult::failure(CastEngine::ErrorCode::DEVICE_HELD,
                                              deviceId + " is held by blackout");
            }

            devices::UserControl control;
            if (mode == devices::UserControlMode::User) {
                control.mode = devices::UserControlMode::User;
                control.reason = reason.empty() ? std::string("manual") : reason;
                if (expiresInSeconds) {
                    control.expiresAt = deps_.now() + std::chrono::seconds(*expiresInSeconds);
                }
            } else {
                Runtime runtime = loadRuntime(deviceId);
                if (runtime.state == SupervisorState::UserPaused) {
                    runtime.state = SupervisorState::Idle;
                    storeRuntime(deviceId, runtime);
                }
            }
            setUserControlRecord(deviceId, control);
            LOG_INFO("[Supervisor] {} user control set to {}", deviceId,
                     devices::userControlModeToString(control.mode));

            CommandResult command;
            command.data["user_control"] = devices::userControlToJson(control);
            return command;
        })
        .get();
}

std::optional<HeldState> PlaybackSupervisor::beginHold(const std::string& deviceId,
                                                       const std::string& reason) {
    return workerFor(deviceId)
        ->submit([&]() -> std::optional<HeldState> {
            auto device = deps_.registry->get(deviceId);
            if (!device) {
                return std::nullopt;
            }
            Runtime runtime = loadRuntime(deviceId);
            auto session = deps_.sessions->currentFor(deviceId);

            HeldState held;
            held.wasPlaying = runtime.state == SupervisorState::Playing ||
                              device->playbackState == devices::PlaybackState::Playing;
            if (session) {
                held.contentRef = session->contentRef;
                held.positionSeconds = session->positionSeconds;
            } else if (runtime.desired) {
                held.contentRef = runtime.desired->contentRef;
            }
            if (runtime.desired) {
                held.loop = runtime.desired->loop;
            }
            held.priorUserControl = device->userControl;

            devices::UserControl hold;
            hold.mode = devices::UserControlMode::User;
            hold.reason = reason;
            setUserControlRecord(deviceId, hold);
            return held;
        })
        .get();
}

CommandResult PlaybackSupervisor::playHeld(const std::string& deviceId,
                                           const std::string& contentRef, bool loop) {
    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            Runtime runtime = loadRuntime(deviceId);
            auto result = startPlayback(*device, runtime, contentRef, loop);
            storeRuntime(deviceId, runtime);
            return fromControl(result);
        })
        .get();
}

CommandResult PlaybackSupervisor::stopHeld(const std::string& deviceId) {
    return workerFor(deviceId)
        ->submit([&]() {
            CommandResult error;
            auto device = requireDevice(deviceId, error);
            if (!device) {
                return error;
            }
            auto result = deps_.control->stop(*device);
            Runtime runtime = loadRuntime(deviceId);
            resetToIdle(deviceId, runtime, streaming::SessionStatus::Completed);
            storeRuntime(deviceId, runtime);
            return fromControl(result);
        })
        .get();
}

void PlaybackSupervisor::releaseHold(const std::string& deviceId,
                                     const devices::UserControl& prior) {
    workerFor(deviceId)->submit([&]() { setUserControlRecord(deviceId, prior); }).get();
}

void PlaybackSupervisor::forgetDevice(const std::string& deviceId) {
    std::shared_ptr<DeviceWorker> worker;
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        auto it = workers_.find(deviceId);
        if (it != workers_.end()) {
            worker = std::move(it->second);
            workers_.erase(it);
        }
    }
    if (worker) {
        worker->stop();
    }
    std::lock_guard<std::mutex> lock(runtimeMutex_);
    runtimes_.erase(deviceId);
}

bool PlaybackSupervisor::tracks(const std::string& deviceId) const {
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        if (workers_.count(deviceId) > 0) {
            return true;
        }
    }
    std::lock_guard<std::mutex> lock(runtimeMutex_);
    return runtimes_.count(deviceId) > 0;
}

SupervisorState PlaybackSupervisor::stateOf(const std::string& deviceId) const {
    return loadRuntime(deviceId).state;
}

nlohmann::json PlaybackSupervisor::deviceJson(const std::string& deviceId) const {
    Runtime runtime = loadRuntime(deviceId);
    nlohmann::json j;
    j["state"] = supervisorStateToString(runtime.state);
    if (runtime.desired) {
        j["desired_content"] = runtime.desired->contentRef;
        j["loop"] = runtime.desired->loop;
    } else {
        j["desired_content"] = nullptr;
    }
    j["play_failures"] = runtime.playFailures;
    j["poll_failures"] = runtime.pollFailures;
    j["next_attempt_at"] = optionalTime(runtime.nextAttemptAt);
    j["attempts"] = runtime.history.attempts;
    j["successes"] = runtime.history.successes;
    j["failures"] = runtime.history.failures;
    j["last_attempt_at"] = optionalTime(runtime.history.lastAttemptAt);
    j["last_success_at"] = optionalTime(runtime.history.lastSuccessAt);
    j["last_error"] = runtime.history.lastError;
    return j;
}

nlohmann::json PlaybackSupervisor::statsJson() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(runtimeMutex_);
        for (const auto& [id, runtime] : runtimes_) {
            ids.push_back(id);
        }
    }

    nlohmann::json devicesJson = nlohmann::json::object();
    uint64_t attempts = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    for (const auto& id : ids) {
        auto entry = deviceJson(id);
        attempts += entry["attempts"].get<uint64_t>();
        successes += entry["successes"].get<uint64_t>();
        failures += entry["failures"].get<uint64_t>();
        devicesJson[id] = std::move(entry);
    }

    nlohmann::json stats;
    stats["devices"] = devicesJson;
    stats["total_attempts"] = attempts;
    stats["total_successes"] = successes;
    stats["total_failures"] = failures;
    stats["override_window_seconds"] = options_.overrideWindow.count();
    return stats;
}

}  // namespace playback
