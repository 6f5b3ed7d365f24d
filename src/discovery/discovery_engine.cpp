#include "discovery/discovery_engine.h"

#include "discovery/device_description.h"
#include "discovery/ssdp.h"
#include "logging/logger.h"

#include <utility>
#include <vector>

namespace discovery {

nlohmann::json CycleReport::toJson() const {
    nlohmann::json j;
    j["skipped"] = skipped;
    j["socket_error"] = socketError;
    j["replies"] = replies;
    j["accepted"] = accepted;
    j["malformed"] = malformed;
    j["ignored"] = ignored;
    j["description_failures"] = descriptionFailures;
    j["new_devices"] = newDevices;
    j["updated"] = updated;
    j["reconnected"] = reconnected;
    j["disconnected"] = disconnected;
    return j;
}

DiscoveryEngine::DiscoveryEngine(Dependencies deps, DiscoveryOptions options)
    : deps_(std::move(deps)), options_(std::move(options)) {
    if (!deps_.now) {
        deps_.now = castgrid::systemNowProvider();
    }
}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

bool DiscoveryEngine::isRunning() const {
    return !deps_.runningFlag || deps_.runningFlag->load(std::memory_order_acquire);
}

void DiscoveryEngine::start() {
    if (monitorRunning_.exchange(true)) {
        return;
    }
    monitorThread_ = std::thread(&DiscoveryEngine::monitorLoop, this);
    LOG_INFO("[Discovery] Started (interval {}s, window {}ms, target {})",
             options_.interval.count(), options_.searchWindow.count(), options_.searchTarget);
}

void DiscoveryEngine::stop() {
    bool wasRunning = monitorRunning_.exchange(false);
    cv_.notify_all();
    if (wasRunning && monitorThread_.joinable()) {
        monitorThread_.join();
        LOG_INFO("[Discovery] Stopped");
    }
}

void DiscoveryEngine::pause() {
    if (!paused_.exchange(true)) {
        LOG_INFO("[Discovery] Paused");
        emitEvent("discovery_paused", nullptr);
    }
}

void DiscoveryEngine::resume() {
    if (paused_.exchange(false)) {
        LOG_INFO("[Discovery] Resumed");
        emitEvent("discovery_resumed", nullptr);
        cv_.notify_all();
    }
}

bool DiscoveryEngine::isPaused() const {
    return paused_.load(std::memory_order_acquire);
}

bool DiscoveryEngine::scanNow() {
    if (isPaused() || !monitorRunning_.load(std::memory_order_acquire)) {
        return false;
    }
    scanRequested_.store(true, std::memory_order_release);
    cv_.notify_all();
    return true;
}

void DiscoveryEngine::setEventPublisher(std::function<void(const nlohmann::json&)> eventPublisher) {
    std::lock_guard<std::mutex> lock(mutex_);
    deps_.eventPublisher = std::move(eventPublisher);
}

void DiscoveryEngine::emitEvent(const std::string& type, const nlohmann::json& data) {
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

bool DiscoveryEngine::connect(const std::string& id, castgrid::Timestamp now) {
    std::string error;
    if (!deps_.registry->transition(id, devices::ConnectionStatus::Connecting, now, error) ||
        !deps_.registry->transition(id, devices::ConnectionStatus::Connected, now, error)) {
        LOG_WARN("[Discovery] Cannot connect {}: {}", id, error);
        return false;
    }
    return true;
}

bool DiscoveryEngine::registerConfiguredDevice(devices::Device device) {
    if (!deps_.registry) {
        return false;
    }
    const auto now = deps_.now();
    device.pinned = true;
    device.connectionStatus = devices::ConnectionStatus::Disconnected;
    if (device.discoveryMethod.empty()) {
        device.discoveryMethod = "config";
    }
    const std::string id = device.id;
    if (!deps_.registry->add(std::move(device))) {
        LOG_WARN("[Discovery] Configured device {} already registered", id);
        return false;
    }
    if (!connect(id, now)) {
        return false;
    }
    LOG_INFO("[Discovery] Registered configured device {}", id);
    if (auto snapshot = deps_.registry->get(id)) {
        emitEvent("device_discovered", devices::deviceToJson(*snapshot));
    }
    return true;
}

bool DiscoveryEngine::markUnreachable(const std::string& deviceId, const std::string& reason) {
    if (!deps_.registry) {
        return false;
    }
    auto device = deps_.registry->get(deviceId);
    if (!device || device->connectionStatus != devices::ConnectionStatus::Connected) {
        return false;
    }
    std::string error;
    if (!deps_.registry->transition(deviceId, devices::ConnectionStatus::Error, deps_.now(),
                                    error)) {
        LOG_WARN("[Discovery] Cannot mark {} unreachable: {}", deviceId, error);
        return false;
    }
    LOG_WARN("[Discovery] Device {} unreachable: {}", deviceId, reason);
    emitEvent("device_error", {{"device_id", deviceId}, {"reason", reason}});
    return true;
}

void DiscoveryEngine::reconnectPinned(castgrid::Timestamp now, CycleReport& report) {
    for (const auto& device : deps_.registry->list()) {
        if (!device.pinned || device.connectionStatus != devices::ConnectionStatus::Disconnected) {
            continue;
        }
        if (connect(device.id, now)) {
            report.reconnected++;
            LOG_INFO("[Discovery] Configured device {} reconnected", device.id);
            emitEvent("device_discovered", {{"device_id", device.id}, {"reconnected", true}});
        }
    }
}

void DiscoveryEngine::handleReply(const SsdpDatagram& datagram, castgrid::Timestamp now,
                                  std::unordered_map<std::string, bool>& seen,
                                  CycleReport& report) {
    auto response = parseSsdpResponse(datagram.payload);
    if (!response) {
        report.malformed++;
        // Chatty non-UPnP gear on the segment can repeat this every cycle
        LOG_EVERY_N(WARN, 50, "[Discovery] Dropped malformed reply from {}", datagram.sourceHost);
        return;
    }
    if (!advertisesRenderer(*response)) {
        report.ignored++;
        return;
    }

    const std::string location = response->header("location");
    std::string host = datagram.sourceHost;
    uint16_t port = datagram.sourcePort;
    if (auto url = parseHttpUrl(location)) {
        host = url->host;
        port = url->port;
    }

    std::string id = deviceIdentity(*response, host, port);
    if (!deps_.registry->contains(id)) {
        // A configured record for the same host absorbs the SSDP identity
        if (auto existing = deps_.registry->findByHost(host)) {
            id = *existing;
        }
    }
    if (seen.count(id)) {
        return;
    }
    seen[id] = true;
    report.accepted++;

    if (deps_.registry->contains(id)) {
        deps_.registry->modify(id, [&](devices::Device& device) {
            device.lastDiscoveredAt = now;
            if (device.location.empty()) {
                device.location = location;
            }
        });
        auto device = deps_.registry->get(id);
        if (device && device->connectionStatus == devices::ConnectionStatus::Disconnected &&
            connect(id, now)) {
            report.reconnected++;
            LOG_INFO("[Discovery] Device {} seen again", id);
            emitEvent("device_discovered", {{"device_id", id}, {"reconnected", true}});
        }
        report.updated++;
        return;
    }

    if (!deps_.http || location.empty()) {
        report.descriptionFailures++;
        return;
    }

    control::HttpRequest request;
    request.method = "GET";
    request.url = location;
    request.timeout = options_.descriptionTimeout;
    control::HttpResponse descriptionResponse;
    auto transfer = deps_.http->perform(request, descriptionResponse);
    std::string error;
    std::optional<DeviceDescription> desc;
    if (!transfer.ok()) {
        error = transfer.message;
    } else if (descriptionResponse.status != 200) {
        error = "HTTP " + std::to_string(descriptionResponse.status);
    } else {
        desc = parseDeviceDescription(descriptionResponse.body, location, error);
    }
    if (!desc) {
        report.descriptionFailures++;
        LOG_DEBUG("[Discovery] Description {} rejected: {}", location, error);
        return;
    }

    devices::Device device;
    device.id = id;
    device.friendlyName = desc->friendlyName.empty() ? host : desc->friendlyName;
    device.hostname = host;
    device.port = port;
    device.controlUrl = desc->avTransportControlUrl;
    device.location = location;
    device.manufacturer = desc->manufacturer;
    device.modelName = desc->modelName;
    device.udn = desc->udn;
    device.protocol = devices::ProtocolKind::Dlna;
    device.discoveryMethod = "ssdp";
    device.lastDiscoveredAt = now;

    if (!deps_.registry->add(std::move(device))) {
        return;
    }
    if (connect(id, now)) {
        report.newDevices++;
        LOG_INFO("[Discovery] New device {} ({}) at {}", id, desc->friendlyName, host);
        if (auto snapshot = deps_.registry->get(id)) {
            emitEvent("device_discovered", devices::deviceToJson(*snapshot));
        }
    }
}

void DiscoveryEngine::ageDevices(castgrid::Timestamp now, CycleReport& report) {
    for (const auto& device : deps_.registry->list()) {
        std::string reason;
        if (device.connectionStatus == devices::ConnectionStatus::Connected && !device.pinned &&
            device.lastDiscoveredAt && now - *device.lastDiscoveredAt >= options_.disconnectTimeout) {
            reason = "not_seen";
        } else if (device.connectionStatus == devices::ConnectionStatus::Error &&
                   device.connectionChangedAt &&
                   now - *device.connectionChangedAt >= options_.errorBackoff) {
            reason = "error_backoff";
        } else {
            continue;
        }

        std::string error;
        if (deps_.registry->transition(device.id, devices::ConnectionStatus::Disconnected, now,
                                       error)) {
            report.disconnected++;
            LOG_INFO("[Discovery] Device {} disconnected ({})", device.id, reason);
            emitEvent("device_disconnected", {{"device_id", device.id}, {"reason", reason}});
        }
    }
}

CycleReport DiscoveryEngine::runCycle() {
    CycleReport report;
    if (isPaused()) {
        report.skipped = true;
        return report;
    }
    if (!deps_.registry) {
        return report;
    }

    std::lock_guard<std::mutex> cycleLock(cycleMutex_);
    const auto now = deps_.now();

    reconnectPinned(now, report);

    std::vector<SsdpDatagram> replies;
    std::string error;
    bool searched = false;
    if (deps_.socket) {
        searched = deps_.socket->search(
            buildMSearchRequest(options_.searchTarget, options_.mxSeconds), options_.searchWindow,
            replies, error);
    } else {
        error = "no SSDP socket configured";
    }

    if (!searched) {
        report.socketError = true;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!socketErrorReported_) {
            LOG_ERROR("[Discovery] SSDP search failed: {} (retrying every cycle)", error);
            socketErrorReported_ = true;
        }
        lastError_ = error;
    } else {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (socketErrorReported_) {
                LOG_INFO("[Discovery] SSDP search recovered");
                socketErrorReported_ = false;
            }
            lastError_.clear();
        }

        report.replies = replies.size();
        std::unordered_map<std::string, bool> seen;
        for (const auto& datagram : replies) {
            handleReply(datagram, now, seen, report);
        }
    }

    ageDevices(now, report);

    LOG_DEBUG("[Discovery] Cycle: {} replies, {} accepted, {} new, {} malformed, {} ignored",
              report.replies, report.accepted, report.newDevices, report.malformed,
              report.ignored);

    std::lock_guard<std::mutex> lock(mutex_);
    cycleCount_++;
    lastCycleAt_ = now;
    lastReport_ = report;
    return report;
}

nlohmann::json DiscoveryEngine::statusJson() const {
    size_t total = 0;
    size_t connected = 0;
    if (deps_.registry) {
        for (const auto& device : deps_.registry->list()) {
            total++;
            if (device.connectionStatus == devices::ConnectionStatus::Connected) {
                connected++;
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json status;
    status["running"] = monitorRunning_.load(std::memory_order_acquire);
    status["paused"] = paused_.load(std::memory_order_acquire);
    status["interval_seconds"] = options_.interval.count();
    status["search_target"] = options_.searchTarget;
    status["cycle_count"] = cycleCount_;
    status["last_cycle_at"] =
        lastCycleAt_ ? nlohmann::json(castgrid::formatIso8601(*lastCycleAt_)) : nlohmann::json();
    status["devices_discovered"] = total;
    status["devices_connected"] = connected;
    status["last_error"] = lastError_.empty() ? nlohmann::json() : nlohmann::json(lastError_);
    status["last_cycle"] = lastReport_.toJson();
    return status;
}

void DiscoveryEngine::monitorLoop() {
    while (monitorRunning_.load(std::memory_order_acquire) && isRunning()) {
        scanRequested_.store(false, std::memory_order_release);
        if (!isPaused()) {
            runCycle();
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, options_.interval, [&]() {
            return !monitorRunning_.load(std::memory_order_acquire) ||
                   scanRequested_.load(std::memory_order_acquire);
        });
    }
}

}  // namespace discovery
