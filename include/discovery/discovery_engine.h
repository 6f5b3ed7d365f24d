#pragma once

#include "control/http_transport.h"
#include "core/clock.h"
#include "devices/device_registry.h"
#include "discovery/ssdp_socket.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace discovery {

struct DiscoveryOptions {
    std::chrono::seconds interval{10};
    std::chrono::milliseconds searchWindow{5000};
    std::string searchTarget = "ssdp:all";
    int mxSeconds = 3;
    std::chrono::seconds disconnectTimeout{30};
    std::chrono::seconds errorBackoff{60};
    std::chrono::milliseconds descriptionTimeout{5000};
};

struct CycleReport {
    bool skipped = false;      // paused
    bool socketError = false;
    size_t replies = 0;
    size_t accepted = 0;
    size_t malformed = 0;      // dropped datagrams
    size_t ignored = 0;        // well-formed but not a renderer
    size_t descriptionFailures = 0;
    size_t newDevices = 0;
    size_t updated = 0;
    size_t reconnected = 0;
    size_t disconnected = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Periodic SSDP search that keeps the device table's connection state current.
 *
 * The engine is the only writer of connection_status and last_discovered_at.
 * A cycle never fails as a whole: bad datagrams are dropped, socket problems are
 * logged once and retried on the next cycle.
 */
class DiscoveryEngine {
   public:
    struct Dependencies {
        devices::DeviceRegistry* registry = nullptr;
        SsdpSocket* socket = nullptr;
        control::HttpTransport* http = nullptr;  // device description fetch
        castgrid::NowProvider now;
        std::function<void(const nlohmann::json&)> eventPublisher;
        std::atomic<bool>* runningFlag = nullptr;
    };

    DiscoveryEngine(Dependencies deps, DiscoveryOptions options);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    void start();
    void stop();

    void pause();
    void resume();
    bool isPaused() const;

    // One full cycle on the caller's thread. Skipped while paused.
    CycleReport runCycle();

    // Wakes the background loop for an immediate cycle. False while paused or stopped.
    bool scanNow();

    // Adds a configured device (pinned) and brings it to connected. False if the id exists.
    bool registerConfiguredDevice(devices::Device device);

    // Reported by control paths that gave up on a device: connected -> error.
    bool markUnreachable(const std::string& deviceId, const std::string& reason);

    nlohmann::json statusJson() const;
    void setEventPublisher(std::function<void(const nlohmann::json&)> eventPublisher);

   private:
    bool isRunning() const;
    bool connect(const std::string& id, castgrid::Timestamp now);
    void reconnectPinned(castgrid::Timestamp now, CycleReport& report);
    void handleReply(const SsdpDatagram& datagram, castgrid::Timestamp now,
                     std::unordered_map<std::string, bool>& seen, CycleReport& report);
    void ageDevices(castgrid::Timestamp now, CycleReport& report);
    void emitEvent(const std::string& type, const nlohmann::json& data);
    void monitorLoop();

    Dependencies deps_;
    DiscoveryOptions options_;

    std::mutex cycleMutex_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread monitorThread_;
    std::atomic<bool> monitorRunning_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> scanRequested_{false};

    bool socketErrorReported_ = false;
    uint64_t cycleCount_ = 0;
    std::optional<castgrid::Timestamp> lastCycleAt_;
    std::string lastError_;
    CycleReport lastReport_;
};

}  // namespace discovery
