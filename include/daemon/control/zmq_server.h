#pragma once

#include "core/daemon_constants.h"
#include "daemon/control/ipc_protocol.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace daemon_ipc {

// Per-command counters reported through PLAYBACK_STATS
struct CommandStats {
    uint64_t requests = 0;
    uint64_t errors = 0;
    std::chrono::microseconds totalTime{0};
    std::chrono::microseconds maxTime{0};
};

/**
 * @brief REP command server with a companion PUB socket for events.
 *
 * Requests are served one at a time on a dedicated thread that polls the REP
 * socket, so stop() returns within one poll interval. Events go out as two
 * frames, [topic, json], letting subscribers filter by event type.
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const IpcRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = DaemonConstants::ZEROMQ_IPC_PATH,
                              int pollIntervalMs = DaemonConstants::ZEROMQ_POLL_INTERVAL_MS);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    // Register before start(); names are case-insensitive
    void registerCommand(const std::string& command, Handler handler);
    std::vector<std::string> commands() const;

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    bool publishEvent(const nlohmann::json& payload);

    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    // Dispatch without the socket; used by the server loop
    std::string handle(const std::string& raw);

    std::map<std::string, CommandStats> commandStats() const;
    nlohmann::json commandStatsJson() const;

   private:
    std::string dispatch(const IpcRequest& request);
    void record(const std::string& command, std::chrono::microseconds elapsed, bool failed);
    void serverLoop();
    void closeSockets();

    std::string endpoint_;
    std::string pubEndpoint_;
    int pollIntervalMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::mutex pubMutex_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::map<std::string, Handler> handlers_;

    mutable std::mutex statsMutex_;
    std::map<std::string, CommandStats> stats_;
};

}  // namespace daemon_ipc
