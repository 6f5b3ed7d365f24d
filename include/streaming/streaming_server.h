#pragma once

#include "streaming/session_registry.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace streaming {

struct ServerOptions {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 0;  // 0: first free port in [portRangeStart, portRangeEnd]
    uint16_t portRangeStart = 9000;
    uint16_t portRangeEnd = 9100;  // a range of 0..0 binds an ephemeral port
};

/**
 * @brief Minimal HTTP/1.1 file server for active streaming sessions.
 *
 * Paths resolve only through the session index (/stream/<session_id>/<name>);
 * there is no filesystem traversal. GET and HEAD with single byte ranges.
 * One thread per connection, joined on stop().
 */
class StreamingServer {
   public:
    StreamingServer(StreamingSessionRegistry& registry, ServerOptions options);
    ~StreamingServer();

    StreamingServer(const StreamingServer&) = delete;
    StreamingServer& operator=(const StreamingServer&) = delete;

    bool start(std::string& error);
    void stop();

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }
    uint16_t boundPort() const {
        return boundPort_;
    }

    // First non-loopback IPv4 address, "127.0.0.1" when none is configured.
    static std::string detectAdvertiseHost();

   private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    bool bindPort(uint16_t port, std::string& error);
    void acceptLoop();
    void reapWorkers(bool joinAll);
    void handleConnection(int fd, const std::string& client);

    StreamingSessionRegistry& registry_;
    ServerOptions options_;
    int listenFd_ = -1;
    uint16_t boundPort_ = 0;
    std::atomic<bool> running_{false};
    std::thread acceptThread_;
    std::mutex workersMutex_;
    std::vector<Worker> workers_;
};

}  // namespace streaming
