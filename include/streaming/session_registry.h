#pragma once

#include "core/clock.h"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace streaming {

enum class SessionStatus { Initializing, Active, Stalled, Error, Completed };

const char* sessionStatusToString(SessionStatus status);

struct StreamingSession {
    std::string sessionId;
    std::string deviceId;
    std::string contentRef;  // local file path
    std::string fileName;
    std::string servedUrl;

    castgrid::Timestamp startedAt{};
    std::optional<castgrid::Timestamp> endedAt;
    bool isActive = false;
    bool isPaused = false;
    std::optional<int> positionSeconds;
    std::optional<int> durationSeconds;

    SessionStatus status = SessionStatus::Initializing;
    uint64_t bytesServed = 0;
    uint64_t connectionCount = 0;
    int activeConnections = 0;
    std::string lastClient;
    castgrid::Timestamp lastActivityAt{};
};

nlohmann::json sessionToJson(const StreamingSession& session);

struct SessionOptions {
    std::chrono::seconds stallTimeout{90};
    std::chrono::seconds retention{3600};
    std::chrono::hours maxDuration{24};
};

struct SweepReport {
    size_t stalled = 0;
    size_t expired = 0;  // ended for exceeding the maximum session duration
    size_t purged = 0;
};

/**
 * @brief Authoritative index of streaming sessions.
 *
 * At most one session per device is active. allocate() ends the previous session
 * and publishes the new one under a single exclusive lock, so a concurrent reader
 * (the streaming server) never sees two servable sessions for one device.
 */
class StreamingSessionRegistry {
   public:
    explicit StreamingSessionRegistry(castgrid::NowProvider now = castgrid::systemNowProvider(),
                                      SessionOptions options = {});

    StreamingSessionRegistry(const StreamingSessionRegistry&) = delete;
    StreamingSessionRegistry& operator=(const StreamingSessionRegistry&) = delete;

    // "http://host:port"; served URLs are derived from it at allocation time.
    void setBaseUrl(std::string baseUrl);
    std::string baseUrl() const;

    StreamingSession allocate(const std::string& deviceId, const std::string& contentRef);

    std::optional<StreamingSession> lookup(const std::string& sessionId) const;
    std::optional<StreamingSession> currentFor(const std::string& deviceId) const;

    // Active sessions only; what the streaming server may serve.
    std::optional<StreamingSession> resolveServable(const std::string& sessionId) const;

    bool end(const std::string& sessionId, SessionStatus finalStatus = SessionStatus::Completed);
    bool endForDevice(const std::string& deviceId,
                      SessionStatus finalStatus = SessionStatus::Completed);

    void recordConnectionOpened(const std::string& sessionId, const std::string& client);
    void recordConnectionClosed(const std::string& sessionId, uint64_t bytesSent);

    bool updateProgress(const std::string& sessionId, std::optional<int> positionSeconds,
                        std::optional<int> durationSeconds);
    bool setPaused(const std::string& sessionId, bool paused);

    SweepReport sweep();

    std::vector<StreamingSession> list() const;
    nlohmann::json statsJson() const;

    // Teardown hook for tests and reloads
    void clear();

   private:
    std::string generateSessionId();
    void endLocked(StreamingSession& session, SessionStatus finalStatus, castgrid::Timestamp now);

    castgrid::NowProvider now_;
    SessionOptions options_;

    mutable std::shared_mutex mutex_;
    std::string baseUrl_;
    std::unordered_map<std::string, StreamingSession> sessions_;
    std::unordered_map<std::string, std::string> activeByDevice_;
    std::mt19937_64 rng_;
};

// Percent-encodes a path segment for use in a served URL.
std::string encodePathSegment(const std::string& segment);

}  // namespace streaming
