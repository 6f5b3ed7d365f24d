#include "streaming/session_registry.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace streaming {

const char* sessionStatusToString(SessionStatus status) {
    switch (status) {
    case SessionStatus::Initializing:
        return "initializing";
    case SessionStatus::Active:
        return "active";
    case SessionStatus::Stalled:
        return "stalled";
    case SessionStatus::Error:
        return "error";
    case SessionStatus::Completed:
        return "completed";
    }
    return "unknown";
}

nlohmann::json sessionToJson(const StreamingSession& session) {
    nlohmann::json j;
    j["session_id"] = session.sessionId;
    j["device_id"] = session.deviceId;
    j["content_ref"] = session.contentRef;
    j["served_url"] = session.servedUrl;
    j["started_at"] = castgrid::toUnixMillis(session.startedAt);
    j["ended_at"] = session.endedAt ? nlohmann::json(castgrid::toUnixMillis(*session.endedAt))
                                    : nlohmann::json();
    j["is_active"] = session.isActive;
    j["is_paused"] = session.isPaused;
    j["position"] = session.positionSeconds ? nlohmann::json(*session.positionSeconds)
                                            : nlohmann::json();
    j["duration"] = session.durationSeconds ? nlohmann::json(*session.durationSeconds)
                                            : nlohmann::json();
    j["status"] = sessionStatusToString(session.status);
    j["bytes_served"] = session.bytesServed;
    j["connection_count"] = session.connectionCount;
    j["active_connections"] = session.activeConnections;
    j["last_client"] = session.lastClient;
    j["last_activity_at"] = castgrid::toUnixMillis(session.lastActivityAt);
    return j;
}

std::string encodePathSegment(const std::string& segment) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

StreamingSessionRegistry::StreamingSessionRegistry(castgrid::NowProvider now,
                                                   SessionOptions options)
    : now_(now ? std::move(now) : castgrid::systemNowProvider()),
      options_(options),
      rng_(std::random_device{}()) {}

void StreamingSessionRegistry::setBaseUrl(std::string baseUrl) {
    while (!baseUrl.empty() && baseUrl.back() == '/') {
        baseUrl.pop_back();
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    baseUrl_ = std::move(baseUrl);
}

std::string StreamingSessionRegistry::baseUrl() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return baseUrl_;
}

std::string StreamingSessionRegistry::generateSessionId() {
    // Called with mutex_ held exclusively
    uint64_t hi = rng_();
    uint64_t lo = rng_();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buffer;
}

void StreamingSessionRegistry::endLocked(StreamingSession& session, SessionStatus finalStatus,
                                         castgrid::Timestamp now) {
    if (!session.isActive) {
        return;
    }
    session.isActive = false;
    session.endedAt = now;
    session.status = finalStatus;
    auto it = activeByDevice_.find(session.deviceId);
    if (it != activeByDevice_.end() && it->second == session.sessionId) {
        activeByDevice_.erase(it);
    }
}

StreamingSession StreamingSessionRegistry::allocate(const std::string& deviceId,
                                                    const std::string& contentRef) {
    const auto now = now_();
    std::string fileName = contentRef;
    size_t slash = fileName.find_last_of('/');
    if (slash != std::string::npos) {
        fileName = fileName.substr(slash + 1);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto previous = activeByDevice_.find(deviceId);
    if (previous != activeByDevice_.end()) {
        auto sessionIt = sessions_.find(previous->second);
        if (sessionIt != sessions_.end()) {
            LOG_DEBUG("[Sessions] {} supersedes session {}", deviceId, sessionIt->first);
            endLocked(sessionIt->second, SessionStatus::Completed, now);
        } else {
            activeByDevice_.erase(previous);
        }
    }

    StreamingSession session;
    do {
        session.sessionId = generateSessionId();
    } while (sessions_.count(session.sessionId));
    session.deviceId = deviceId;
    session.contentRef = contentRef;
    session.fileName = fileName;
    session.servedUrl = baseUrl_ + DaemonConstants::STREAM_PATH_PREFIX + session.sessionId + "/" +
                        encodePathSegment(fileName);
    session.startedAt = now;
    session.lastActivityAt = now;
    session.isActive = true;
    session.status = SessionStatus::Initializing;

    activeByDevice_[deviceId] = session.sessionId;
    sessions_[session.sessionId] = session;
    return session;
}

std::optional<StreamingSession> StreamingSessionRegistry::lookup(
    const std::string& sessionId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<StreamingSession> StreamingSessionRegistry::currentFor(
    const std::string& deviceId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto active = activeByDevice_.find(deviceId);
    if (active == activeByDevice_.end()) {
        return std::nullopt;
    }
    auto it = sessions_.find(active->second);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<StreamingSession> StreamingSessionRegistry::resolveServable(
    const std::string& sessionId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second.isActive) {
        return std::nullopt;
    }
    return it->second;
}

bool StreamingSessionRegistry::end(const std::string& sessionId, SessionStatus finalStatus) {
    const auto now = now_();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second.isActive) {
        return false;
    }
    endLocked(it->second, finalStatus, now);
    return true;
}

bool StreamingSessionRegistry::endForDevice(const std::string& deviceId,
                                            SessionStatus finalStatus) {
    const auto now = now_();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto active = activeByDevice_.find(deviceId);
    if (active == activeByDevice_.end()) {
        return false;
    }
    auto it = sessions_.find(active->second);
    if (it == sessions_.end()) {
        activeByDevice_.erase(active);
        return false;
    }
    endLocked(it->second, finalStatus, now);
    return true;
}

void StreamingSessionRegistry::recordConnectionOpened(const std::string& sessionId,
                                                      const std::string& client) {
    const auto now = now_();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return;
    }
    auto& session = it->second;
    session.connectionCount++;
    session.activeConnections++;
    session.lastClient = client;
    session.lastActivityAt = now;
    if (session.isActive &&
        (session.status == SessionStatus::Initializing || session.status == SessionStatus::Stalled)) {
        session.status = SessionStatus::Active;
    }
}

void StreamingSessionRegistry::recordConnectionClosed(const std::string& sessionId,
                                                      uint64_t bytesSent) {
    const auto now = now_();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return;
    }
    auto& session = it->second;
    session.bytesServed += bytesSent;
    session.activeConnections = std::max(0, session.activeConnections - 1);
    session.lastActivityAt = now;
}

bool StreamingSessionRegistry::updateProgress(const std::string& sessionId,
                                              std::optional<int> positionSeconds,
                                              std::optional<int> durationSeconds) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second.isActive) {
        return false;
    }
    if (positionSeconds) {
        it->second.positionSeconds = positionSeconds;
    }
    if (durationSeconds) {
        it->second.durationSeconds = durationSeconds;
    }
    return true;
}

bool StreamingSessionRegistry::setPaused(const std::string& sessionId, bool paused) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second.isActive) {
        return false;
    }
    it->second.isPaused = paused;
    return true;
}

SweepReport StreamingSessionRegistry::sweep() {
    const auto now = now_();
    SweepReport report;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto& session = it->second;
        if (session.isActive) {
            if (now - session.startedAt >= options_.maxDuration) {
                LOG_INFO("[Sessions] Session {} for {} exceeded maximum duration",
                         session.sessionId, session.deviceId);
                endLocked(session, SessionStatus::Completed, now);
                report.expired++;
            } else if (session.activeConnections == 0 && !session.isPaused &&
                       session.status != SessionStatus::Stalled &&
                       now - session.lastActivityAt >= options_.stallTimeout) {
                LOG_WARN("[Sessions] Session {} for {} stalled", session.sessionId,
                         session.deviceId);
                session.status = SessionStatus::Stalled;
                report.stalled++;
            }
            ++it;
            continue;
        }

        if (session.endedAt && now - *session.endedAt >= options_.retention) {
            it = sessions_.erase(it);
            report.purged++;
            continue;
        }
        ++it;
    }
    return report;
}

std::vector<StreamingSession> StreamingSessionRegistry::list() const {
    std::vector<StreamingSession> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            result.push_back(session);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.startedAt == b.startedAt ? a.sessionId < b.sessionId : a.startedAt < b.startedAt;
    });
    return result;
}

nlohmann::json StreamingSessionRegistry::statsJson() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t active = 0;
    size_t stalled = 0;
    uint64_t bytes = 0;
    for (const auto& [id, session] : sessions_) {
        if (session.isActive) {
            active++;
        }
        if (session.isActive && session.status == SessionStatus::Stalled) {
            stalled++;
        }
        bytes += session.bytesServed;
    }
    nlohmann::json stats;
    stats["total_sessions"] = sessions_.size();
    stats["active_sessions"] = active;
    stats["stalled_sessions"] = stalled;
    stats["bytes_served"] = bytes;
    return stats;
}

void StreamingSessionRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_.clear();
    activeByDevice_.clear();
}

}  // namespace streaming
