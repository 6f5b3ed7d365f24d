#pragma once

#include "control/dlna_soap.h"
#include "control/http_transport.h"
#include "core/error_codes.h"
#include "devices/device.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace control {

using TransportState = dlna_soap::TransportState;

struct ControlOptions {
    std::chrono::milliseconds timeout{5000};
    int maxAttempts = 3;
    std::chrono::milliseconds retryDelay{2000};
};

struct ControlResult {
    CastEngine::ErrorCode code = CastEngine::ErrorCode::OK;
    std::string message;
    int attempts = 0;
    long httpStatus = 0;

    bool ok() const {
        return code == CastEngine::ErrorCode::OK;
    }
    bool unreachable() const {
        return code == CastEngine::ErrorCode::DEVICE_UNREACHABLE;
    }

    static ControlResult success() {
        return ControlResult{};
    }
    static ControlResult failure(CastEngine::ErrorCode code, std::string message) {
        ControlResult result;
        result.code = code;
        result.message = std::move(message);
        return result;
    }
};

struct TransportStatus {
    TransportState state = TransportState::Unknown;
    std::string currentUri;  // empty when the protocol cannot report it
    std::optional<int> positionSeconds;
    std::optional<int> durationSeconds;
};

// Addressing information a protocol implementation needs from a device record
struct ControlTarget {
    std::string deviceId;
    std::string hostname;
    uint16_t port = 0;
    std::string controlUrl;

    static ControlTarget fromDevice(const devices::Device& device);
    // "host" or "host:port"
    std::string authority() const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Runs one HTTP exchange with the shared timeout/retry discipline.
 *
 * Only transient transport failures (connection refused, timeout) are retried;
 * an HTTP error status is a protocol-level rejection and returns at once.
 * Exhausted retries report DEVICE_UNREACHABLE.
 */
class RequestRunner {
   public:
    RequestRunner(HttpTransport& http, const ControlOptions& options, Sleeper sleeper);

    ControlResult run(HttpRequest request, HttpResponse& response);

    const ControlOptions& options() const {
        return options_;
    }

   private:
    HttpTransport& http_;
    const ControlOptions& options_;
    Sleeper sleeper_;
};

// Capability set of one control protocol. An empty entry means "not supported".
struct ProtocolOps {
    std::function<ControlResult(const ControlTarget&, RequestRunner&, const std::string& url,
                                bool loop)>
        play;
    std::function<ControlResult(const ControlTarget&, RequestRunner&)> stop;
    std::function<ControlResult(const ControlTarget&, RequestRunner&)> pause;
    std::function<ControlResult(const ControlTarget&, RequestRunner&, const std::string& url,
                                bool loop)>
        resume;
    std::function<ControlResult(const ControlTarget&, RequestRunner&, int positionSeconds)> seek;
    std::function<ControlResult(const ControlTarget&, RequestRunner&, TransportStatus&)>
        transportState;
};

using DispatchTable = std::map<devices::ProtocolKind, ProtocolOps>;

ProtocolOps dlnaProtocolOps();
ProtocolOps transcreenProtocolOps();
DispatchTable defaultDispatchTable();

/**
 * @brief Issues control calls to a single device, selecting the protocol
 *        implementation from the dispatch table by the device's protocol_kind.
 *
 * Calls block for at most maxAttempts * (timeout + retryDelay). Thread-safe.
 */
class ControlClient {
   public:
    explicit ControlClient(std::shared_ptr<HttpTransport> http, ControlOptions options = {},
                           DispatchTable table = defaultDispatchTable());

    void setSleeper(Sleeper sleeper);

    ControlResult play(const devices::Device& device, const std::string& url, bool loop);
    ControlResult stop(const devices::Device& device);
    ControlResult pause(const devices::Device& device);
    ControlResult resume(const devices::Device& device, const std::string& url, bool loop);
    ControlResult seek(const devices::Device& device, int positionSeconds);
    ControlResult getTransportState(const devices::Device& device, TransportStatus& status);

    const ControlOptions& options() const {
        return options_;
    }

   private:
    const ProtocolOps* opsFor(const devices::Device& device) const;
    RequestRunner makeRunner() const;

    std::shared_ptr<HttpTransport> http_;
    ControlOptions options_;
    DispatchTable table_;
    Sleeper sleeper_;
};

}  // namespace control
