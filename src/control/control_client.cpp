#include "control/control_client.h"

#include "logging/logger.h"

#include <thread>
#include <utility>

namespace control {
namespace {

class UnconfiguredTransport : public HttpTransport {
   public:
    TransportResult perform(const HttpRequest& /*request*/, HttpResponse& /*response*/) override {
        TransportResult result;
        result.failure = TransportFailure::Other;
        result.message = "no HTTP transport configured";
        return result;
    }
};

UnconfiguredTransport& unconfiguredTransport() {
    static UnconfiguredTransport transport;
    return transport;
}

ControlResult unsupported(const devices::Device& device, const char* action) {
    return ControlResult::failure(CastEngine::ErrorCode::DEVICE_UNSUPPORTED_ACTION,
                                  std::string(action) + " not supported by " +
                                      devices::protocolKindToString(device.protocol) +
                                      " device " + device.id);
}

}  // namespace

ControlTarget ControlTarget::fromDevice(const devices::Device& device) {
    ControlTarget target;
    target.deviceId = device.id;
    target.hostname = device.hostname;
    target.port = device.port;
    target.controlUrl = device.controlUrl;
    return target;
}

std::string ControlTarget::authority() const {
    if (port == 0) {
        return hostname;
    }
    return hostname + ":" + std::to_string(port);
}

RequestRunner::RequestRunner(HttpTransport& http, const ControlOptions& options, Sleeper sleeper)
    : http_(http), options_(options), sleeper_(std::move(sleeper)) {}

ControlResult RequestRunner::run(HttpRequest request, HttpResponse& response) {
    request.timeout = options_.timeout;
    const int maxAttempts = options_.maxAttempts > 0 ? options_.maxAttempts : 1;

    ControlResult result;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        result.attempts = attempt;
        TransportResult transfer = http_.perform(request, response);

        if (transfer.ok()) {
            result.httpStatus = response.status;
            if (response.status >= 200 && response.status < 300) {
                result.code = CastEngine::ErrorCode::OK;
                result.message.clear();
                return result;
            }
            result.code = CastEngine::ErrorCode::DEVICE_PROTOCOL_REJECTED;
            result.message = "HTTP " + std::to_string(response.status) + " from " + request.url;
            return result;
        }

        if (!transfer.isTransient()) {
            result.code = CastEngine::ErrorCode::DEVICE_UNREACHABLE;
            result.message = request.url + ": " + transfer.message;
            return result;
        }

        result.code = CastEngine::ErrorCode::DEVICE_UNREACHABLE;
        result.message = request.url + ": " + transportFailureToString(transfer.failure) + " (" +
                         transfer.message + ")";
        LOG_DEBUG("[Control] attempt {}/{} failed: {}", attempt, maxAttempts, result.message);

        if (attempt < maxAttempts && sleeper_ && options_.retryDelay.count() > 0) {
            sleeper_(options_.retryDelay);
        }
    }
    return result;
}

DispatchTable defaultDispatchTable() {
    DispatchTable table;
    table[devices::ProtocolKind::Dlna] = dlnaProtocolOps();
    table[devices::ProtocolKind::Transcreen] = transcreenProtocolOps();
    return table;
}

ControlClient::ControlClient(std::shared_ptr<HttpTransport> http, ControlOptions options,
                             DispatchTable table)
    : http_(std::move(http)),
      options_(options),
      table_(std::move(table)),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

void ControlClient::setSleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
}

const ProtocolOps* ControlClient::opsFor(const devices::Device& device) const {
    auto it = table_.find(device.protocol);
    return it == table_.end() ? nullptr : &it->second;
}

RequestRunner ControlClient::makeRunner() const {
    HttpTransport& transport = http_ ? *http_ : unconfiguredTransport();
    return RequestRunner(transport, options_, sleeper_);
}

ControlResult ControlClient::play(const devices::Device& device, const std::string& url,
                                  bool loop) {
    const auto* ops = opsFor(device);
    if (!ops || !ops->play) {
        return unsupported(device, "play");
    }
    auto runner = makeRunner();
    auto result = ops->play(ControlTarget::fromDevice(device), runner, url, loop);
    if (result.ok()) {
        LOG_INFO("[Control] {} playing {}", device.id, url);
    } else {
        LOG_WARN("[Control] play on {} failed: {} ({})", device.id, result.message,
                 CastEngine::errorCodeToString(result.code));
    }
    return result;
}

ControlResult ControlClient::stop(const devices::Device& device) {
    const auto* ops = opsFor(device);
    if (!ops || !ops->stop) {
        return unsupported(device, "stop");
    }
    auto runner = makeRunner();
    auto result = ops->stop(ControlTarget::fromDevice(device), runner);
    if (!result.ok()) {
        LOG_WARN("[Control] stop on {} failed: {}", device.id, result.message);
    }
    return result;
}

ControlResult ControlClient::pause(const devices::Device& device) {
    const auto* ops = opsFor(device);
    if (!ops || !ops->pause) {
        return unsupported(device, "pause");
    }
    auto runner = makeRunner();
    return ops->pause(ControlTarget::fromDevice(device), runner);
}

ControlResult ControlClient::resume(const devices::Device& device, const std::string& url,
                                    bool loop) {
    const auto* ops = opsFor(device);
    if (!ops || !ops->resume) {
        return unsupported(device, "resume");
    }
    auto runner = makeRunner();
    return ops->resume(ControlTarget::fromDevice(device), runner, url, loop);
}

ControlResult ControlClient::seek(const devices::Device& device, int positionSeconds) {
    const auto* ops = opsFor(device);
    if (!ops || !ops->seek) {
        return unsupported(device, "seek");
    }
    auto runner = makeRunner();
    return ops->seek(ControlTarget::fromDevice(device), runner, positionSeconds);
}

ControlResult ControlClient::getTransportState(const devices::Device& device,
                                               TransportStatus& status) {
    status = TransportStatus{};
    const auto* ops = opsFor(device);
    if (!ops || !ops->transportState) {
        return unsupported(device, "transport state");
    }
    auto runner = makeRunner();
    return ops->transportState(ControlTarget::fromDevice(device), runner, status);
}

}  // namespace control
