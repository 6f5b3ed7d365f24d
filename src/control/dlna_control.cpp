#include "control/control_client.h"
#include "control/dlna_soap.h"
#include "logging/logger.h"

namespace control {
namespace {

ControlResult invokeAction(const ControlTarget& target, RequestRunner& runner,
                           const std::string& action, const dlna_soap::Arguments& args,
                           HttpResponse& response) {
    if (target.controlUrl.empty()) {
        return ControlResult::failure(CastEngine::ErrorCode::DEVICE_NOT_FOUND,
                                      "No AVTransport control URL for " + target.deviceId);
    }

    HttpRequest request;
    request.method = "POST";
    request.url = target.controlUrl;
    request.headers = {{"Content-Type", "text/xml; charset=\"utf-8\""},
                       {"SOAPAction", dlna_soap::soapActionHeader(action)}};
    request.body = dlna_soap::buildEnvelope(action, args);

    ControlResult result = runner.run(std::move(request), response);
    if (result.code == CastEngine::ErrorCode::DEVICE_PROTOCOL_REJECTED) {
        if (auto fault = dlna_soap::parseFault(response.body)) {
            result.message = action + " rejected: " + *fault;
        } else {
            result.message = action + " rejected: " + result.message;
        }
    }
    return result;
}

ControlResult invokeAction(const ControlTarget& target, RequestRunner& runner,
                           const std::string& action, const dlna_soap::Arguments& args = {}) {
    HttpResponse response;
    return invokeAction(target, runner, action, args, response);
}

ControlResult dlnaPlay(const ControlTarget& target, RequestRunner& runner, const std::string& url,
                       bool /*loop*/) {
    // No repeat mode is set on the renderer; looping is kept up by reconciliation
    std::string metadata = dlna_soap::buildDidlMetadata(url, "Video");
    auto result = invokeAction(target, runner, "SetAVTransportURI",
                               {{"CurrentURI", url}, {"CurrentURIMetaData", metadata}});
    if (!result.ok()) {
        return result;
    }
    return invokeAction(target, runner, "Play", {{"Speed", "1"}});
}

ControlResult dlnaResume(const ControlTarget& target, RequestRunner& runner,
                         const std::string& /*url*/, bool /*loop*/) {
    return invokeAction(target, runner, "Play", {{"Speed", "1"}});
}

ControlResult dlnaStop(const ControlTarget& target, RequestRunner& runner) {
    return invokeAction(target, runner, "Stop");
}

ControlResult dlnaPause(const ControlTarget& target, RequestRunner& runner) {
    return invokeAction(target, runner, "Pause");
}

ControlResult dlnaSeek(const ControlTarget& target, RequestRunner& runner, int positionSeconds) {
    return invokeAction(target, runner, "Seek",
                        {{"Unit", "REL_TIME"}, {"Target", dlna_soap::formatClockTime(positionSeconds)}});
}

ControlResult dlnaTransportState(const ControlTarget& target, RequestRunner& runner,
                                 TransportStatus& status) {
    HttpResponse response;
    auto result = invokeAction(target, runner, "GetTransportInfo", {}, response);
    if (!result.ok()) {
        return result;
    }
    auto info = dlna_soap::parseTransportInfo(response.body);
    if (!info) {
        return ControlResult::failure(CastEngine::ErrorCode::DEVICE_INVALID_RESPONSE,
                                      "GetTransportInfo without CurrentTransportState from " +
                                          target.deviceId);
    }
    status.state = info->state;

    // Position is best-effort; many renderers answer it poorly
    HttpResponse positionResponse;
    auto positionResult = invokeAction(target, runner, "GetPositionInfo", {}, positionResponse);
    if (positionResult.ok()) {
        if (auto position = dlna_soap::parsePositionInfo(positionResponse.body)) {
            status.currentUri = position->trackUri;
            status.positionSeconds = position->positionSeconds;
            status.durationSeconds = position->durationSeconds;
        }
    } else {
        LOG_DEBUG("[DLNA] GetPositionInfo on {} failed: {}", target.deviceId,
                  positionResult.message);
    }
    return result;
}

}  // namespace

ProtocolOps dlnaProtocolOps() {
    ProtocolOps ops;
    ops.play = dlnaPlay;
    ops.stop = dlnaStop;
    ops.pause = dlnaPause;
    ops.resume = dlnaResume;
    ops.seek = dlnaSeek;
    ops.transportState = dlnaTransportState;
    return ops;
}

}  // namespace control
