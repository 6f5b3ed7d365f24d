#include "control/control_client.h"
#include "control/dlna_soap.h"

#include <nlohmann/json.hpp>

namespace control {
namespace {

ControlResult post(const ControlTarget& target, RequestRunner& runner, const std::string& path,
                   const nlohmann::json& body) {
    if (target.hostname.empty()) {
        return ControlResult::failure(CastEngine::ErrorCode::DEVICE_NOT_FOUND,
                                      "No hostname for Transcreen device " + target.deviceId);
    }

    HttpRequest request;
    request.method = "POST";
    request.url = "http://" + target.authority() + path;
    if (!body.is_null()) {
        request.headers = {{"Content-Type", "application/json"}};
        request.body = body.dump();
    }

    HttpResponse response;
    return runner.run(std::move(request), response);
}

ControlResult transcreenPlay(const ControlTarget& target, RequestRunner& runner,
                             const std::string& url, bool loop) {
    nlohmann::json body;
    body["url"] = url;
    body["loop"] = loop;
    return post(target, runner, "/play", body);
}

ControlResult transcreenStop(const ControlTarget& target, RequestRunner& runner) {
    return post(target, runner, "/stop", nullptr);
}

ControlResult transcreenPause(const ControlTarget& target, RequestRunner& runner) {
    return post(target, runner, "/pause", nullptr);
}

ControlResult transcreenSeek(const ControlTarget& target, RequestRunner& runner,
                             int positionSeconds) {
    nlohmann::json body;
    body["position"] = dlna_soap::formatClockTime(positionSeconds);
    return post(target, runner, "/seek", body);
}

// The vendor API has no status endpoint; callers fall back to their own bookkeeping.
ControlResult transcreenTransportState(const ControlTarget& /*target*/, RequestRunner& /*runner*/,
                                       TransportStatus& status) {
    status = TransportStatus{};
    return ControlResult::success();
}

}  // namespace

ProtocolOps transcreenProtocolOps() {
    ProtocolOps ops;
    ops.play = transcreenPlay;
    ops.stop = transcreenStop;
    ops.pause = transcreenPause;
    // Resume re-posts the URL; the renderer has no separate resume call
    ops.resume = transcreenPlay;
    ops.seek = transcreenSeek;
    ops.transportState = transcreenTransportState;
    return ops;
}

}  // namespace control
