#pragma once

#include "core/error_codes.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace daemon_ipc {

/**
 * @brief One operator request as received on the control socket.
 *
 * Two wire forms are accepted: JSON `{"cmd": NAME, "params": {...}}` and the
 * raw form `NAME[:payload]` used by shell scripts (`echo PING | zmq-req`).
 * Command names are matched case-insensitively and stored upper-case.
 */
struct IpcRequest {
    std::string raw;
    std::string command;
    std::string payload;  // raw form only
    bool isJson = false;
    std::optional<nlohmann::json> json;
    std::string parseError;

    // JSON form: the "params" object. Raw form: the payload when it is a JSON object.
    nlohmann::json params() const;
};

IpcRequest parseRequest(std::string_view raw);

// Replies mirror the request form: JSON in, JSON out; raw in, "OK[:data]" or "ERR:CODE:message" out.
std::string buildOkResponse(const IpcRequest& request, const nlohmann::json& data = {},
                            const std::string& message = "");
std::string buildErrorResponse(const IpcRequest& request, CastEngine::ErrorCode code,
                               const std::string& message);

// True for an "ERR:..." raw reply or a JSON reply with status "error"
bool isErrorResponse(const IpcRequest& request, const std::string& response);

// Event frame published on the PUB socket: topic is the event type
struct IpcEvent {
    std::string topic;
    std::string body;
};

// Topic from payload["type"], "event" when absent
IpcEvent makeEvent(const nlohmann::json& payload);

// tcp://host:N -> tcp://host:N+1; anything else gets the ".pub" suffix
std::string derivePubEndpoint(const std::string& endpoint);

}  // namespace daemon_ipc
