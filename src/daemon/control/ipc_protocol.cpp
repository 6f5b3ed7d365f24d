#include "daemon/control/ipc_protocol.h"

#include "core/daemon_constants.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace daemon_ipc {
namespace {

std::string upperCase(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

// Shell clients sometimes send C strings including the terminator
std::string_view cutAtNul(std::string_view text) {
    return text.substr(0, text.find('\0'));
}

}  // namespace

nlohmann::json IpcRequest::params() const {
    if (isJson) {
        if (json && json->is_object()) {
            auto it = json->find("params");
            if (it != json->end() && it->is_object()) {
                return *it;
            }
        }
        return nlohmann::json::object();
    }
    if (!payload.empty() && payload.front() == '{') {
        auto parsed = nlohmann::json::parse(payload, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return parsed;
        }
    }
    return nlohmann::json::object();
}

IpcRequest parseRequest(std::string_view raw) {
    IpcRequest request;
    request.raw = std::string(raw);
    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        auto parsed = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
        if (parsed.is_discarded()) {
            request.parseError = "malformed JSON request";
            return request;
        }
        if (parsed.is_object()) {
            auto cmd = parsed.find("cmd");
            if (cmd != parsed.end() && cmd->is_string()) {
                request.command = upperCase(cmd->get<std::string>());
            }
        }
        request.json = std::move(parsed);
        return request;
    }

    std::string_view text = cutAtNul(raw);
    auto colon = text.find(':');
    request.command = upperCase(text.substr(0, colon));
    if (colon != std::string_view::npos) {
        request.payload = std::string(text.substr(colon + 1));
    }
    return request;
}

std::string buildOkResponse(const IpcRequest& request, const nlohmann::json& data,
                            const std::string& message) {
    if (!request.isJson) {
        if (!data.is_null() && !data.empty()) {
            return "OK:" + data.dump();
        }
        return message.empty() ? std::string("OK") : "OK:" + message;
    }
    nlohmann::json reply = {{"status", "ok"}};
    if (!message.empty()) {
        reply["message"] = message;
    }
    if (!data.is_null()) {
        reply["data"] = data;
    }
    return reply.dump();
}

std::string buildErrorResponse(const IpcRequest& request, CastEngine::ErrorCode code,
                               const std::string& message) {
    const char* codeName = CastEngine::errorCodeToString(code);
    if (!request.isJson) {
        return std::string("ERR:") + codeName + ":" + message;
    }
    nlohmann::json reply = {{"status", "error"}, {"error_code", codeName}, {"message", message}};
    return reply.dump();
}

bool isErrorResponse(const IpcRequest& request, const std::string& response) {
    if (!request.isJson) {
        return response.starts_with("ERR:");
    }
    auto parsed = nlohmann::json::parse(response, nullptr, false);
    return parsed.is_object() && parsed.value("status", "") == "error";
}

IpcEvent makeEvent(const nlohmann::json& payload) {
    IpcEvent event;
    auto type = payload.is_object() ? payload.find("type") : payload.end();
    event.topic = (type != payload.end() && type->is_string()) ? type->get<std::string>() : "event";
    event.body = payload.dump();
    return event;
}

std::string derivePubEndpoint(const std::string& endpoint) {
    constexpr std::string_view kTcp = "tcp://";
    if (endpoint.starts_with(kTcp)) {
        auto colon = endpoint.rfind(':');
        if (colon != std::string::npos && colon >= kTcp.size()) {
            const char* first = endpoint.data() + colon + 1;
            const char* last = endpoint.data() + endpoint.size();
            int port = 0;
            auto [ptr, ec] = std::from_chars(first, last, port);
            if (ec == std::errc() && ptr == last && port > 0 && port < 65535) {
                return endpoint.substr(0, colon + 1) + std::to_string(port + 1);
            }
        }
    }
    return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace daemon_ipc
