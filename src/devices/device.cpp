#include "devices/device.h"

#include <algorithm>
#include <cctype>

namespace devices {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

nlohmann::json optionalTime(const std::optional<castgrid::Timestamp>& ts) {
    if (!ts) {
        return nullptr;
    }
    return castgrid::toUnixMillis(*ts);
}

}  // namespace

const char* protocolKindToString(ProtocolKind kind) {
    switch (kind) {
    case ProtocolKind::Transcreen:
        return "transcreen";
    case ProtocolKind::Dlna:
    default:
        return "dlna";
    }
}

std::optional<ProtocolKind> parseProtocolKind(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "dlna" || lower == "upnp") {
        return ProtocolKind::Dlna;
    }
    if (lower == "transcreen") {
        return ProtocolKind::Transcreen;
    }
    return std::nullopt;
}

const char* connectionStatusToString(ConnectionStatus status) {
    switch (status) {
    case ConnectionStatus::Connecting:
        return "connecting";
    case ConnectionStatus::Connected:
        return "connected";
    case ConnectionStatus::Error:
        return "error";
    case ConnectionStatus::Disconnected:
    default:
        return "disconnected";
    }
}

const char* playbackStateToString(PlaybackState state) {
    switch (state) {
    case PlaybackState::Playing:
        return "playing";
    case PlaybackState::Paused:
        return "paused";
    case PlaybackState::Buffering:
        return "buffering";
    case PlaybackState::Idle:
    default:
        return "idle";
    }
}

const char* userControlModeToString(UserControlMode mode) {
    return mode == UserControlMode::User ? "user" : "auto";
}

std::optional<UserControlMode> parseUserControlMode(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "auto") {
        return UserControlMode::Auto;
    }
    // "manual" is the older name for the same mode
    if (lower == "user" || lower == "manual") {
        return UserControlMode::User;
    }
    return std::nullopt;
}

bool isValidTransition(ConnectionStatus from, ConnectionStatus to) {
    switch (from) {
    case ConnectionStatus::Disconnected:
        return to == ConnectionStatus::Connecting;
    case ConnectionStatus::Connecting:
        return to == ConnectionStatus::Connected;
    case ConnectionStatus::Connected:
        return to == ConnectionStatus::Disconnected || to == ConnectionStatus::Error;
    case ConnectionStatus::Error:
        return to == ConnectionStatus::Disconnected;
    }
    return false;
}

nlohmann::json userControlToJson(const UserControl& control) {
    nlohmann::json j;
    j["mode"] = userControlModeToString(control.mode);
    j["expires_at"] = optionalTime(control.expiresAt);
    j["reason"] = control.reason ? nlohmann::json(*control.reason) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json deviceToJson(const Device& device) {
    nlohmann::json j;
    j["id"] = device.id;
    j["friendly_name"] = device.friendlyName;
    j["hostname"] = device.hostname;
    j["port"] = device.port;
    j["control_url"] = device.controlUrl;
    j["location"] = device.location;
    j["manufacturer"] = device.manufacturer;
    j["model_name"] = device.modelName;
    j["protocol_kind"] = protocolKindToString(device.protocol);
    j["discovery_method"] = device.discoveryMethod;
    j["connection_status"] = connectionStatusToString(device.connectionStatus);
    j["last_discovered_at"] = optionalTime(device.lastDiscoveredAt);
    j["pinned"] = device.pinned;
    j["playback_state"] = playbackStateToString(device.playbackState);
    j["current_session"] =
        device.currentSessionId ? nlohmann::json(*device.currentSessionId) : nlohmann::json(nullptr);
    j["user_control"] = userControlToJson(device.userControl);
    if (!device.group.empty()) {
        j["group"] = device.group;
    }
    if (!device.zone.empty()) {
        j["zone"] = device.zone;
    }
    return j;
}

}  // namespace devices
