#pragma once

#include "core/clock.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace devices {

enum class ProtocolKind { Dlna, Transcreen };

enum class ConnectionStatus { Disconnected, Connecting, Connected, Error };

enum class PlaybackState { Idle, Playing, Paused, Buffering };

enum class UserControlMode { Auto, User };

struct UserControl {
    UserControlMode mode = UserControlMode::Auto;
    std::optional<castgrid::Timestamp> expiresAt;  // nullopt while mode == User: held until released
    std::optional<std::string> reason;

    // True while autonomous reconciliation must leave the device alone
    bool isHolding(castgrid::Timestamp now) const {
        return mode == UserControlMode::User && (!expiresAt || *expiresAt > now);
    }
};

struct Device {
    std::string id;
    std::string friendlyName;
    std::string hostname;
    uint16_t port = 0;
    std::string controlUrl;  // AVTransport control URL (DLNA); unused for Transcreen
    std::string location;    // SSDP description URL, empty for configured devices
    std::string manufacturer;
    std::string modelName;
    std::string udn;

    ProtocolKind protocol = ProtocolKind::Dlna;
    // Provenance only ("ssdp", "config", ...). Not required to agree with protocol.
    std::string discoveryMethod;

    ConnectionStatus connectionStatus = ConnectionStatus::Disconnected;
    std::optional<castgrid::Timestamp> connectionChangedAt;
    std::optional<castgrid::Timestamp> lastDiscoveredAt;
    bool pinned = false;  // configured devices are not aged out by missed discovery cycles

    PlaybackState playbackState = PlaybackState::Idle;
    std::optional<std::string> currentSessionId;
    UserControl userControl;

    std::string group;
    std::string zone;
};

const char* protocolKindToString(ProtocolKind kind);
std::optional<ProtocolKind> parseProtocolKind(const std::string& str);

const char* connectionStatusToString(ConnectionStatus status);
const char* playbackStateToString(PlaybackState state);
const char* userControlModeToString(UserControlMode mode);
std::optional<UserControlMode> parseUserControlMode(const std::string& str);

// disconnected -> connecting -> connected -> {disconnected, error}; error -> disconnected
bool isValidTransition(ConnectionStatus from, ConnectionStatus to);

nlohmann::json userControlToJson(const UserControl& control);
nlohmann::json deviceToJson(const Device& device);

}  // namespace devices
